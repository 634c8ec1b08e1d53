#include "lock_loop.hpp"

#include <X11/Xutil.h>
#include <X11/keysym.h>

namespace umbra {

KeyAction classifyKey(KeySym sym) {
    switch (sym) {
        case XK_Return:
        case XK_KP_Enter:
        case XK_ISO_Enter:
            return KeyAction::Submit;
        case XK_Escape:
            return KeyAction::Clear;
        case XK_BackSpace:
            return KeyAction::Erase;
        default:
            break;
    }
    if (sym != NoSymbol && IsModifierKey(sym)) {
        return KeyAction::Modifier;
    }
    if (keysymToCodepoint(sym)) {
        return KeyAction::Character;
    }
    return KeyAction::Unresolvable;
}

LockLoop::LockLoop(KeyboardState &keyboard, Authenticator &authenticator, Feedback &feedback,
                   std::size_t capacity)
    : keyboard(keyboard), authenticator(authenticator), feedback(feedback), credential(capacity) {}

LoopResult LockLoop::run(EventSource &events) {
    while (true) {
        std::optional<InputEvent> event = events.next();
        if (!event) {
            credential.clear();
            return LoopResult::InputLost;
        }
        switch (event->kind) {
            case InputEvent::Kind::Timeout:
                credential.clear();
                return LoopResult::TimedOut;
            case InputEvent::Kind::Redraw:
                feedback.repaint();
                break;
            case InputEvent::Kind::Key:
                if (event->direction == KeyDirection::Release) {
                    keyboard.update(event->keycode, KeyDirection::Release);
                    break;
                }
                if (handleKeyPress(event->keycode)) {
                    return LoopResult::Unlocked;
                }
                break;
        }
    }
}

bool LockLoop::handleKeyPress(unsigned int keycode) {
    keyboard.update(keycode, KeyDirection::Press);
    const KeySym sym = keyboard.keycodeToSymbol(keycode);

    switch (classifyKey(sym)) {
        case KeyAction::Submit:
            return submit();
        case KeyAction::Clear:
            credential.clear();
            feedback.idle();
            return false;
        case KeyAction::Erase:
            credential.pop();
            if (credential.empty()) {
                feedback.idle();
            }
            return false;
        case KeyAction::Modifier:
            return false;
        case KeyAction::Character:
            append(*keysymToCodepoint(sym));
            return false;
        case KeyAction::Unresolvable:
            rejectAttempt();
            return false;
    }
    return false;
}

bool LockLoop::submit() {
    if (credential.empty()) {
        return false;
    }
    std::optional<std::string> text = credential.materialize();
    credential.clear();
    if (!text) {
        feedback.fail();
        return false;
    }

    const AuthVerdict verdict = authenticator.verify(*text);
    secureErase(*text);
    if (verdict == AuthVerdict::Correct) {
        feedback.succeed();
        return true;
    }
    feedback.fail();
    return false;
}

void LockLoop::append(char32_t ch) {
    if (credential.size() >= credential.capacity()) {
        // Overflow counts as a failed attempt; the new character starts a fresh one.
        credential.push(ch);
        feedback.fail();
        feedback.typing();
        return;
    }
    const bool wasEmpty = credential.empty();
    credential.push(ch);
    if (wasEmpty) {
        feedback.typing();
    }
}

void LockLoop::rejectAttempt() {
    credential.clear();
    feedback.fail();
}

}  // namespace umbra
