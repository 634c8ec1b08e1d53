#pragma once
/*
 * LockLoop
 *
 * The authenticate-or-retry cycle: pulls input events, resolves them through
 * the keyboard state, accumulates the credential and drives the feedback.
 * It knows nothing about X; the session feeds it through an EventSource.
 */
#include <X11/Xlib.h>

#include <cstddef>
#include <optional>

#include "authenticator.hpp"
#include "config.hpp"
#include "credential_buffer.hpp"
#include "feedback.hpp"
#include "keyboard.hpp"

namespace umbra {

struct InputEvent {
    enum class Kind {
        Key,
        Redraw,
        Timeout,
    };

    Kind kind{Kind::Key};
    unsigned int keycode{0};
    KeyDirection direction{KeyDirection::Press};
};

class EventSource {
public:
    virtual ~EventSource() = default;
    // Blocks for the next event. nullopt means the source is gone.
    virtual std::optional<InputEvent> next() = 0;
};

enum class KeyAction {
    Submit,
    Clear,
    Erase,
    Modifier,
    Character,
    Unresolvable,
};

KeyAction classifyKey(KeySym sym);

enum class LoopResult {
    Unlocked,
    TimedOut,
    InputLost,
};

class LockLoop {
public:
    LockLoop(KeyboardState &keyboard, Authenticator &authenticator, Feedback &feedback,
             std::size_t capacity = kMaxCredentialLength);

    LoopResult run(EventSource &events);

    const CredentialBuffer &buffer() const { return credential; }

private:
    // Returns true once the credential has been accepted.
    bool handleKeyPress(unsigned int keycode);
    bool submit();
    void append(char32_t ch);
    void rejectAttempt();

    KeyboardState &keyboard;
    Authenticator &authenticator;
    Feedback &feedback;
    CredentialBuffer credential;
};

}  // namespace umbra
