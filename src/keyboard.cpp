#include "keyboard.hpp"

#include <X11/Xutil.h>
#include <X11/keysym.h>
#include <xkbcommon/xkbcommon.h>

#include <algorithm>
#include <cstdint>
#include <iostream>

namespace umbra {

KeyboardState::KeyboardState(std::unique_ptr<KeyMap> keymap, ModifierState initial, TrackingMode mode)
    : keymap(std::move(keymap)), state(initial), mode(mode) {
    // Keys held while the lock engaged must not leak into the first attempt.
    resetTransientMods();
}

void KeyboardState::update(unsigned int keycode, KeyDirection direction) {
    if (keycode >= held.size()) {
        return;
    }
    if (direction == KeyDirection::Release && mode == TrackingMode::PressOnly) {
        return;
    }
    if (direction == KeyDirection::Press && switchGroup(keymap->translate(keycode, state.coreState()))) {
        return;
    }

    const unsigned int bits = keymap->modifierBits(keycode);
    if (bits == 0) {
        return;
    }

    if (isLockKey(keymap->translate(keycode, 0))) {
        if (direction == KeyDirection::Press && !held[keycode]) {
            state.locked ^= bits;
        }
        if (mode == TrackingMode::Tracked) {
            held[keycode] = direction == KeyDirection::Press;
        }
        return;
    }

    if (mode == TrackingMode::PressOnly) {
        return;
    }
    if (direction == KeyDirection::Press) {
        held[keycode] = true;
    } else if (held[keycode]) {
        held[keycode] = false;
    } else {
        // Release of a key pressed before we started tracking.
        return;
    }
    state.depressed = heldBits();
}

KeySym KeyboardState::keycodeToSymbol(unsigned int keycode) const {
    return keymap->translate(keycode, state.coreState());
}

void KeyboardState::resetTransientMods() {
    held.fill(false);
    state.depressed = 0;
    state.latched = 0;
}

bool KeyboardState::switchGroup(KeySym sym) {
    const unsigned int count = std::max(1u, std::min(keymap->groupCount(), 4u));
    switch (sym) {
        case XK_ISO_Next_Group:
            state.group = (state.group + 1) % count;
            return true;
        case XK_ISO_Prev_Group:
            state.group = (state.group + count - 1) % count;
            return true;
        case XK_ISO_First_Group:
            state.group = 0;
            return true;
        case XK_ISO_Last_Group:
            state.group = count - 1;
            return true;
        default:
            return false;
    }
}

unsigned int KeyboardState::heldBits() const {
    unsigned int bits = 0;
    for (size_t code = 0; code < held.size(); ++code) {
        if (held[code] && !isLockKey(keymap->translate(static_cast<unsigned int>(code), 0))) {
            bits |= keymap->modifierBits(static_cast<unsigned int>(code));
        }
    }
    return bits;
}

std::unique_ptr<XkbKeyMap> XkbKeyMap::fromDisplay(Display *dpy) {
    int opcode = 0;
    int eventBase = 0;
    int errorBase = 0;
    int major = XkbMajorVersion;
    int minor = XkbMinorVersion;
    if (!XkbQueryExtension(dpy, &opcode, &eventBase, &errorBase, &major, &minor)) {
        std::cerr << "umbra: XKB extension is not available" << std::endl;
        return nullptr;
    }
    XkbDescPtr desc = XkbGetMap(dpy, XkbAllClientInfoMask, XkbUseCoreKbd);
    if (!desc) {
        std::cerr << "umbra: unable to read the keyboard mapping" << std::endl;
        return nullptr;
    }
    return std::unique_ptr<XkbKeyMap>(new XkbKeyMap(desc));
}

XkbKeyMap::~XkbKeyMap() {
    if (desc) {
        XkbFreeKeyboard(desc, XkbAllComponentsMask, True);
    }
}

KeySym XkbKeyMap::translate(unsigned int keycode, unsigned int coreState) const {
    if (keycode < desc->min_key_code || keycode > desc->max_key_code) {
        return NoSymbol;
    }
    unsigned int consumed = 0;
    KeySym sym = NoSymbol;
    if (!XkbTranslateKeyCode(desc, static_cast<KeyCode>(keycode), coreState, &consumed, &sym)) {
        return NoSymbol;
    }
    // Caps lock on a key type that does not consume Lock still capitalizes.
    if ((coreState & LockMask) && !(consumed & LockMask)) {
        KeySym lower = NoSymbol;
        KeySym upper = NoSymbol;
        XConvertCase(sym, &lower, &upper);
        sym = upper;
    }
    return sym;
}

unsigned int XkbKeyMap::groupCount() const {
    unsigned int groups = 1;
    for (unsigned int code = desc->min_key_code; code <= desc->max_key_code; ++code) {
        groups = std::max(groups, static_cast<unsigned int>(XkbKeyNumGroups(desc, code)));
    }
    return groups;
}

unsigned int XkbKeyMap::modifierBits(unsigned int keycode) const {
    if (!desc->map || !desc->map->modmap) {
        return 0;
    }
    if (keycode < desc->min_key_code || keycode > desc->max_key_code) {
        return 0;
    }
    return desc->map->modmap[keycode];
}

std::optional<ModifierState> queryModifierState(Display *dpy) {
    XkbStateRec live{};
    if (XkbGetState(dpy, XkbUseCoreKbd, &live) != Success) {
        return std::nullopt;
    }
    ModifierState state;
    state.depressed = live.base_mods;
    state.latched = live.latched_mods;
    state.locked = live.locked_mods;
    state.group = live.locked_group;
    return state;
}

bool isLockKey(KeySym sym) {
    return sym == XK_Caps_Lock || sym == XK_Shift_Lock || sym == XK_Num_Lock;
}

std::optional<char32_t> keysymToCodepoint(KeySym sym) {
    // Covers the legacy Latin-n, Cyrillic, Greek, keypad and 0x01xxxxxx ranges.
    const uint32_t cp = xkb_keysym_to_utf32(static_cast<xkb_keysym_t>(sym));
    if (cp < 0x20 || (cp >= 0x7f && cp < 0xa0)) {
        return std::nullopt;
    }
    return static_cast<char32_t>(cp);
}

}  // namespace umbra
