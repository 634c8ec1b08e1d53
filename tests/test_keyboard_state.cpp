#include "fake_keymap.hpp"
#include "keyboard.hpp"

#include <X11/keysym.h>

#include <cassert>
#include <memory>

using umbra::KeyboardState;
using umbra::KeyDirection;
using umbra::ModifierState;
using umbra::TrackingMode;

static KeyboardState makeState(ModifierState initial = ModifierState(), TrackingMode mode = TrackingMode::Tracked) {
    return KeyboardState(std::make_unique<fake::FakeKeyMap>(), initial, mode);
}

static void press(KeyboardState &kb, unsigned int code) {
    kb.update(code, KeyDirection::Press);
}

static void release(KeyboardState &kb, unsigned int code) {
    kb.update(code, KeyDirection::Release);
}

static void testConstructionDropsTransientMods() {
    ModifierState initial;
    initial.depressed = ShiftMask | ControlMask;
    initial.latched = ShiftMask;
    initial.locked = LockMask;
    KeyboardState kb = makeState(initial);
    assert(kb.modifiers().depressed == 0);
    assert(kb.modifiers().latched == 0);
    assert(kb.modifiers().locked == LockMask);
    assert(kb.keycodeToSymbol(fake::kA) == XK_A);
}

static void testShiftIsHeldOnlyWhileDepressed() {
    KeyboardState kb = makeState();
    assert(kb.keycodeToSymbol(fake::kA) == XK_a);
    press(kb, fake::kShiftL);
    assert(kb.keycodeToSymbol(fake::kA) == XK_A);
    assert(kb.keycodeToSymbol(fake::kOne) == XK_exclam);
    release(kb, fake::kShiftL);
    assert(kb.keycodeToSymbol(fake::kA) == XK_a);
    assert(kb.modifiers().depressed == 0);
}

static void testBothShiftKeys() {
    KeyboardState kb = makeState();
    press(kb, fake::kShiftL);
    press(kb, fake::kShiftR);
    release(kb, fake::kShiftL);
    assert(kb.keycodeToSymbol(fake::kH) == XK_H);
    release(kb, fake::kShiftR);
    assert(kb.keycodeToSymbol(fake::kH) == XK_h);
}

static void testStrayReleaseIsIgnored() {
    // Shift went down before the lock engaged; only its release reaches us.
    KeyboardState kb = makeState();
    release(kb, fake::kShiftL);
    assert(kb.modifiers().depressed == 0);
    assert(kb.keycodeToSymbol(fake::kA) == XK_a);
}

static void testCapsLockToggles() {
    KeyboardState kb = makeState();
    press(kb, fake::kCapsLock);
    release(kb, fake::kCapsLock);
    assert(kb.modifiers().locked == LockMask);
    assert(kb.modifiers().depressed == 0);
    assert(kb.keycodeToSymbol(fake::kA) == XK_A);
    assert(kb.keycodeToSymbol(fake::kOne) == XK_1);

    press(kb, fake::kShiftL);
    assert(kb.keycodeToSymbol(fake::kA) == XK_a);
    release(kb, fake::kShiftL);

    press(kb, fake::kCapsLock);
    // A repeated press without a release must not toggle again.
    press(kb, fake::kCapsLock);
    release(kb, fake::kCapsLock);
    assert(kb.modifiers().locked == 0);
    assert(kb.keycodeToSymbol(fake::kA) == XK_a);
}

static void testNumLockTracksItsOwnBit() {
    KeyboardState kb = makeState();
    press(kb, fake::kNumLock);
    release(kb, fake::kNumLock);
    assert(kb.modifiers().locked == Mod2Mask);
    assert(kb.keycodeToSymbol(fake::kA) == XK_a);
}

static void testResetKeepsLocks() {
    KeyboardState kb = makeState();
    press(kb, fake::kCapsLock);
    release(kb, fake::kCapsLock);
    press(kb, fake::kShiftL);
    assert(kb.modifiers().depressed == ShiftMask);
    kb.resetTransientMods();
    assert(kb.modifiers().depressed == 0);
    assert(kb.modifiers().locked == LockMask);
    // The shift release that follows is stale and changes nothing.
    release(kb, fake::kShiftL);
    assert(kb.keycodeToSymbol(fake::kA) == XK_A);
}

static void testPressOnlyIgnoresHeldModifiers() {
    KeyboardState kb = makeState(ModifierState(), TrackingMode::PressOnly);
    assert(kb.trackingMode() == TrackingMode::PressOnly);
    press(kb, fake::kShiftL);
    assert(kb.modifiers().depressed == 0);
    assert(kb.keycodeToSymbol(fake::kA) == XK_a);
    press(kb, fake::kCapsLock);
    assert(kb.modifiers().locked == LockMask);
    press(kb, fake::kCapsLock);
    assert(kb.modifiers().locked == 0);
}

static void testKeysymToCodepoint() {
    assert(umbra::keysymToCodepoint(XK_a) == U'a');
    assert(umbra::keysymToCodepoint(XK_space) == U' ');
    assert(umbra::keysymToCodepoint(XK_udiaeresis) == U'ü');
    assert(umbra::keysymToCodepoint(0x100263a) == U'☺');
    assert(umbra::keysymToCodepoint(XK_KP_5) == U'5');
    assert(umbra::keysymToCodepoint(XK_KP_Add) == U'+');
    assert(!umbra::keysymToCodepoint(XK_F1));
    assert(!umbra::keysymToCodepoint(XK_Return));
    assert(!umbra::keysymToCodepoint(NoSymbol));
    assert(!umbra::keysymToCodepoint(0x1000008));
}

static void testKeysymsBeyondLatin1() {
    assert(umbra::keysymToCodepoint(XK_EuroSign) == U'\u20ac');
    assert(umbra::keysymToCodepoint(XK_aogonek) == U'\u0105');
    assert(umbra::keysymToCodepoint(XK_Cyrillic_a) == U'\u0430');
    assert(umbra::keysymToCodepoint(XK_Greek_lambda) == U'\u03bb');
    assert(!umbra::keysymToCodepoint(XK_Delete));
}

static void testLockedGroupSelectsLayout() {
    ModifierState initial;
    initial.group = 1;
    KeyboardState kb = makeState(initial);
    assert(kb.modifiers().group == 1);
    assert(kb.keycodeToSymbol(fake::kA) == XK_Cyrillic_ef);
    press(kb, fake::kShiftL);
    assert(kb.keycodeToSymbol(fake::kA) == XK_Cyrillic_EF);
    release(kb, fake::kShiftL);
    // Transient reset keeps the locked group.
    kb.resetTransientMods();
    assert(kb.keycodeToSymbol(fake::kA) == XK_Cyrillic_ef);
    assert(kb.keycodeToSymbol(fake::kH) == XK_h);
}

static void testGroupKeyCyclesLayouts() {
    KeyboardState kb = makeState();
    assert(kb.keycodeToSymbol(fake::kA) == XK_a);
    press(kb, fake::kNextGroup);
    release(kb, fake::kNextGroup);
    assert(kb.modifiers().group == 1);
    assert(kb.keycodeToSymbol(fake::kA) == XK_Cyrillic_ef);
    press(kb, fake::kNextGroup);
    assert(kb.modifiers().group == 0);
    assert(kb.keycodeToSymbol(fake::kA) == XK_a);
}

static void testLockKeys() {
    assert(umbra::isLockKey(XK_Caps_Lock));
    assert(umbra::isLockKey(XK_Shift_Lock));
    assert(umbra::isLockKey(XK_Num_Lock));
    assert(!umbra::isLockKey(XK_Shift_L));
}

int main() {
    testConstructionDropsTransientMods();
    testShiftIsHeldOnlyWhileDepressed();
    testBothShiftKeys();
    testStrayReleaseIsIgnored();
    testCapsLockToggles();
    testNumLockTracksItsOwnBit();
    testResetKeepsLocks();
    testPressOnlyIgnoresHeldModifiers();
    testKeysymToCodepoint();
    testKeysymsBeyondLatin1();
    testLockedGroupSelectsLayout();
    testGroupKeyCyclesLayouts();
    testLockKeys();
    return 0;
}
