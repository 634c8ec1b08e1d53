#pragma once
/*
 * Keyboard state
 *
 * Resolves raw keycodes to keysyms under a locally tracked modifier state.
 * The mapping itself sits behind KeyMap so the tracking logic does not need
 * a live X server.
 */
#include <X11/Xlib.h>
#include <X11/XKBlib.h>

#include <array>
#include <memory>
#include <optional>

namespace umbra {

enum class KeyDirection {
    Press,
    Release,
};

enum class TrackingMode {
    Tracked,    // presses and releases both feed modifier state
    PressOnly,  // releases are dropped, held modifiers are never tracked
};

struct ModifierState {
    unsigned int depressed{0};
    unsigned int latched{0};
    unsigned int locked{0};
    unsigned int group{0};  // locked layout group, 0-based

    unsigned int effective() const { return depressed | latched | locked; }
    // Core state word: modifier bits plus the group in bits 13-14.
    unsigned int coreState() const { return XkbBuildCoreState(effective(), group); }
};

class KeyMap {
public:
    virtual ~KeyMap() = default;
    // Keysym produced by keycode under the core state word (modifiers and group).
    virtual KeySym translate(unsigned int keycode, unsigned int coreState) const = 0;
    // Core modifier bits the keycode is bound to (0 for ordinary keys).
    virtual unsigned int modifierBits(unsigned int keycode) const = 0;
    virtual unsigned int groupCount() const { return 1; }
};

class KeyboardState {
public:
    KeyboardState(std::unique_ptr<KeyMap> keymap, ModifierState initial,
                  TrackingMode mode = TrackingMode::Tracked);

    // Feeds one transition. Lock keys toggle on press, group keys switch
    // the layout group, other modifiers count while held.
    void update(unsigned int keycode, KeyDirection direction);
    KeySym keycodeToSymbol(unsigned int keycode) const;
    void resetTransientMods();

    const ModifierState &modifiers() const { return state; }
    TrackingMode trackingMode() const { return mode; }

private:
    unsigned int heldBits() const;
    bool switchGroup(KeySym sym);

    std::unique_ptr<KeyMap> keymap;
    ModifierState state;
    TrackingMode mode;
    std::array<bool, 256> held{};
};

// Live core-keyboard map compiled through the XKB extension.
class XkbKeyMap : public KeyMap {
public:
    static std::unique_ptr<XkbKeyMap> fromDisplay(Display *dpy);
    ~XkbKeyMap() override;

    XkbKeyMap(const XkbKeyMap &) = delete;
    XkbKeyMap &operator=(const XkbKeyMap &) = delete;

    KeySym translate(unsigned int keycode, unsigned int coreState) const override;
    unsigned int modifierBits(unsigned int keycode) const override;
    unsigned int groupCount() const override;

private:
    explicit XkbKeyMap(XkbDescPtr desc) : desc(desc) {}

    XkbDescPtr desc{nullptr};
};

// Current locked/latched/depressed masks and locked group of the core keyboard.
std::optional<ModifierState> queryModifierState(Display *dpy);

bool isLockKey(KeySym sym);

// Character typed by sym, or nullopt for symbols that carry no printable text.
std::optional<char32_t> keysymToCodepoint(KeySym sym);

}  // namespace umbra
