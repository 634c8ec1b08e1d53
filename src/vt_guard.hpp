#pragma once

namespace umbra {

// Blocks switching to another virtual terminal while held. Best effort:
// needs access to the console device and VT_LOCKSWITCH support.
class VTSwitchGuard {
public:
    VTSwitchGuard() = default;
    ~VTSwitchGuard();

    VTSwitchGuard(const VTSwitchGuard &) = delete;
    VTSwitchGuard &operator=(const VTSwitchGuard &) = delete;

    bool lock();
    void unlock();

    bool locked() const { return isLocked; }

private:
    int fd{-1};
    bool isLocked{false};
};

}  // namespace umbra
