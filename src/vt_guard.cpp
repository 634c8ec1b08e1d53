#include "vt_guard.hpp"

#include <fcntl.h>
#include <linux/vt.h>
#include <sys/ioctl.h>
#include <unistd.h>

namespace umbra {

VTSwitchGuard::~VTSwitchGuard() {
    unlock();
}

bool VTSwitchGuard::lock() {
#ifdef VT_LOCKSWITCH
    if (isLocked) {
        return true;
    }
    const char *paths[] = {"/dev/tty0", "/dev/console", "/dev/tty"};
    for (const char *path : paths) {
        fd = open(path, O_RDWR | O_CLOEXEC);
        if (fd >= 0) {
            break;
        }
    }
    if (fd < 0) {
        return false;
    }
    if (ioctl(fd, VT_LOCKSWITCH, 1) == 0) {
        isLocked = true;
        return true;
    }
    close(fd);
    fd = -1;
#endif
    return false;
}

void VTSwitchGuard::unlock() {
#ifdef VT_LOCKSWITCH
    if (fd >= 0) {
        if (isLocked) {
            ioctl(fd, VT_UNLOCKSWITCH, 1);
            isLocked = false;
        }
        close(fd);
        fd = -1;
    }
#endif
}

}  // namespace umbra
