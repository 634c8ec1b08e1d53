#include "grab.hpp"

#include <iostream>

namespace umbra {

namespace {

const char *grabStatusText(int status) {
    switch (status) {
        case AlreadyGrabbed:
            return "already grabbed by another client";
        case GrabInvalidTime:
            return "invalid time";
        case GrabNotViewable:
            return "window not viewable";
        case GrabFrozen:
            return "frozen by another grab";
        default:
            return "unknown status";
    }
}

}  // namespace

GrabController::GrabController(Display *dpy, Window surface, Cursor cursor)
    : dpy(dpy), surface(surface), cursor(cursor) {}

bool GrabController::acquire() {
    int status = XGrabPointer(dpy, surface, False, ButtonPressMask | ButtonReleaseMask | PointerMotionMask,
                              GrabModeAsync, GrabModeAsync, surface, cursor, CurrentTime);
    if (status != GrabSuccess) {
        std::cerr << "umbra: unable to grab pointer: " << grabStatusText(status) << std::endl;
        return false;
    }
    pointerGrabbed = true;

    status = XGrabKeyboard(dpy, surface, False, GrabModeAsync, GrabModeAsync, CurrentTime);
    if (status != GrabSuccess) {
        std::cerr << "umbra: unable to grab keyboard: " << grabStatusText(status) << std::endl;
        release();
        return false;
    }
    keyboardGrabbed = true;
    return true;
}

void GrabController::release() {
    XUngrabKeyboard(dpy, CurrentTime);
    XUngrabPointer(dpy, CurrentTime);
    XFlush(dpy);
    keyboardGrabbed = false;
    pointerGrabbed = false;
}

}  // namespace umbra
