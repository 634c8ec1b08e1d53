#include "x11_error.hpp"

#include <iostream>

namespace umbra {

X11ErrorTrap *X11ErrorTrap::active = nullptr;

int X11ErrorTrap::record(Display *, XErrorEvent *error) {
    X11ErrorTrap *trap = active;
    if (trap && !trap->pending) {
        trap->pending = true;
        trap->errorCode = error->error_code;
        trap->requestCode = error->request_code;
    }
    return 0;
}

X11ErrorTrap::~X11ErrorTrap() {
    restore();
}

void X11ErrorTrap::install() {
    if (active == this) {
        return;
    }
    pending = false;
    previous = XSetErrorHandler(&X11ErrorTrap::record);
    active = this;
}

void X11ErrorTrap::restore() {
    if (active != this) {
        return;
    }
    XSetErrorHandler(previous);
    previous = nullptr;
    active = nullptr;
}

void X11ErrorTrap::release(Display *dpy) {
    if (dpy && active == this) {
        check(dpy, "teardown");
    }
    restore();
}

bool X11ErrorTrap::check(Display *dpy, const char *what) {
    XSync(dpy, False);
    if (!pending) {
        return true;
    }
    char text[256] = {};
    XGetErrorText(dpy, errorCode, text, sizeof(text));
    std::cerr << "umbra: X error during " << what << ": " << text << " (request " << static_cast<int>(requestCode)
              << ")" << std::endl;
    pending = false;
    return false;
}

}  // namespace umbra
