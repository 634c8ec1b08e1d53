#pragma once

#include <X11/Xlib.h>

namespace umbra {

// Records asynchronous X protocol errors instead of letting Xlib's default
// handler terminate the process. Only one trap may be installed at a time.
class X11ErrorTrap {
public:
    X11ErrorTrap() = default;
    ~X11ErrorTrap();

    X11ErrorTrap(const X11ErrorTrap &) = delete;
    X11ErrorTrap &operator=(const X11ErrorTrap &) = delete;

    void install();
    void restore();

    // Flushes outstanding requests through check() while the trap is still
    // active, then restores the previous handler.
    void release(Display *dpy);

    // Syncs with the server and reports whether the requests issued since
    // the last check succeeded. Logs the error against what on failure.
    bool check(Display *dpy, const char *what);

    bool installed() const { return active == this; }

private:
    static int record(Display *dpy, XErrorEvent *error);
    static X11ErrorTrap *active;

    int (*previous)(Display *, XErrorEvent *){nullptr};
    // First error since the last check; later ones are usually fallout.
    bool pending{false};
    unsigned char errorCode{0};
    unsigned char requestCode{0};
};

}  // namespace umbra
