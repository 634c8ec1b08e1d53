#pragma once

#include <X11/Xlib.h>

namespace umbra {

// Exclusive keyboard and pointer capture bound to the overlay window.
class GrabController {
public:
    GrabController(Display *dpy, Window surface, Cursor cursor);

    // Grabs the pointer (confined to the surface) and then the keyboard.
    // On failure nothing stays grabbed.
    bool acquire();
    // Ungrabs both devices; safe to call whether or not they are held.
    void release();

    bool held() const { return pointerGrabbed && keyboardGrabbed; }

private:
    Display *dpy;
    Window surface;
    Cursor cursor;
    bool pointerGrabbed{false};
    bool keyboardGrabbed{false};
};

}  // namespace umbra
