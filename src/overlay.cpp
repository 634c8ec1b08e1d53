#include "overlay.hpp"

#include <X11/Xutil.h>

#include <algorithm>
#include <cstring>
#include <iostream>

namespace umbra {

namespace {

size_t paletteIndex(FeedbackState state) {
    switch (state) {
        case FeedbackState::Idle:
            return 0;
        case FeedbackState::Typing:
            return 1;
        case FeedbackState::Accepted:
            return 2;
        case FeedbackState::Rejected:
            return 3;
    }
    return 0;
}

const char *stateName(FeedbackState state) {
    switch (state) {
        case FeedbackState::Idle:
            return "idle";
        case FeedbackState::Typing:
            return "typing";
        case FeedbackState::Accepted:
            return "accepted";
        case FeedbackState::Rejected:
            return "rejected";
    }
    return "unknown";
}

}  // namespace

Overlay::Overlay(Display *dpy, int screen)
    : dpy(dpy),
      screen(screen),
      root(RootWindow(dpy, screen)),
      surfaceWidth(static_cast<unsigned int>(std::max(0, DisplayWidth(dpy, screen)))),
      surfaceHeight(static_cast<unsigned int>(std::max(0, DisplayHeight(dpy, screen)))) {}

void Overlay::allocatePalette(FeedbackStyle style) {
    const unsigned long black = BlackPixel(dpy, screen);
    for (auto &entry : palette) {
        entry.pixel = black;
        entry.allocated = false;
    }
    if (style == FeedbackStyle::Plain) {
        return;
    }

    const FeedbackState states[] = {FeedbackState::Typing, FeedbackState::Accepted, FeedbackState::Rejected};
    const Rgb colors[] = {kTypingColor, kSuccessColor, kFailureColor};
    Colormap colormap = DefaultColormap(dpy, screen);
    for (size_t i = 0; i < 3; ++i) {
        XColor color{};
        color.red = colors[i].red;
        color.green = colors[i].green;
        color.blue = colors[i].blue;
        color.flags = DoRed | DoGreen | DoBlue;
        PaletteEntry &entry = palette[paletteIndex(states[i])];
        if (XAllocColor(dpy, colormap, &color)) {
            entry.pixel = color.pixel;
            entry.allocated = true;
        } else {
            std::cerr << "umbra: warning: unable to allocate " << stateName(states[i])
                      << " color, using default" << std::endl;
            entry.pixel = states[i] == FeedbackState::Typing ? WhitePixel(dpy, screen) : black;
        }
    }
}

bool Overlay::createCursor() {
    static char data[] = {0};
    Pixmap blank = XCreateBitmapFromData(dpy, root, data, 1, 1);
    if (blank == None) {
        return false;
    }
    XColor dummy;
    std::memset(&dummy, 0, sizeof(dummy));
    invisible = XCreatePixmapCursor(dpy, blank, blank, &dummy, &dummy, 0, 0);
    XFreePixmap(dpy, blank);
    return invisible != None;
}

bool Overlay::createSurface() {
    if (surfaceWidth == 0 || surfaceHeight == 0) {
        std::cerr << "umbra: screen " << screen << " has no usable size" << std::endl;
        return false;
    }

    XSetWindowAttributes attrs{};
    attrs.override_redirect = True;
    attrs.background_pixel = palette[paletteIndex(FeedbackState::Idle)].pixel;
    attrs.event_mask = KeyPressMask | KeyReleaseMask | ExposureMask;

    win = XCreateWindow(
        dpy,
        root,
        0,
        0,
        surfaceWidth,
        surfaceHeight,
        0,
        CopyFromParent,
        InputOutput,
        CopyFromParent,
        CWOverrideRedirect | CWBackPixel | CWEventMask,
        &attrs);
    if (!win) {
        return false;
    }
    if (invisible != None) {
        XDefineCursor(dpy, win, invisible);
    }
    XStoreName(dpy, win, "umbra");
    return true;
}

bool Overlay::createContext() {
    gc = XCreateGC(dpy, win, 0, nullptr);
    if (!gc) {
        return false;
    }
    XSetForeground(dpy, gc, palette[paletteIndex(FeedbackState::Idle)].pixel);
    return true;
}

void Overlay::map() {
    XMapRaised(dpy, win);
}

void Overlay::waitForExpose() {
    // Painting before the first Expose can lose the race with the compositor.
    XEvent ev;
    do {
        XWindowEvent(dpy, win, ExposureMask, &ev);
    } while (ev.type != Expose);
}

void Overlay::freePalette() {
    Colormap colormap = DefaultColormap(dpy, screen);
    for (auto &entry : palette) {
        if (entry.allocated) {
            XFreeColors(dpy, colormap, &entry.pixel, 1, 0);
            entry.allocated = false;
        }
    }
}

void Overlay::freeCursor() {
    if (invisible != None) {
        XFreeCursor(dpy, invisible);
        invisible = None;
    }
}

void Overlay::destroySurface() {
    if (win) {
        XDestroyWindow(dpy, win);
        win = None;
    }
}

void Overlay::freeContext() {
    if (gc) {
        XFreeGC(dpy, gc);
        gc = nullptr;
    }
}

void Overlay::setColor(unsigned long pixel) {
    if (!win || !gc) {
        return;
    }
    XSetForeground(dpy, gc, pixel);
    XFillRectangle(dpy, win, gc, 0, 0, surfaceWidth, surfaceHeight);
    XFlush(dpy);
}

void Overlay::show(FeedbackState state) {
    setColor(palette[paletteIndex(state)].pixel);
}

}  // namespace umbra
