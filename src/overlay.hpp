#pragma once
/*
 * Overlay
 *
 * Full-screen, borderless, override-redirect window that hides the desktop
 * while locked, plus the invisible pointer glyph and the fill context used
 * to paint feedback colors. Each create step has a matching release so the
 * session can tear down exactly what it built.
 */
#include <X11/Xlib.h>

#include <array>

#include "feedback.hpp"

namespace umbra {

class Overlay : public FeedbackSink {
public:
    Overlay(Display *dpy, int screen);

    Overlay(const Overlay &) = delete;
    Overlay &operator=(const Overlay &) = delete;

    // Colors that cannot be allocated fall back to black or white.
    void allocatePalette(FeedbackStyle style);
    bool createCursor();
    bool createSurface();
    bool createContext();
    void map();
    // Blocks until the server reports the mapped surface exposed.
    void waitForExpose();

    void freePalette();
    void freeCursor();
    void destroySurface();
    void freeContext();

    void setColor(unsigned long pixel);
    void show(FeedbackState state) override;

    Window window() const { return win; }
    Cursor cursor() const { return invisible; }
    unsigned int width() const { return surfaceWidth; }
    unsigned int height() const { return surfaceHeight; }

private:
    struct PaletteEntry {
        unsigned long pixel{0};
        bool allocated{false};
    };

    Display *dpy;
    int screen;
    Window root;
    unsigned int surfaceWidth{0};
    unsigned int surfaceHeight{0};
    std::array<PaletteEntry, 4> palette{};
    Window win{None};
    Cursor invisible{None};
    GC gc{nullptr};
};

}  // namespace umbra
