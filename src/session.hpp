#pragma once
/*
 * Session
 *
 * Owns the display connection and every resource acquired for the lock.
 * Construction is staged: each completed stage registers its release on the
 * teardown stack, so a failure half way through (or the final unlock) frees
 * exactly what was acquired, newest first.
 */
#include <X11/Xlib.h>

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "authenticator.hpp"
#include "config.hpp"
#include "feedback.hpp"
#include "grab.hpp"
#include "keyboard.hpp"
#include "lock_loop.hpp"
#include "overlay.hpp"
#include "teardown.hpp"
#include "x11_error.hpp"

namespace umbra {

struct SessionOptions {
    FeedbackStyle feedback{FeedbackStyle::Colored};
#if UMBRA_TRACKING == UMBRA_TRACKING_PRESS_ONLY
    TrackingMode tracking{TrackingMode::PressOnly};
#else
    TrackingMode tracking{TrackingMode::Tracked};
#endif
};

// Reads key and expose events from the overlay. With an expiry check
// installed it polls the connection instead of blocking indefinitely.
class XEventSource : public EventSource {
public:
    XEventSource(Display *dpy, std::function<bool()> expired = {});

    std::optional<InputEvent> next() override;

private:
    Display *dpy;
    std::function<bool()> expired;
};

// One acquisition step. A failing acquire cleans up after itself; release
// undoes a successful one and runs at most once.
struct SessionStage {
    std::string name;
    std::function<bool()> acquire;
    std::function<void()> release;
};

class Session {
public:
    // Connects, shows the overlay and grabs input. Returns nullptr (with
    // everything acquired so far released) if any stage fails.
    static std::unique_ptr<Session> lock(const SessionOptions &options = SessionOptions());
    // Same staging over caller-supplied steps, acquired in order.
    static std::unique_ptr<Session> fromStages(std::vector<SessionStage> stages);
    ~Session();

    Session(const Session &) = delete;
    Session &operator=(const Session &) = delete;

    // Runs until the credential is accepted, the expiry check fires or the
    // input source fails. Does not release anything itself.
    LoopResult run(Authenticator &authenticator, std::function<bool()> expired = {});

    // Releases grabs, surface, cursor and connection. Idempotent.
    void unlock();

    bool locked() const { return grabs && grabs->held(); }

private:
    Session() = default;
    bool assemble(std::vector<SessionStage> stages);
    std::vector<SessionStage> displayStages(const SessionOptions &options);

    Display *dpy{nullptr};
    int screen{0};
    X11ErrorTrap errorTrap;
    std::unique_ptr<Overlay> overlay;
    std::unique_ptr<KeyboardState> keyboard;
    std::unique_ptr<GrabController> grabs;
    TeardownStack teardown;
};

}  // namespace umbra
