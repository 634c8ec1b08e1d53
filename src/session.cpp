#include "session.hpp"

#include <poll.h>

#include <cerrno>
#include <iostream>

namespace umbra {

XEventSource::XEventSource(Display *dpy, std::function<bool()> expired)
    : dpy(dpy), expired(std::move(expired)) {}

std::optional<InputEvent> XEventSource::next() {
    while (true) {
        if (expired && XPending(dpy) == 0) {
            if (expired()) {
                InputEvent timeout;
                timeout.kind = InputEvent::Kind::Timeout;
                return timeout;
            }
            pollfd pfd{};
            pfd.fd = ConnectionNumber(dpy);
            pfd.events = POLLIN;
            int ret = poll(&pfd, 1, static_cast<int>(kTimeoutPollInterval.count()));
            if (ret < 0 && errno != EINTR) {
                std::cerr << "umbra: polling the display connection failed" << std::endl;
                return std::nullopt;
            }
            continue;
        }

        XEvent ev;
        XNextEvent(dpy, &ev);
        InputEvent event;
        switch (ev.type) {
            case KeyPress:
            case KeyRelease:
                event.kind = InputEvent::Kind::Key;
                event.keycode = ev.xkey.keycode;
                event.direction = ev.type == KeyPress ? KeyDirection::Press : KeyDirection::Release;
                return event;
            case Expose:
                if (ev.xexpose.count != 0) {
                    continue;
                }
                event.kind = InputEvent::Kind::Redraw;
                return event;
            default:
                continue;
        }
    }
}

std::unique_ptr<Session> Session::lock(const SessionOptions &options) {
    std::unique_ptr<Session> session(new Session());
    if (!session->assemble(session->displayStages(options))) {
        return nullptr;
    }
    return session;
}

std::unique_ptr<Session> Session::fromStages(std::vector<SessionStage> stages) {
    std::unique_ptr<Session> session(new Session());
    if (!session->assemble(std::move(stages))) {
        return nullptr;
    }
    return session;
}

Session::~Session() {
    unlock();
}

bool Session::assemble(std::vector<SessionStage> stages) {
    for (SessionStage &stage : stages) {
        if (stage.acquire && !stage.acquire()) {
            std::cerr << "umbra: " << stage.name << " setup failed, releasing " << teardown.depth()
                      << " acquired stage(s)" << std::endl;
            teardown.unwind();
            return false;
        }
        teardown.push(stage.name, std::move(stage.release));
    }
    return true;
}

std::vector<SessionStage> Session::displayStages(const SessionOptions &options) {
    std::vector<SessionStage> stages;

    stages.push_back({"display",
                      [this]() {
                          dpy = XOpenDisplay(nullptr);
                          if (!dpy) {
                              std::cerr << "umbra: cannot open display" << std::endl;
                              return false;
                          }
                          screen = DefaultScreen(dpy);
                          return true;
                      },
                      [this]() {
                          XCloseDisplay(dpy);
                          dpy = nullptr;
                      }});

    stages.push_back({"error handler",
                      [this]() {
                          errorTrap.install();
                          return true;
                      },
                      [this]() { errorTrap.release(dpy); }});

    stages.push_back({"palette",
                      [this, options]() {
                          overlay = std::make_unique<Overlay>(dpy, screen);
                          overlay->allocatePalette(options.feedback);
                          return true;
                      },
                      [this]() { overlay->freePalette(); }});

    stages.push_back({"cursor",
                      [this]() {
                          if (!overlay->createCursor() || !errorTrap.check(dpy, "cursor creation")) {
                              overlay->freeCursor();
                              return false;
                          }
                          return true;
                      },
                      [this]() { overlay->freeCursor(); }});

    stages.push_back({"surface",
                      [this]() {
                          if (!overlay->createSurface() || !errorTrap.check(dpy, "window creation")) {
                              overlay->destroySurface();
                              return false;
                          }
                          return true;
                      },
                      [this]() { overlay->destroySurface(); }});

    stages.push_back({"graphics context",
                      [this]() {
                          if (!overlay->createContext() || !errorTrap.check(dpy, "graphics context creation")) {
                              overlay->freeContext();
                              return false;
                          }
                          return true;
                      },
                      [this]() { overlay->freeContext(); }});

    // Unmapping happens when the surface is destroyed.
    stages.push_back({"window mapping",
                      [this]() {
                          overlay->map();
                          if (!errorTrap.check(dpy, "window mapping")) {
                              return false;
                          }
                          overlay->waitForExpose();
                          overlay->show(FeedbackState::Idle);
                          return true;
                      },
                      {}});

    stages.push_back({"keyboard",
                      [this, options]() {
                          std::unique_ptr<XkbKeyMap> keymap = XkbKeyMap::fromDisplay(dpy);
                          if (!keymap) {
                              return false;
                          }
                          ModifierState live;
                          if (auto state = queryModifierState(dpy)) {
                              live = *state;
                          } else {
                              std::cerr << "umbra: warning: unable to read modifier state, assuming no locks"
                                        << std::endl;
                          }
                          keyboard = std::make_unique<KeyboardState>(std::move(keymap), live, options.tracking);
                          return true;
                      },
                      [this]() { keyboard.reset(); }});

    stages.push_back({"input grab",
                      [this]() {
                          grabs = std::make_unique<GrabController>(dpy, overlay->window(), overlay->cursor());
                          if (!grabs->acquire()) {
                              std::cerr << "umbra: unable to capture all input, aborting lock" << std::endl;
                              return false;
                          }
                          if (!errorTrap.check(dpy, "input grab")) {
                              grabs->release();
                              return false;
                          }
                          XFlush(dpy);
                          return true;
                      },
                      [this]() { grabs->release(); }});

    return stages;
}

LoopResult Session::run(Authenticator &authenticator, std::function<bool()> expired) {
    if (!locked()) {
        std::cerr << "umbra: session is not locked" << std::endl;
        return LoopResult::InputLost;
    }
    Feedback feedback(*overlay);
    feedback.idle();
    XEventSource events(dpy, std::move(expired));
    LockLoop loop(*keyboard, authenticator, feedback);
    return loop.run(events);
}

void Session::unlock() {
    teardown.unwind();
}

}  // namespace umbra
