#pragma once

#include <chrono>
#include <functional>

#include "config.hpp"

namespace umbra {

enum class FeedbackState {
    Idle,
    Typing,
    Accepted,
    Rejected,
};

enum class FeedbackStyle {
    Colored,
    Plain,  // every state painted with the idle color
};

// Whatever renders a state, normally the overlay surface.
class FeedbackSink {
public:
    virtual ~FeedbackSink() = default;
    virtual void show(FeedbackState state) = 0;
};

class Feedback {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    explicit Feedback(FeedbackSink &sink, std::chrono::milliseconds hold = kFeedbackHold,
                      Sleeper sleeper = Sleeper());

    FeedbackState state() const { return current; }

    void typing();
    void idle();
    // Accepted is terminal; the caller ends the session afterwards.
    void succeed();
    // Shows Rejected for the hold period, then falls back to Idle.
    void fail();
    void repaint();

private:
    void enter(FeedbackState next);

    FeedbackSink &sink;
    std::chrono::milliseconds hold;
    Sleeper sleeper;
    FeedbackState current{FeedbackState::Idle};
};

}  // namespace umbra
