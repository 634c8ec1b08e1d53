#include "feedback.hpp"

#include <thread>

namespace umbra {

Feedback::Feedback(FeedbackSink &sink, std::chrono::milliseconds hold, Sleeper sleeper)
    : sink(sink), hold(hold), sleeper(std::move(sleeper)) {
    if (!this->sleeper) {
        this->sleeper = [](std::chrono::milliseconds duration) { std::this_thread::sleep_for(duration); };
    }
}

void Feedback::typing() {
    if (current == FeedbackState::Typing || current == FeedbackState::Accepted) {
        return;
    }
    enter(FeedbackState::Typing);
}

void Feedback::idle() {
    if (current == FeedbackState::Accepted) {
        return;
    }
    enter(FeedbackState::Idle);
}

void Feedback::succeed() {
    enter(FeedbackState::Accepted);
    sleeper(hold);
}

void Feedback::fail() {
    if (current == FeedbackState::Accepted) {
        return;
    }
    enter(FeedbackState::Rejected);
    sleeper(hold);
    enter(FeedbackState::Idle);
}

void Feedback::repaint() {
    sink.show(current);
}

void Feedback::enter(FeedbackState next) {
    current = next;
    sink.show(current);
}

}  // namespace umbra
