#include "feedback.hpp"
#include "recording_sink.hpp"

#include <cassert>
#include <chrono>
#include <vector>

using umbra::Feedback;
using umbra::FeedbackState;

static void testTypingPaintsOnce() {
    RecordingSink sink;
    Feedback feedback(sink, std::chrono::milliseconds(500), sink.sleeper());
    assert(feedback.state() == FeedbackState::Idle);
    feedback.typing();
    feedback.typing();
    assert(feedback.state() == FeedbackState::Typing);
    assert(sink.shown == std::vector<FeedbackState>{FeedbackState::Typing});
}

static void testFailureHoldsThenReturnsToIdle() {
    RecordingSink sink;
    Feedback feedback(sink, std::chrono::milliseconds(500), sink.sleeper());
    feedback.typing();
    feedback.fail();
    assert(feedback.state() == FeedbackState::Idle);
    const std::vector<FeedbackState> expected{FeedbackState::Typing, FeedbackState::Rejected, FeedbackState::Idle};
    assert(sink.shown == expected);
    assert(sink.holds.size() == 1);
    assert(sink.holds[0] == std::chrono::milliseconds(500));
}

static void testSuccessIsTerminal() {
    RecordingSink sink;
    Feedback feedback(sink, std::chrono::milliseconds(250), sink.sleeper());
    feedback.typing();
    feedback.succeed();
    assert(feedback.state() == FeedbackState::Accepted);
    assert(sink.holds.size() == 1 && sink.holds[0] == std::chrono::milliseconds(250));
    feedback.idle();
    feedback.typing();
    feedback.fail();
    assert(feedback.state() == FeedbackState::Accepted);
    assert(sink.shown.back() == FeedbackState::Accepted);
    assert(sink.holds.size() == 1);
}

static void testEscapeReturnsToIdle() {
    RecordingSink sink;
    Feedback feedback(sink, std::chrono::milliseconds(500), sink.sleeper());
    feedback.typing();
    feedback.idle();
    assert(feedback.state() == FeedbackState::Idle);
    assert(sink.shown.back() == FeedbackState::Idle);
    assert(sink.holds.empty());
}

static void testRepaintShowsCurrentState() {
    RecordingSink sink;
    Feedback feedback(sink, std::chrono::milliseconds(500), sink.sleeper());
    feedback.repaint();
    feedback.typing();
    feedback.repaint();
    const std::vector<FeedbackState> expected{FeedbackState::Idle, FeedbackState::Typing, FeedbackState::Typing};
    assert(sink.shown == expected);
}

static void testDefaultHold() {
    RecordingSink sink;
    Feedback feedback(sink, umbra::kFeedbackHold, sink.sleeper());
    feedback.fail();
    assert(sink.holds.size() == 1 && sink.holds[0] == std::chrono::milliseconds(500));
}

int main() {
    testTypingPaintsOnce();
    testFailureHoldsThenReturnsToIdle();
    testSuccessIsTerminal();
    testEscapeReturnsToIdle();
    testRepaintShowsCurrentState();
    testDefaultHold();
    return 0;
}
