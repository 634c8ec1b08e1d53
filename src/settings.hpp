#pragma once

#include <chrono>
#include <optional>

#include "feedback.hpp"

namespace umbra {

// Process-level switches read from the environment at startup.
struct Settings {
    std::optional<std::chrono::seconds> demoTimeout;
    bool vtLock{true};
    FeedbackStyle feedback{FeedbackStyle::Colored};
};

// Reads UMBRA_DEMO_TIMEOUT, UMBRA_VT_LOCK and UMBRA_FEEDBACK. Values that do
// not parse are reported and left at their defaults.
Settings loadSettings();

// Whole-string base-10 parse; signs, blanks and overflow are rejected.
std::optional<unsigned long> parseUnsigned(const char *value);

}  // namespace umbra
