#include "settings.hpp"

#include <charconv>
#include <cstdlib>
#include <cstring>
#include <iostream>

#include "config.hpp"

namespace umbra {

std::optional<unsigned long> parseUnsigned(const char *value) {
    if (!value) {
        return std::nullopt;
    }
    const char *last = value + std::strlen(value);
    unsigned long parsed = 0;
    auto [end, ec] = std::from_chars(value, last, parsed);
    if (ec != std::errc() || end == value || end != last) {
        return std::nullopt;
    }
    return parsed;
}

Settings loadSettings() {
    Settings settings;

    if (const char *env = std::getenv(kDemoTimeoutEnvVar)) {
        auto seconds = parseUnsigned(env);
        if (seconds && *seconds > 0) {
            settings.demoTimeout = std::chrono::seconds(*seconds);
        } else {
            std::cerr << "umbra: warning: ignoring " << kDemoTimeoutEnvVar << "=" << env << std::endl;
        }
    }

    if (const char *env = std::getenv(kVtLockEnvVar)) {
        settings.vtLock = std::strcmp(env, "0") != 0;
    }

    if (const char *env = std::getenv(kFeedbackEnvVar)) {
        if (std::strcmp(env, "plain") == 0) {
            settings.feedback = FeedbackStyle::Plain;
        } else if (std::strcmp(env, "colored") == 0) {
            settings.feedback = FeedbackStyle::Colored;
        } else {
            std::cerr << "umbra: warning: ignoring " << kFeedbackEnvVar << "=" << env << std::endl;
        }
    }

    return settings;
}

}  // namespace umbra
