#pragma once

/* build-time knobs; the CMake options forward into these macros */

#include <chrono>
#include <cstddef>

#ifndef UMBRA_MAX_CREDENTIAL_LENGTH
#define UMBRA_MAX_CREDENTIAL_LENGTH 256
#endif

#ifndef UMBRA_FEEDBACK_HOLD_MS
#define UMBRA_FEEDBACK_HOLD_MS 500
#endif

#ifndef UMBRA_PAM_SERVICE
#define UMBRA_PAM_SERVICE "login"
#endif

#define UMBRA_TRACKING_TRACKED    1
#define UMBRA_TRACKING_PRESS_ONLY 2

#ifndef UMBRA_TRACKING
#define UMBRA_TRACKING UMBRA_TRACKING_TRACKED
#endif

namespace umbra {

constexpr std::size_t kMaxCredentialLength = UMBRA_MAX_CREDENTIAL_LENGTH;
constexpr std::chrono::milliseconds kFeedbackHold(UMBRA_FEEDBACK_HOLD_MS);
constexpr const char *kPamService = UMBRA_PAM_SERVICE;

// Loop poll interval while a demo timeout is armed.
constexpr std::chrono::milliseconds kTimeoutPollInterval(100);

struct Rgb {
    unsigned short red{0};
    unsigned short green{0};
    unsigned short blue{0};
};

constexpr Rgb kIdleColor{0x0000, 0x0000, 0x0000};
constexpr Rgb kTypingColor{0x1a1a, 0x2b2b, 0x4c4c};
constexpr Rgb kSuccessColor{0x1f1f, 0x7a7a, 0x1f1f};
constexpr Rgb kFailureColor{0x8b8b, 0x1a1a, 0x1a1a};

constexpr const char *kDemoTimeoutEnvVar = "UMBRA_DEMO_TIMEOUT";
constexpr const char *kVtLockEnvVar = "UMBRA_VT_LOCK";
constexpr const char *kFeedbackEnvVar = "UMBRA_FEEDBACK";

}  // namespace umbra
