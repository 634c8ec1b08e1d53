#pragma once

#include <string>

#include "authenticator.hpp"
#include "config.hpp"

namespace umbra {

// Delegates the check to the host PAM stack, one conversation per attempt.
class PamAuthenticator : public Authenticator {
public:
    explicit PamAuthenticator(std::string account, std::string service = kPamService);

    AuthVerdict verify(const std::string &text) override;
    // Opens and closes a PAM transaction for the account without prompting.
    bool ready() override;

private:
    std::string account;
    std::string service;
};

}  // namespace umbra
