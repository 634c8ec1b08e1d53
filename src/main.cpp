#include <csignal>
#include <exception>
#include <functional>
#include <iostream>
#include <memory>
#include <string>

#include "authenticator.hpp"
#include "demo_timer.hpp"
#include "session.hpp"
#include "settings.hpp"
#include "vt_guard.hpp"
#ifdef UMBRA_USE_PAM
#include "pam_authenticator.hpp"
#endif

namespace {

constexpr int kExitUnlocked = 0;
constexpr int kExitFailure = 1;
constexpr int kExitTimedOut = 2;

std::unique_ptr<umbra::Authenticator> makeAuthenticator(const std::string &account) {
#ifdef UMBRA_USE_PAM
    auto backend = std::make_unique<umbra::PamAuthenticator>(account);
#else
    auto backend = std::make_unique<umbra::ShadowAuthenticator>(umbra::shadowHashLookup(account));
#endif
    auto authenticator = umbra::requireReady(std::move(backend));
    if (!authenticator) {
        std::cerr << "umbra: cannot verify a password for " << account
                  << ", refusing to lock (check the PAM service or shadow database access)" << std::endl;
    }
    return authenticator;
}

int runLocker() {
    const umbra::Settings settings = umbra::loadSettings();

    const auto account = umbra::resolveAccountName();
    if (!account) {
        std::cerr << "umbra: unable to determine the account to unlock" << std::endl;
        return kExitFailure;
    }
    std::unique_ptr<umbra::Authenticator> authenticator = makeAuthenticator(*account);
    if (!authenticator) {
        return kExitFailure;
    }

    std::signal(SIGINT, SIG_IGN);
    std::signal(SIGTERM, SIG_IGN);
    std::signal(SIGHUP, SIG_IGN);

    umbra::VTSwitchGuard vtGuard;
    if (settings.vtLock) {
        if (vtGuard.lock()) {
            std::cerr << "umbra: VT switching locked" << std::endl;
        } else {
            std::cerr << "umbra: warning: unable to lock VT switching" << std::endl;
        }
    }

    umbra::SessionOptions options;
    options.feedback = settings.feedback;
    std::unique_ptr<umbra::Session> session = umbra::Session::lock(options);
    if (!session) {
        return kExitFailure;
    }
    std::cerr << "umbra: locked" << std::endl;

    std::unique_ptr<umbra::DemoTimer> timer;
    std::function<bool()> expired;
    if (settings.demoTimeout) {
        std::cerr << "umbra: warning: demo timeout armed, unlocking after "
                  << settings.demoTimeout->count() << "s" << std::endl;
        timer = std::make_unique<umbra::DemoTimer>(*settings.demoTimeout);
        expired = [&timer]() { return timer->expired(); };
    }

    const umbra::LoopResult result = session->run(*authenticator, expired);
    session->unlock();

    switch (result) {
        case umbra::LoopResult::Unlocked:
            return kExitUnlocked;
        case umbra::LoopResult::TimedOut:
            std::cerr << "umbra: demo timeout reached" << std::endl;
            return kExitTimedOut;
        case umbra::LoopResult::InputLost:
            std::cerr << "umbra: lost the input source" << std::endl;
            return kExitFailure;
    }
    return kExitFailure;
}

}  // namespace

int main() {
    std::cerr << "umbra: started" << std::endl;
    int status = kExitFailure;
    try {
        status = runLocker();
    } catch (const std::exception &e) {
        std::cerr << "umbra: fatal: " << e.what() << std::endl;
        status = kExitFailure;
    }
    std::cerr << "umbra: stopped" << std::endl;
    return status;
}
