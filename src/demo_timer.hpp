#pragma once

#include <chrono>
#include <condition_variable>
#include <future>
#include <mutex>
#include <thread>

namespace umbra {

// Background one-shot timer used as a liveness fallback in demo setups.
// The lock loop polls expired() between events; it never blocks on it.
class DemoTimer {
public:
    explicit DemoTimer(std::chrono::seconds after);
    ~DemoTimer();

    DemoTimer(const DemoTimer &) = delete;
    DemoTimer &operator=(const DemoTimer &) = delete;

    bool expired() const;

private:
    std::promise<void> fired;
    std::future<void> firedFuture;
    std::mutex mutex;
    std::condition_variable cond;
    bool cancelled{false};
    std::thread worker;
};

}  // namespace umbra
