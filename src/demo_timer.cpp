#include "demo_timer.hpp"

namespace umbra {

DemoTimer::DemoTimer(std::chrono::seconds after) : firedFuture(fired.get_future()) {
    worker = std::thread([this, after]() {
        std::unique_lock<std::mutex> lock(mutex);
        if (!cond.wait_for(lock, after, [this]() { return cancelled; })) {
            fired.set_value();
        }
    });
}

DemoTimer::~DemoTimer() {
    {
        std::lock_guard<std::mutex> lock(mutex);
        cancelled = true;
    }
    cond.notify_one();
    if (worker.joinable()) {
        worker.join();
    }
}

bool DemoTimer::expired() const {
    return firedFuture.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
}

}  // namespace umbra
