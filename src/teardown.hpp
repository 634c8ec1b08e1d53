#pragma once

#include <functional>
#include <string>
#include <vector>

namespace umbra {

// Release actions for the stages acquired so far. Unwinding runs them in
// reverse order, each one exactly once.
class TeardownStack {
public:
    TeardownStack() = default;
    ~TeardownStack();

    TeardownStack(const TeardownStack &) = delete;
    TeardownStack &operator=(const TeardownStack &) = delete;

    void push(std::string stage, std::function<void()> release);
    void unwind();

    size_t depth() const { return stages.size(); }
    bool empty() const { return stages.empty(); }

private:
    struct Stage {
        std::string name;
        std::function<void()> release;
    };

    std::vector<Stage> stages;
};

}  // namespace umbra
