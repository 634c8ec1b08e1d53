#include "teardown.hpp"

#include <exception>
#include <iostream>

namespace umbra {

TeardownStack::~TeardownStack() {
    unwind();
}

void TeardownStack::push(std::string stage, std::function<void()> release) {
    stages.push_back(Stage{std::move(stage), std::move(release)});
}

void TeardownStack::unwind() {
    while (!stages.empty()) {
        Stage stage = std::move(stages.back());
        stages.pop_back();
        if (!stage.release) {
            continue;
        }
        // A failing step must not stop the remaining releases.
        try {
            stage.release();
        } catch (const std::exception &e) {
            std::cerr << "umbra: warning: releasing " << stage.name << " failed: " << e.what() << std::endl;
        }
    }
}

}  // namespace umbra
