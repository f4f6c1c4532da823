#include "shutdown.h"
#include "logger.h"

ShutdownController shutdownController;

void ShutdownController::addStep(const char* name, std::function<void()> step) {
    std::lock_guard<std::mutex> lock(mutex);
    steps.push_back(Step{name, step});
}

bool ShutdownController::trigger(const char* reason) {
    requested = true;

    bool expected = false;
    if (!ran.compare_exchange_strong(expected, true)) {
        LOG_DEBUGF("Shutdown already done (%s)", reason);
        return false;
    }

    LOG_WARNF("Shutdown: %s", reason);
    std::lock_guard<std::mutex> lock(mutex);
    for (size_t i = 0; i < steps.size(); i++) {
        LOG_INFOF("Shutdown step %u: %s", (unsigned)(i + 1), steps[i].name);
        steps[i].run();
    }
    LOG_INFO("Shutdown complete - reset the board to resume");
    return true;
}
