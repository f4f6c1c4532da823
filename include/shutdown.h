#ifndef SHUTDOWN_H
#define SHUTDOWN_H

#include <atomic>
#include <functional>
#include <mutex>
#include <vector>

// Cancellation token plus the ordered teardown steps.
// Every task loop polls isRequested(); trigger() runs the steps once, no
// matter how many exit paths (stop button, OTA, fatal startup) call it.
class ShutdownController {
public:
    ShutdownController() : requested(false), ran(false) {}

    // Steps run in the order they were added
    void addStep(const char* name, std::function<void()> step);

    // Request shutdown and run the steps. Returns true only for the call that ran them.
    bool trigger(const char* reason);

    bool isRequested() const { return requested.load(); }
    bool hasRun() const { return ran.load(); }

private:
    struct Step {
        const char* name;
        std::function<void()> run;
    };

    std::mutex mutex;
    std::vector<Step> steps;
    std::atomic<bool> requested;
    std::atomic<bool> ran;
};

extern ShutdownController shutdownController;

#endif // SHUTDOWN_H
