#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace webhunter {

// Process-wide run flag. Every suspension point (poll sleep, backoff sleep,
// HTTP transfer) consults it so that shutdown is observed promptly.
class AppState {
public:
    AppState() : running_(true) {}

    AppState(const AppState&) = delete;
    AppState& operator=(const AppState&) = delete;

    void shutdown();
    bool is_running() const { return running_; }

    // Sleeps for up to `duration`. Returns false if shutdown was requested
    // before or during the wait.
    bool wait_for(std::chrono::milliseconds duration);

private:
    std::atomic<bool> running_;
    std::mutex mutex_;
    std::condition_variable cv_;
};

} // namespace webhunter
