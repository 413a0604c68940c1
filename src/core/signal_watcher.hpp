#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

namespace webhunter {

class AppState;

// Turns SIGINT/SIGTERM into AppState::shutdown(). The handler only records
// the signal; a helper thread polls for it and does the actual shutdown, so
// every wait and transfer in the process is interrupted regardless of what
// the main thread is doing. A second signal gets the default disposition.
// Only one watcher may be installed at a time.
class SignalWatcher {
public:
    explicit SignalWatcher(AppState& app_state,
                           std::chrono::milliseconds poll_interval = std::chrono::milliseconds(100));
    ~SignalWatcher();

    SignalWatcher(const SignalWatcher&) = delete;
    SignalWatcher& operator=(const SignalWatcher&) = delete;

    // Stops polling and restores the previous handlers
    void stop();

    // The signal that triggered shutdown, 0 if none
    int received_signal() const { return received_signal_.load(); }

private:
    using Handler = void (*)(int);

    void run();

    AppState& app_state_;
    std::chrono::milliseconds poll_interval_;
    Handler previous_int_;
    Handler previous_term_;
    std::atomic<int> received_signal_{0};

    bool stopped_ = false;
    std::mutex mutex_;
    std::condition_variable cv_;
    std::thread thread_;
};

} // namespace webhunter
