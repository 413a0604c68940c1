#include "app_state.hpp"

namespace webhunter {

void AppState::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        running_ = false;
    }
    cv_.notify_all();
}

bool AppState::wait_for(std::chrono::milliseconds duration) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, duration, [this] { return !running_.load(); });
    return running_.load();
}

} // namespace webhunter
