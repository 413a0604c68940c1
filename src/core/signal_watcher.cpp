#include "signal_watcher.hpp"
#include "app_state.hpp"
#include "../utils/logger.hpp"
#include <csignal>

namespace webhunter {

namespace {

volatile std::sig_atomic_t g_pending_signal = 0;

void record_signal(int signal) {
    g_pending_signal = signal;
    std::signal(signal, SIG_DFL);
}

const char* signal_name(int signal) {
    switch (signal) {
        case SIGINT: return "SIGINT";
        case SIGTERM: return "SIGTERM";
        default: return "signal";
    }
}

} // namespace

SignalWatcher::SignalWatcher(AppState& app_state, std::chrono::milliseconds poll_interval)
    : app_state_(app_state)
    , poll_interval_(poll_interval) {
    g_pending_signal = 0;
    previous_int_ = std::signal(SIGINT, record_signal);
    previous_term_ = std::signal(SIGTERM, record_signal);
    thread_ = std::thread(&SignalWatcher::run, this);
}

SignalWatcher::~SignalWatcher() {
    stop();
}

void SignalWatcher::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopped_) {
            return;
        }
        stopped_ = true;
    }
    cv_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
    if (previous_int_ != SIG_ERR) {
        std::signal(SIGINT, previous_int_);
    }
    if (previous_term_ != SIG_ERR) {
        std::signal(SIGTERM, previous_term_);
    }
}

void SignalWatcher::run() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stopped_) {
        int signal = g_pending_signal;
        if (signal != 0) {
            received_signal_ = signal;
            lock.unlock();
            LOG_INFO("{} received, shutting down", signal_name(signal));
            app_state_.shutdown();
            return;
        }
        cv_.wait_for(lock, poll_interval_, [this] { return stopped_; });
    }
}

} // namespace webhunter
