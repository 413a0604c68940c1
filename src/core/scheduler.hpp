#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <thread>
#include <vector>
#include "app_state.hpp"
#include "result.hpp"
#include "retry_policy.hpp"
#include "source_worker.hpp"
#include "types.hpp"

namespace webhunter {

struct SourceStatus {
    std::string name;
    SourceState state = SourceState::IDLE;
    uint64_t cycles = 0;
    uint64_t faults = 0;
    std::optional<CycleReport> last_report;
};

class Scheduler {
public:
    Scheduler(SeenStore& store, NotificationDispatcher& dispatcher, AppState& app_state);
    ~Scheduler();

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    // Must be called before start(); sources are polled in registration order
    void add_source(SourceConfig config, std::unique_ptr<SourceAdapter> adapter);

    // Loads the store once. CORRUPT_STORE must stop the process.
    Status load_store();

    // Loads the store, then launches one polling thread per source
    Status start();

    // Signals shutdown and joins every polling thread
    void stop();
    void wait();

    // Single sequential pass over all sources (oneshot mode)
    Result<std::vector<CycleReport>> run_once();

    // Marks everything currently listed as seen without notifying
    Result<std::vector<CycleReport>> reseed();

    std::vector<SourceStatus> status() const;

    // Inter-cycle wait; defaults to AppState::wait_for
    void set_sleeper(Sleeper sleeper);

private:
    struct SourceSlot {
        SourceConfig config;
        std::unique_ptr<SourceAdapter> adapter;
        std::unique_ptr<SourceWorker> worker;
        std::thread thread;

        mutable std::mutex mutex;
        SourceStatus status;
    };

    void run_source(SourceSlot& slot);
    std::optional<CycleReport> run_guarded(SourceSlot& slot, bool seed);
    void record_report(SourceSlot& slot, const CycleReport& report);
    void record_fault(SourceSlot& slot, const std::string& reason);
    void set_state(SourceSlot& slot, SourceState state);
    static std::chrono::milliseconds next_delay(const SourceConfig& config, std::mt19937& rng);

    SeenStore& store_;
    NotificationDispatcher& dispatcher_;
    AppState& app_state_;
    Sleeper sleeper_;

    std::vector<std::unique_ptr<SourceSlot>> slots_;
    bool loaded_;
    bool started_;
};

} // namespace webhunter
