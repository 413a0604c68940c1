#include "scheduler.hpp"
#include "../utils/logger.hpp"

namespace webhunter {

Scheduler::Scheduler(SeenStore& store, NotificationDispatcher& dispatcher, AppState& app_state)
    : store_(store), dispatcher_(dispatcher), app_state_(app_state),
      loaded_(false), started_(false) {
    sleeper_ = [this](std::chrono::milliseconds delay) { return app_state_.wait_for(delay); };
}

Scheduler::~Scheduler() {
    stop();
}

void Scheduler::add_source(SourceConfig config, std::unique_ptr<SourceAdapter> adapter) {
    auto slot = std::make_unique<SourceSlot>();
    slot->status.name = config.name;
    slot->config = std::move(config);
    slot->adapter = std::move(adapter);
    slot->worker = std::make_unique<SourceWorker>(*slot->adapter, store_, dispatcher_, &app_state_);

    SourceSlot* raw = slot.get();
    slot->worker->set_state_observer([this, raw](SourceState state) { set_state(*raw, state); });

    slots_.push_back(std::move(slot));
}

void Scheduler::set_sleeper(Sleeper sleeper) {
    sleeper_ = std::move(sleeper);
}

Status Scheduler::load_store() {
    if (loaded_) {
        return ok_status();
    }
    Status loaded = store_.load();
    if (loaded.is_error()) {
        LOG_CRITICAL("Failed to load seen store: {} ({})", loaded.error().message, to_string(loaded.code()));
        return loaded;
    }
    loaded_ = true;
    return loaded;
}

Status Scheduler::start() {
    if (started_) {
        return ok_status();
    }

    Status loaded = load_store();
    if (loaded.is_error()) {
        return loaded;
    }

    started_ = true;
    for (auto& slot : slots_) {
        LOG_INFO("Starting source {} (adapter {}, every {}s + up to {}s jitter)",
                 slot->config.name, slot->config.adapter,
                 slot->config.poll_interval_sec, slot->config.jitter_sec);
        slot->thread = std::thread(&Scheduler::run_source, this, std::ref(*slot));
    }
    return ok_status();
}

void Scheduler::stop() {
    app_state_.shutdown();
    for (auto& slot : slots_) {
        set_state(*slot, SourceState::STOPPING);
    }
    wait();
    for (auto& slot : slots_) {
        set_state(*slot, SourceState::STOPPED);
    }
}

void Scheduler::wait() {
    for (auto& slot : slots_) {
        if (slot->thread.joinable()) {
            slot->thread.join();
        }
    }
}

void Scheduler::run_source(SourceSlot& slot) {
    std::mt19937 rng(std::random_device{}());

    while (app_state_.is_running()) {
        run_guarded(slot, false);

        if (!app_state_.is_running()) {
            break;
        }
        auto delay = next_delay(slot.config, rng);
        LOG_DEBUG("Source {} sleeping {} ms", slot.config.name, delay.count());
        if (!sleeper_(delay)) {
            break;
        }
    }

    set_state(slot, SourceState::STOPPING);
    set_state(slot, SourceState::STOPPED);
    LOG_INFO("Source {} stopped", slot.config.name);
}

std::optional<CycleReport> Scheduler::run_guarded(SourceSlot& slot, bool seed) {
    try {
        CycleReport report = seed ? slot.worker->seed(slot.config) : slot.worker->run_cycle(slot.config);
        record_report(slot, report);
        return report;
    } catch (const std::exception& e) {
        record_fault(slot, e.what());
    } catch (...) {
        // Nothing may escape to the thread boundary
        record_fault(slot, "non-standard exception");
    }
    return std::nullopt;
}

void Scheduler::record_fault(SourceSlot& slot, const std::string& reason) {
    {
        std::lock_guard<std::mutex> lock(slot.mutex);
        ++slot.status.faults;
    }
    LOG_ERROR("Cycle for source {} failed: {}", slot.config.name, reason);
    set_state(slot, SourceState::IDLE);
}

void Scheduler::record_report(SourceSlot& slot, const CycleReport& report) {
    {
        std::lock_guard<std::mutex> lock(slot.mutex);
        ++slot.status.cycles;
        slot.status.last_report = report;
    }

    if (report.fetch_failed > 0 || report.store_failed > 0 || report.abandoned > 0) {
        LOG_WARNING("Cycle {}", report.to_string());
    } else if (report.new_listings > 0) {
        LOG_INFO("Cycle {}", report.to_string());
    } else {
        LOG_DEBUG("Cycle {}", report.to_string());
    }
}

void Scheduler::set_state(SourceSlot& slot, SourceState state) {
    std::lock_guard<std::mutex> lock(slot.mutex);
    SourceState current = slot.status.state;
    if (current == SourceState::STOPPED) {
        return;
    }
    // Once stopping, only the final transition is accepted
    if (current == SourceState::STOPPING && state != SourceState::STOPPED) {
        return;
    }
    slot.status.state = state;
}

std::chrono::milliseconds Scheduler::next_delay(const SourceConfig& config, std::mt19937& rng) {
    std::chrono::milliseconds delay = std::chrono::seconds(config.poll_interval_sec);
    if (config.jitter_sec > 0) {
        std::uniform_int_distribution<long long> jitter(0, static_cast<long long>(config.jitter_sec) * 1000);
        delay += std::chrono::milliseconds(jitter(rng));
    }
    return delay;
}

Result<std::vector<CycleReport>> Scheduler::run_once() {
    Status loaded = load_store();
    if (loaded.is_error()) {
        return Result<std::vector<CycleReport>>::error(loaded.code(), loaded.error().message);
    }

    std::vector<CycleReport> reports;
    for (auto& slot : slots_) {
        if (!app_state_.is_running()) {
            break;
        }
        auto report = run_guarded(*slot, false);
        if (report) {
            reports.push_back(*report);
        }
    }
    return Result<std::vector<CycleReport>>::success(std::move(reports));
}

Result<std::vector<CycleReport>> Scheduler::reseed() {
    Status loaded = load_store();
    if (loaded.is_error()) {
        return Result<std::vector<CycleReport>>::error(loaded.code(), loaded.error().message);
    }

    std::vector<CycleReport> reports;
    for (auto& slot : slots_) {
        if (!app_state_.is_running()) {
            break;
        }
        auto report = run_guarded(*slot, true);
        if (report) {
            LOG_INFO("Seeded {} listings for source {}", report->new_listings - report->store_failed,
                     slot->config.name);
            reports.push_back(*report);
        }
    }
    return Result<std::vector<CycleReport>>::success(std::move(reports));
}

std::vector<SourceStatus> Scheduler::status() const {
    std::vector<SourceStatus> result;
    result.reserve(slots_.size());
    for (const auto& slot : slots_) {
        std::lock_guard<std::mutex> lock(slot->mutex);
        result.push_back(slot->status);
    }
    return result;
}

} // namespace webhunter
