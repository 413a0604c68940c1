#include "source_worker.hpp"
#include "app_state.hpp"
#include "../utils/logger.hpp"
#include <chrono>
#include <unordered_set>

namespace webhunter {

namespace {

class CycleTimer {
public:
    explicit CycleTimer(CycleReport& report)
        : report_(report), start_(std::chrono::steady_clock::now()) {}
    ~CycleTimer() {
        report_.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_);
    }

private:
    CycleReport& report_;
    std::chrono::steady_clock::time_point start_;
};

} // namespace

SourceWorker::SourceWorker(SourceAdapter& adapter,
                           SeenStore& store,
                           NotificationDispatcher& dispatcher,
                           const AppState* app_state)
    : adapter_(adapter), store_(store), dispatcher_(dispatcher), app_state_(app_state) {}

void SourceWorker::set_state_observer(StateObserver observer) {
    observer_ = std::move(observer);
}

void SourceWorker::publish(SourceState state) const {
    if (observer_) {
        observer_(state);
    }
}

bool SourceWorker::stop_requested() const {
    return app_state_ != nullptr && !app_state_->is_running();
}

bool SourceWorker::fetch_candidates(const SourceConfig& config, std::vector<Listing>& candidates,
                                    CycleReport& report) {
    publish(SourceState::FETCHING);
    try {
        candidates = adapter_.fetch(config);
    } catch (const FetchError& e) {
        report.fetch_failed = 1;
        report.fetch_error = std::string(e.is_transient() ? "transient: " : "permanent: ") + e.what();
        return false;
    } catch (const std::exception& e) {
        report.fetch_failed = 1;
        report.fetch_error = std::string("adapter fault: ") + e.what();
        return false;
    }
    report.fetched = candidates.size();
    return true;
}

std::vector<Listing> SourceWorker::select_new(const SourceConfig& config, std::vector<Listing>& candidates) const {
    std::vector<Listing> fresh;
    std::unordered_set<std::string> queued;

    for (auto& candidate : candidates) {
        // Identity is always namespaced by the configured source
        candidate.source_id = config.name;
        if (candidate.listing_id.empty()) {
            LOG_DEBUG("Ignoring candidate without listing id from {}", config.name);
            continue;
        }
        if (store_.has_seen(candidate.source_id, candidate.listing_id)) {
            continue;
        }
        if (!queued.insert(candidate.listing_id).second) {
            continue;
        }
        fresh.push_back(candidate);
    }
    return fresh;
}

CycleReport SourceWorker::run_cycle(const SourceConfig& config) {
    CycleReport report;
    report.source_id = config.name;
    CycleTimer timer(report);

    Status flushed = store_.flush_pending();
    if (flushed.is_error()) {
        LOG_WARNING("Queued seen-marks still not persisted: {}", flushed.error().message);
    }

    std::vector<Listing> candidates;
    if (!fetch_candidates(config, candidates, report)) {
        publish(SourceState::IDLE);
        return report;
    }

    publish(SourceState::DIFFING);
    std::vector<Listing> fresh = select_new(config, candidates);
    report.new_listings = fresh.size();

    publish(SourceState::DELIVERING);
    for (size_t i = 0; i < fresh.size(); ++i) {
        if (stop_requested()) {
            report.cancelled += fresh.size() - i;
            break;
        }

        const Listing& listing = fresh[i];
        DeliveryOutcome outcome = dispatcher_.deliver(listing);
        if (outcome.cancelled()) {
            // Not recorded: the listing is still new on the next run
            report.cancelled += fresh.size() - i;
            break;
        }

        SeenStatus status = SeenStatus::DELIVERED;
        if (outcome.delivered()) {
            ++report.delivered;
        } else {
            status = SeenStatus::ABANDONED;
            ++report.abandoned;
        }

        Status marked = store_.mark_seen(listing.source_id, listing.listing_id, status);
        if (marked.is_error()) {
            ++report.store_failed;
        }
    }

    publish(SourceState::IDLE);
    return report;
}

CycleReport SourceWorker::seed(const SourceConfig& config) {
    CycleReport report;
    report.source_id = config.name;
    CycleTimer timer(report);

    std::vector<Listing> candidates;
    if (!fetch_candidates(config, candidates, report)) {
        publish(SourceState::IDLE);
        return report;
    }

    publish(SourceState::DIFFING);
    std::vector<Listing> fresh = select_new(config, candidates);
    report.new_listings = fresh.size();

    for (const auto& listing : fresh) {
        Status marked = store_.mark_seen(listing.source_id, listing.listing_id, SeenStatus::SEEDED);
        if (marked.is_error()) {
            ++report.store_failed;
        }
    }

    publish(SourceState::IDLE);
    return report;
}

} // namespace webhunter
