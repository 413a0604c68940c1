#include "types.hpp"
#include <sstream>

namespace webhunter {

const char* to_string(SeenStatus status) {
    switch (status) {
        case SeenStatus::DELIVERED: return "delivered";
        case SeenStatus::ABANDONED: return "abandoned";
        case SeenStatus::SEEDED: return "seeded";
    }
    return "unknown";
}

std::optional<SeenStatus> parse_seen_status(const std::string& value) {
    if (value == "delivered") {
        return SeenStatus::DELIVERED;
    } else if (value == "abandoned") {
        return SeenStatus::ABANDONED;
    } else if (value == "seeded") {
        return SeenStatus::SEEDED;
    }
    return std::nullopt;
}

const char* to_string(SendOutcome outcome) {
    switch (outcome) {
        case SendOutcome::OK: return "ok";
        case SendOutcome::TRANSIENT: return "transient";
        case SendOutcome::REJECTED: return "rejected";
        case SendOutcome::CANCELLED: return "cancelled";
    }
    return "unknown";
}

const char* to_string(SourceState state) {
    switch (state) {
        case SourceState::IDLE: return "Idle";
        case SourceState::FETCHING: return "Fetching";
        case SourceState::DIFFING: return "Diffing";
        case SourceState::DELIVERING: return "Delivering";
        case SourceState::STOPPING: return "Stopping";
        case SourceState::STOPPED: return "Stopped";
    }
    return "Unknown";
}

std::string CycleReport::to_string() const {
    std::ostringstream oss;
    oss << "source=" << source_id
        << " fetched=" << fetched
        << " new=" << new_listings
        << " delivered=" << delivered
        << " abandoned=" << abandoned
        << " fetch_failed=" << fetch_failed
        << " store_failed=" << store_failed
        << " cancelled=" << cancelled
        << " duration_ms=" << duration.count();
    if (!fetch_error.empty()) {
        oss << " error=\"" << fetch_error << "\"";
    }
    return oss.str();
}

} // namespace webhunter
