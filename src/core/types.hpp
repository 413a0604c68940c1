#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace webhunter {

struct Listing {
    std::string source_id;
    std::string listing_id;
    std::string url;
    std::string title;
    std::string price;
    std::chrono::system_clock::time_point observed_at;
};

enum class SeenStatus {
    DELIVERED,
    ABANDONED,
    // Recorded by a reseed run, never notified
    SEEDED
};

const char* to_string(SeenStatus status);
std::optional<SeenStatus> parse_seen_status(const std::string& value);

struct SeenRecord {
    std::string source_id;
    std::string listing_id;
    SeenStatus status;
    std::chrono::system_clock::time_point seen_at;
};

enum class SendOutcome {
    OK,
    TRANSIENT,
    REJECTED,
    // Aborted by shutdown; says nothing about the provider
    CANCELLED
};

const char* to_string(SendOutcome outcome);

struct SendResult {
    SendOutcome outcome;
    long status_code;
    std::string detail;

    bool is_ok() const { return outcome == SendOutcome::OK; }
    bool is_transient() const { return outcome == SendOutcome::TRANSIENT; }
    bool is_rejected() const { return outcome == SendOutcome::REJECTED; }
    bool is_cancelled() const { return outcome == SendOutcome::CANCELLED; }
};

struct NotificationAttempt {
    int attempt;
    std::chrono::system_clock::time_point attempted_at;
    SendOutcome outcome;
    std::string detail;
};

enum class DeliveryStatus {
    DELIVERED,
    ABANDONED,
    // Shutdown interrupted the retry sequence; nothing is recorded
    CANCELLED
};

struct DeliveryOutcome {
    DeliveryStatus status;
    std::string reason;
    std::vector<NotificationAttempt> attempts;

    bool delivered() const { return status == DeliveryStatus::DELIVERED; }
    bool abandoned() const { return status == DeliveryStatus::ABANDONED; }
    bool cancelled() const { return status == DeliveryStatus::CANCELLED; }
};

struct CycleReport {
    std::string source_id;
    size_t fetched = 0;
    size_t new_listings = 0;
    size_t delivered = 0;
    size_t abandoned = 0;
    size_t fetch_failed = 0;
    size_t store_failed = 0;
    size_t cancelled = 0;
    std::string fetch_error;
    std::chrono::milliseconds duration{0};

    std::string to_string() const;
};

enum class SourceState {
    IDLE,
    FETCHING,
    DIFFING,
    DELIVERING,
    STOPPING,
    STOPPED
};

const char* to_string(SourceState state);

} // namespace webhunter
