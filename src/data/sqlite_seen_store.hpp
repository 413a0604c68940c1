#pragma once

#include <chrono>
#include <deque>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include "seen_store.hpp"
#include "../core/retry_policy.hpp"

struct sqlite3;

namespace webhunter {

class SqliteSeenStore : public SeenStore {
public:
    SqliteSeenStore(const std::string& db_path, const RetryPolicy& write_policy);
    ~SqliteSeenStore() override;

    SqliteSeenStore(const SqliteSeenStore&) = delete;
    SqliteSeenStore& operator=(const SqliteSeenStore&) = delete;

    Status load() override;
    void close();

    bool has_seen(const std::string& source_id, const std::string& listing_id) const override;
    Status mark_seen(const std::string& source_id, const std::string& listing_id, SeenStatus status) override;
    Status flush_pending() override;

    std::vector<SeenRecord> get_records(const std::string& source_id) const;
    size_t size() const;
    size_t pending_count() const;

    void set_busy_timeout(std::chrono::milliseconds timeout);
    void set_sleeper(Sleeper sleeper);

private:
    Status open_database();
    Status write_record(const SeenRecord& record);
    Status flush_pending_locked();
    Status fail(ErrorCode code, const std::string& context) const;

    static std::string make_key(const std::string& source_id, const std::string& listing_id);

    std::string db_path_;
    sqlite3* db_;
    RetryPolicy write_policy_;
    Sleeper sleeper_;
    std::chrono::milliseconds busy_timeout_{2000};

    mutable std::shared_mutex index_mutex_;
    std::unordered_map<std::string, SeenRecord> index_;

    // Serializes every access to the connection
    mutable std::mutex write_mutex_;
    std::deque<SeenRecord> pending_;
};

} // namespace webhunter
