#include "sqlite_seen_store.hpp"
#include "../utils/logger.hpp"
#include <sqlite3.h>
#include <thread>

namespace webhunter {

namespace {

const char* kCreateTableSql =
    "CREATE TABLE IF NOT EXISTS seen_listings("
    "source_id TEXT NOT NULL,"
    "listing_id TEXT NOT NULL,"
    "status TEXT NOT NULL,"
    "seen_at INTEGER NOT NULL,"
    "PRIMARY KEY (source_id, listing_id));";

const char* kSelectAllSql = "SELECT source_id, listing_id, status, seen_at FROM seen_listings;";

const char* kInsertSql =
    "INSERT OR IGNORE INTO seen_listings (source_id, listing_id, status, seen_at) VALUES (?,?,?,?);";

bool is_corruption(int rc) {
    int primary = rc & 0xff;
    return primary == SQLITE_CORRUPT || primary == SQLITE_NOTADB;
}

long long to_epoch_ms(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

std::string column_string(sqlite3_stmt* stmt, int column) {
    const unsigned char* text = sqlite3_column_text(stmt, column);
    return text ? std::string(reinterpret_cast<const char*>(text)) : std::string();
}

} // namespace

SqliteSeenStore::SqliteSeenStore(const std::string& db_path, const RetryPolicy& write_policy)
    : db_path_(db_path), db_(nullptr), write_policy_(write_policy) {
    sleeper_ = [](std::chrono::milliseconds delay) {
        std::this_thread::sleep_for(delay);
        return true;
    };
}

SqliteSeenStore::~SqliteSeenStore() {
    close();
}

void SqliteSeenStore::close() {
    std::lock_guard<std::mutex> lock(write_mutex_);
    if (!pending_.empty()) {
        LOG_ERROR("Closing seen store with {} unpersisted records", pending_.size());
    }
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

void SqliteSeenStore::set_busy_timeout(std::chrono::milliseconds timeout) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    busy_timeout_ = timeout;
    if (db_) {
        sqlite3_busy_timeout(db_, static_cast<int>(busy_timeout_.count()));
    }
}

void SqliteSeenStore::set_sleeper(Sleeper sleeper) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    sleeper_ = std::move(sleeper);
}

Status SqliteSeenStore::fail(ErrorCode code, const std::string& context) const {
    std::string message = context;
    if (db_) {
        message += ": ";
        message += sqlite3_errmsg(db_);
    }
    LOG_ERROR("Seen store {} ({}): {}", to_string(code), db_path_, message);
    return Status::error(code, message);
}

Status SqliteSeenStore::open_database() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }

    int rc = sqlite3_open_v2(db_path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr);
    if (rc != SQLITE_OK) {
        Status status = fail(is_corruption(rc) ? ErrorCode::CORRUPT_STORE : ErrorCode::STORE_UNAVAILABLE,
                             "Can't open database");
        sqlite3_close(db_);
        db_ = nullptr;
        return status;
    }
    sqlite3_busy_timeout(db_, static_cast<int>(busy_timeout_.count()));

    char* err_msg = nullptr;
    rc = sqlite3_exec(db_, "PRAGMA synchronous=FULL;", nullptr, nullptr, &err_msg);
    if (rc == SQLITE_OK) {
        rc = sqlite3_exec(db_, kCreateTableSql, nullptr, nullptr, &err_msg);
    }
    if (rc != SQLITE_OK) {
        std::string detail = err_msg ? err_msg : "unknown error";
        sqlite3_free(err_msg);
        // A file that is not a database (or a damaged one) can only fail here
        return fail(is_corruption(rc) ? ErrorCode::CORRUPT_STORE : ErrorCode::STORE_UNAVAILABLE,
                    "Schema setup failed (" + detail + ")");
    }

    sqlite3_stmt* stmt = nullptr;
    rc = sqlite3_prepare_v2(db_, "PRAGMA quick_check;", -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return fail(is_corruption(rc) ? ErrorCode::CORRUPT_STORE : ErrorCode::STORE_UNAVAILABLE,
                    "Integrity check failed to start");
    }
    std::string check_result;
    rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) {
        check_result = column_string(stmt, 0);
    }
    sqlite3_finalize(stmt);
    if (check_result != "ok") {
        return fail(ErrorCode::CORRUPT_STORE, "Integrity check reported '" + check_result + "'");
    }

    return ok_status();
}

Status SqliteSeenStore::load() {
    std::lock_guard<std::mutex> lock(write_mutex_);

    Status opened = open_database();
    if (opened.is_error()) {
        return opened;
    }

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, kSelectAllSql, -1, &stmt, nullptr) != SQLITE_OK) {
        // Table exists with an unexpected shape
        return fail(ErrorCode::CORRUPT_STORE, "Failed to read seen_listings");
    }

    std::unordered_map<std::string, SeenRecord> loaded;
    int rc;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        SeenRecord record;
        record.source_id = column_string(stmt, 0);
        record.listing_id = column_string(stmt, 1);
        std::string status_text = column_string(stmt, 2);
        auto status = parse_seen_status(status_text);
        if (record.source_id.empty() || record.listing_id.empty() || !status) {
            sqlite3_finalize(stmt);
            return fail(ErrorCode::CORRUPT_STORE,
                        "Unreadable record (" + record.source_id + ", " + record.listing_id +
                        ", status '" + status_text + "')");
        }
        record.status = *status;
        record.seen_at = std::chrono::system_clock::time_point(
            std::chrono::milliseconds(sqlite3_column_int64(stmt, 3)));
        loaded[make_key(record.source_id, record.listing_id)] = std::move(record);
    }
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return fail(is_corruption(rc) ? ErrorCode::CORRUPT_STORE : ErrorCode::STORE_UNAVAILABLE,
                    "Failed while reading seen_listings");
    }

    size_t count = loaded.size();
    {
        std::unique_lock<std::shared_mutex> index_lock(index_mutex_);
        index_ = std::move(loaded);
    }
    LOG_INFO("Loaded {} seen listings from {}", count, db_path_);
    return ok_status();
}

bool SqliteSeenStore::has_seen(const std::string& source_id, const std::string& listing_id) const {
    std::shared_lock<std::shared_mutex> lock(index_mutex_);
    return index_.count(make_key(source_id, listing_id)) > 0;
}

Status SqliteSeenStore::mark_seen(const std::string& source_id, const std::string& listing_id,
                                  SeenStatus status) {
    if (source_id.empty() || listing_id.empty()) {
        return Status::error(ErrorCode::INVALID_ARGUMENT, "source_id and listing_id must not be empty");
    }

    std::lock_guard<std::mutex> lock(write_mutex_);

    if (!pending_.empty()) {
        Status flushed = flush_pending_locked();
        if (flushed.is_error()) {
            LOG_WARNING("{} seen-marks still waiting to be persisted", pending_.size());
        }
    }

    const std::string key = make_key(source_id, listing_id);
    {
        std::shared_lock<std::shared_mutex> index_lock(index_mutex_);
        auto it = index_.find(key);
        if (it != index_.end()) {
            if (it->second.status != status) {
                LOG_DEBUG("Listing {}/{} already recorded as {}, keeping it", source_id, listing_id,
                          to_string(it->second.status));
            }
            return ok_status();
        }
    }

    SeenRecord record{source_id, listing_id, status, std::chrono::system_clock::now()};

    auto result = retry(
        write_policy_, sleeper_,
        [this, &record](int attempt) {
            if (attempt > 1) {
                LOG_WARNING("Retrying seen-mark for {}/{} (attempt {})", record.source_id, record.listing_id, attempt);
            }
            return write_record(record);
        },
        [](const Status& s) { return s.is_error(); });

    {
        // Recorded in memory either way so the listing is not delivered again by this process
        std::unique_lock<std::shared_mutex> index_lock(index_mutex_);
        index_[key] = record;
    }

    if (result.value.is_error()) {
        pending_.push_back(record);
        LOG_ERROR("Seen-mark for {}/{} not persisted after {} attempts, queued for later",
                  source_id, listing_id, result.attempts);
        return result.value;
    }
    return ok_status();
}

Status SqliteSeenStore::flush_pending() {
    std::lock_guard<std::mutex> lock(write_mutex_);
    return flush_pending_locked();
}

Status SqliteSeenStore::flush_pending_locked() {
    size_t flushed = 0;
    while (!pending_.empty()) {
        Status status = write_record(pending_.front());
        if (status.is_error()) {
            return status;
        }
        pending_.pop_front();
        ++flushed;
    }
    if (flushed > 0) {
        LOG_INFO("Persisted {} previously queued seen-marks", flushed);
    }
    return ok_status();
}

Status SqliteSeenStore::write_record(const SeenRecord& record) {
    if (!db_) {
        return Status::error(ErrorCode::STORE_UNAVAILABLE, "database is not open");
    }

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, kInsertSql, -1, &stmt, nullptr) != SQLITE_OK) {
        return fail(ErrorCode::STORE_UNAVAILABLE, "Failed to prepare statement");
    }

    sqlite3_bind_text(stmt, 1, record.source_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, record.listing_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 3, to_string(record.status), -1, SQLITE_STATIC);
    sqlite3_bind_int64(stmt, 4, to_epoch_ms(record.seen_at));

    // Autocommit: the statement returns only after the journal and database are synced
    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        return fail(ErrorCode::STORE_UNAVAILABLE, "Failed to record seen listing");
    }
    return ok_status();
}

std::vector<SeenRecord> SqliteSeenStore::get_records(const std::string& source_id) const {
    std::vector<SeenRecord> records;
    std::shared_lock<std::shared_mutex> lock(index_mutex_);
    for (const auto& entry : index_) {
        if (entry.second.source_id == source_id) {
            records.push_back(entry.second);
        }
    }
    return records;
}

size_t SqliteSeenStore::size() const {
    std::shared_lock<std::shared_mutex> lock(index_mutex_);
    return index_.size();
}

size_t SqliteSeenStore::pending_count() const {
    std::lock_guard<std::mutex> lock(write_mutex_);
    return pending_.size();
}

std::string SqliteSeenStore::make_key(const std::string& source_id, const std::string& listing_id) {
    std::string key;
    key.reserve(source_id.size() + listing_id.size() + 1);
    key.append(source_id);
    key.push_back('\0');
    key.append(listing_id);
    return key;
}

} // namespace webhunter
