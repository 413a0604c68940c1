#pragma once

#include <string>
#include "../core/result.hpp"
#include "../core/types.hpp"

namespace webhunter {

// Durable record of every (source_id, listing_id) pair that reached a
// terminal notification outcome. Single source of truth for "already notified".
class SeenStore {
public:
    virtual ~SeenStore() = default;

    // Rebuilds the in-memory index from durable storage. CORRUPT_STORE means
    // the process must not start.
    virtual Status load() = 0;

    virtual bool has_seen(const std::string& source_id, const std::string& listing_id) const = 0;

    // Idempotent: an already recorded pair is left untouched.
    virtual Status mark_seen(const std::string& source_id, const std::string& listing_id, SeenStatus status) = 0;

    // Retries writes that previously failed to persist.
    virtual Status flush_pending() = 0;
};

} // namespace webhunter
