#pragma once

#include <string>
#include <vector>
#include "../core/exceptions.hpp"
#include "../core/types.hpp"
#include "../utils/config_types.hpp"

namespace webhunter {

// Fetches one source and returns its current candidates in site order.
// Failures are reported by throwing FetchError.
class SourceAdapter {
public:
    virtual ~SourceAdapter() = default;

    virtual std::string get_kind() const = 0;
    virtual std::vector<Listing> fetch(const SourceConfig& config) = 0;
};

} // namespace webhunter
