#pragma once

#include <memory>
#include <string>
#include <vector>
#include "source_adapter.hpp"

namespace webhunter {

class AppState;

class AdapterFactory {
public:
    static std::vector<std::string> supported_kinds();

    // Throws ConfigurationError for an unknown kind
    static std::unique_ptr<SourceAdapter> create_adapter(const SourceConfig& config,
                                                         AppState* app_state,
                                                         const std::string& user_agent);
};

}
