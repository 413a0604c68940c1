#include "adapter_factory.hpp"
#include "html_regex_adapter.hpp"
#include "json_feed_adapter.hpp"

namespace webhunter {

std::vector<std::string> AdapterFactory::supported_kinds() {
    return {"json_feed", "html_regex"};
}

std::unique_ptr<SourceAdapter> AdapterFactory::create_adapter(const SourceConfig& config,
                                                              AppState* app_state,
                                                              const std::string& user_agent) {
    if (config.adapter == "json_feed") {
        return std::make_unique<JsonFeedAdapter>(app_state, user_agent);
    } else if (config.adapter == "html_regex") {
        return std::make_unique<HtmlRegexAdapter>(app_state, user_agent);
    }
    throw ConfigurationError("source '" + config.name + "' uses unknown adapter '" + config.adapter + "'");
}

}
