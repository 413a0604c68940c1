#pragma once

#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "config_types.hpp"

namespace webhunter {

class ConfigManager {
public:
    bool load(const std::string& file_path);
    bool load_from_string(const std::string& content);

    // Returns one human readable line per problem; empty when the configuration is usable
    std::vector<std::string> validate(const std::vector<std::string>& known_adapters) const;

    AppConfig& get_app_config();
    LoggingConfig& get_logging_config();
    StoreConfig& get_store_config();
    NotifierConfig& get_notifier_config();
    MessagesConfig& get_messages_config();
    std::map<std::string, SourceConfig>& get_source_configs();
    std::vector<SourceConfig> get_enabled_sources() const;

private:
    bool parse(const nlohmann::json& data);

    AppConfig app_config_;
    LoggingConfig logging_config_;
    StoreConfig store_config_;
    NotifierConfig notifier_config_;
    MessagesConfig messages_config_;
    std::map<std::string, SourceConfig> source_configs_;
};

}
