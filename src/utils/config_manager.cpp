#include "config_manager.hpp"
#include <algorithm>
#include <fstream>
#include "logger.hpp"

namespace webhunter {

bool ConfigManager::load(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        LOG_ERROR("Failed to open config file: {}", file_path);
        return false;
    }
    try {
        nlohmann::json data;
        file >> data;
        return parse(data);
    } catch (const nlohmann::json::exception& e) {
        LOG_ERROR("Error parsing config file {}: {}", file_path, e.what());
        return false;
    }
}

bool ConfigManager::load_from_string(const std::string& content) {
    try {
        return parse(nlohmann::json::parse(content));
    } catch (const nlohmann::json::exception& e) {
        LOG_ERROR("Error parsing configuration: {}", e.what());
        return false;
    }
}

bool ConfigManager::parse(const nlohmann::json& data) {
    if (!data.is_object()) {
        LOG_ERROR("Configuration root must be a JSON object");
        return false;
    }

    try {
        if (data.contains("app")) {
            data["app"].get_to(app_config_);
        }
        if (data.contains("logging")) {
            data["logging"].get_to(logging_config_);
        }
        if (data.contains("store")) {
            data["store"].get_to(store_config_);
        }
        // Parsed even when absent so the token environment fallback applies
        notifier_config_ = data.value("notifier", nlohmann::json::object()).get<NotifierConfig>();
        if (data.contains("messages")) {
            data["messages"].get_to(messages_config_);
        }
        source_configs_.clear();
        if (data.contains("sources")) {
            for (auto& [name, config] : data["sources"].items()) {
                SourceConfig source_cfg = config.get<SourceConfig>();
                source_cfg.name = name; // Manually set the name
                source_configs_[name] = source_cfg;
            }
        }
    } catch (const nlohmann::json::exception& e) {
        LOG_ERROR("Invalid configuration value: {}", e.what());
        return false;
    }
    return true;
}

std::vector<std::string> ConfigManager::validate(const std::vector<std::string>& known_adapters) const {
    std::vector<std::string> problems;

    if (store_config_.path.empty()) {
        problems.push_back("store.path must not be empty");
    }
    if (store_config_.write_attempts < 1) {
        problems.push_back("store.write_attempts must be at least 1");
    }
    if (notifier_config_.max_attempts < 1) {
        problems.push_back("notifier.max_attempts must be at least 1");
    }
    if (notifier_config_.base_delay_ms < 0 || notifier_config_.max_delay_ms < notifier_config_.base_delay_ms) {
        problems.push_back("notifier delays must satisfy 0 <= base_delay_ms <= max_delay_ms");
    }
    if (notifier_config_.backoff_multiplier < 1.0) {
        problems.push_back("notifier.backoff_multiplier must be at least 1.0");
    }
    if (!app_config_.simulate) {
        if (notifier_config_.kind != "pushover") {
            problems.push_back("notifier.kind '" + notifier_config_.kind + "' is not supported");
        }
        if (notifier_config_.app_token.empty() || notifier_config_.user_token.empty()) {
            problems.push_back("notifier.app_token and notifier.user_token are required unless app.simulate is set");
        }
    }

    size_t enabled = 0;
    for (const auto& [name, source] : source_configs_) {
        if (!source.enabled) {
            continue;
        }
        ++enabled;
        if (std::find(known_adapters.begin(), known_adapters.end(), source.adapter) == known_adapters.end()) {
            problems.push_back("sources." + name + ".adapter '" + source.adapter + "' is unknown");
        }
        if (source.poll_interval_sec <= 0) {
            problems.push_back("sources." + name + ".poll_interval_sec must be positive");
        }
        if (source.jitter_sec < 0) {
            problems.push_back("sources." + name + ".jitter_sec must not be negative");
        }
        if (!source.params.is_object()) {
            problems.push_back("sources." + name + ".params must be an object");
        }
    }
    if (enabled == 0) {
        problems.push_back("no enabled sources configured");
    }

    return problems;
}

AppConfig& ConfigManager::get_app_config() {
    return app_config_;
}

LoggingConfig& ConfigManager::get_logging_config() {
    return logging_config_;
}

StoreConfig& ConfigManager::get_store_config() {
    return store_config_;
}

NotifierConfig& ConfigManager::get_notifier_config() {
    return notifier_config_;
}

MessagesConfig& ConfigManager::get_messages_config() {
    return messages_config_;
}

std::map<std::string, SourceConfig>& ConfigManager::get_source_configs() {
    return source_configs_;
}

std::vector<SourceConfig> ConfigManager::get_enabled_sources() const {
    std::vector<SourceConfig> sources;
    for (const auto& [name, source] : source_configs_) {
        if (source.enabled) {
            sources.push_back(source);
        }
    }
    return sources;
}

}
