#include "config_types.hpp"
#include <cstdlib>

namespace webhunter {

std::string get_env_var(const std::string& key) {
    const char* val = std::getenv(key.c_str());
    return val == nullptr ? std::string("") : std::string(val);
}

void from_json(const nlohmann::json& j, AppConfig& config) {
    config.name = j.value("name", config.name);
    config.debug = j.value("debug", config.debug);
    config.log_level = j.value("log_level", config.log_level);
    config.simulate = j.value("simulate", config.simulate);
    config.user_agent = j.value("user_agent", config.user_agent);
}

void from_json(const nlohmann::json& j, LoggingConfig& config) {
    config.console_output = j.value("console_output", config.console_output);
    config.file_output = j.value("file_output", config.file_output);
    config.file_path = j.value("file_path", config.file_path);
    config.max_file_size_mb = j.value("max_file_size_mb", config.max_file_size_mb);
    config.max_files = j.value("max_files", config.max_files);
}

void from_json(const nlohmann::json& j, StoreConfig& config) {
    config.path = j.value("path", config.path);
    config.write_attempts = j.value("write_attempts", config.write_attempts);
    config.write_base_delay_ms = j.value("write_base_delay_ms", config.write_base_delay_ms);
    config.write_max_delay_ms = j.value("write_max_delay_ms", config.write_max_delay_ms);
}

void from_json(const nlohmann::json& j, NotifierConfig& config) {
    config.kind = j.value("kind", config.kind);
    config.endpoint = j.value("endpoint", config.endpoint);
    config.app_token = j.value("app_token", config.app_token);
    config.user_token = j.value("user_token", config.user_token);
    config.device = j.value("device", config.device);
    config.priority = j.value("priority", config.priority);
    config.timeout_ms = j.value("timeout_ms", config.timeout_ms);
    config.max_attempts = j.value("max_attempts", config.max_attempts);
    config.base_delay_ms = j.value("base_delay_ms", config.base_delay_ms);
    config.max_delay_ms = j.value("max_delay_ms", config.max_delay_ms);
    config.backoff_multiplier = j.value("backoff_multiplier", config.backoff_multiplier);

    if (config.app_token.empty()) {
        config.app_token = get_env_var("WEBHUNTER_APP_TOKEN");
    }
    if (config.user_token.empty()) {
        config.user_token = get_env_var("WEBHUNTER_USER_TOKEN");
    }
}

void from_json(const nlohmann::json& j, MessagesConfig& config) {
    config.title = j.value("title", config.title);
    config.body = j.value("body", config.body);
    config.startup = j.value("startup", config.startup);
    config.shutdown = j.value("shutdown", config.shutdown);
}

void from_json(const nlohmann::json& j, SourceConfig& config) {
    config.name = j.value("name", config.name);
    config.adapter = j.value("adapter", config.adapter);
    config.enabled = j.value("enabled", config.enabled);
    config.poll_interval_sec = j.value("poll_interval_sec", config.poll_interval_sec);
    config.jitter_sec = j.value("jitter_sec", config.jitter_sec);
    if (j.contains("params")) {
        config.params = j.at("params");
    }
}

} // namespace webhunter
