#pragma once

#include <map>
#include <string>
#include <nlohmann/json.hpp>

namespace webhunter {

std::string get_env_var(const std::string& key);

struct AppConfig {
    std::string name = "webhunter";
    bool debug = false;
    std::string log_level = "INFO";
    // Log notifications instead of sending them
    bool simulate = false;
    std::string user_agent = "WebHunter/1.0";
};
void from_json(const nlohmann::json& j, AppConfig& config);

struct LoggingConfig {
    bool console_output = true;
    bool file_output = false;
    std::string file_path = "logs/webhunter.log";
    int max_file_size_mb = 10;
    int max_files = 3;
};
void from_json(const nlohmann::json& j, LoggingConfig& config);

struct StoreConfig {
    std::string path = "webhunter.db";
    int write_attempts = 5;
    int write_base_delay_ms = 50;
    int write_max_delay_ms = 1000;
};
void from_json(const nlohmann::json& j, StoreConfig& config);

struct NotifierConfig {
    std::string kind = "pushover";
    std::string endpoint = "https://api.pushover.net/1/messages.json";
    std::string app_token;
    std::string user_token;
    std::string device;
    int priority = 0;
    int timeout_ms = 10000;
    int max_attempts = 3;
    int base_delay_ms = 2000;
    int max_delay_ms = 60000;
    double backoff_multiplier = 2.0;
};
void from_json(const nlohmann::json& j, NotifierConfig& config);

struct MessagesConfig {
    std::string title = "New listing on {source}";
    std::string body = "{title}\n{price}";
    std::string startup;
    std::string shutdown = "WebHunter stopped unexpectedly";
};
void from_json(const nlohmann::json& j, MessagesConfig& config);

struct SourceConfig {
    std::string name;
    std::string adapter;
    bool enabled = true;
    int poll_interval_sec = 300;
    int jitter_sec = 60;
    // Adapter-specific parameters, interpreted only by the adapter
    nlohmann::json params = nlohmann::json::object();
};
void from_json(const nlohmann::json& j, SourceConfig& config);

}
