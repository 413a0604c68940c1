#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "core/app_state.hpp"
#include "core/exceptions.hpp"
#include "core/scheduler.hpp"
#include "core/signal_watcher.hpp"
#include "data/sqlite_seen_store.hpp"
#include "notification/message_formatter.hpp"
#include "notification/notification_dispatcher.hpp"
#include "notification/pushover_channel.hpp"
#include "notification/simulated_channel.hpp"
#include "source/adapter_factory.hpp"
#include "utils/config_manager.hpp"
#include "utils/logger.hpp"

namespace {

const char* kVersion = "0.1";
const char* kDefaultConfigFile = "/etc/webhunter.json";

constexpr int kExitOk = 0;
constexpr int kExitConfig = 1;
constexpr int kExitStore = 2;
constexpr int kExitFatal = 3;

struct Options {
    std::string config_file = kDefaultConfigFile;
    bool verbose = false;
    bool version = false;
    bool reseed = false;
    bool oneshot = false;
};

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " [-c FILE] [-v] [--version] [--reseed] [-1|--oneshot]\n"
              << "  -c, --configfile FILE  configuration file (default " << kDefaultConfigFile << ")\n"
              << "  -v, --verbose          debug logging\n"
              << "      --version          print version and exit\n"
              << "      --reseed           mark everything currently listed as seen, then continue\n"
              << "  -1, --oneshot          poll every source once and exit\n";
}

bool parse_options(int argc, char* argv[], Options& options) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-c" || arg == "--configfile") {
            if (i + 1 >= argc) {
                std::cerr << arg << " requires a file name\n";
                return false;
            }
            options.config_file = argv[++i];
        } else if (arg.rfind("--configfile=", 0) == 0) {
            options.config_file = arg.substr(std::string("--configfile=").size());
        } else if (arg == "-v" || arg == "--verbose") {
            options.verbose = true;
        } else if (arg == "--version") {
            options.version = true;
        } else if (arg == "--reseed") {
            options.reseed = true;
        } else if (arg == "-1" || arg == "--oneshot") {
            options.oneshot = true;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            return false;
        }
    }
    return true;
}

void send_service_message(webhunter::NotificationDispatcher& dispatcher,
                          const std::string& title, const std::string& body) {
    if (body.empty()) {
        return;
    }
    webhunter::PushMessage message;
    message.title = title;
    message.body = body;
    auto outcome = dispatcher.deliver_message(message);
    if (!outcome.delivered()) {
        LOG_WARNING("Service message not delivered: {}", outcome.reason);
    }
}

} // namespace

int main(int argc, char* argv[]) {
    Options options;
    if (!parse_options(argc, argv, options)) {
        print_usage(argv[0]);
        return kExitConfig;
    }
    if (options.version) {
        std::cout << "webhunter v" << kVersion << std::endl;
        return kExitOk;
    }

    // Load configuration
    webhunter::ConfigManager config_manager;
    if (!config_manager.load(options.config_file)) {
        LOG_CRITICAL("Failed to load configuration from {}. Exiting.", options.config_file);
        return kExitConfig;
    }
    auto problems = config_manager.validate(webhunter::AdapterFactory::supported_kinds());
    if (!problems.empty()) {
        for (const auto& problem : problems) {
            LOG_CRITICAL("Configuration Error: {}", problem);
        }
        return kExitConfig;
    }

    const auto& app_config = config_manager.get_app_config();
    webhunter::LogLevel log_level = webhunter::parse_log_level(app_config.log_level);
    if (options.verbose || app_config.debug) {
        log_level = webhunter::LogLevel::DEBUG;
    }
    webhunter::Logger::init(config_manager.get_logging_config(), log_level);
    LOG_INFO("Starting {} v{} with {}", app_config.name, kVersion, options.config_file);

    webhunter::AppState app_state;
    webhunter::SignalWatcher signal_watcher(app_state);

    const auto& store_config = config_manager.get_store_config();
    webhunter::RetryPolicy write_policy;
    write_policy.max_attempts = store_config.write_attempts;
    write_policy.base_delay = std::chrono::milliseconds(store_config.write_base_delay_ms);
    write_policy.max_delay = std::chrono::milliseconds(store_config.write_max_delay_ms);
    webhunter::SqliteSeenStore store(store_config.path, write_policy);

    std::unique_ptr<webhunter::NotificationChannel> channel;
    if (app_config.simulate) {
        LOG_WARNING("Simulation mode: notifications are logged, not sent");
        channel = std::make_unique<webhunter::SimulatedChannel>();
    } else {
        channel = std::make_unique<webhunter::PushoverChannel>(
            config_manager.get_notifier_config(), app_config.user_agent, &app_state);
    }

    const auto& notifier_config = config_manager.get_notifier_config();
    webhunter::RetryPolicy send_policy;
    send_policy.max_attempts = notifier_config.max_attempts;
    send_policy.base_delay = std::chrono::milliseconds(notifier_config.base_delay_ms);
    send_policy.max_delay = std::chrono::milliseconds(notifier_config.max_delay_ms);
    send_policy.multiplier = notifier_config.backoff_multiplier;

    webhunter::NotificationDispatcher dispatcher(
        *channel,
        webhunter::MessageFormatter(config_manager.get_messages_config()),
        notifier_config.user_token,
        send_policy,
        [&app_state](std::chrono::milliseconds delay) { return app_state.wait_for(delay); });

    const auto& messages = config_manager.get_messages_config();
    int exit_code = kExitOk;

    try {
        webhunter::Scheduler scheduler(store, dispatcher, app_state);
        for (const auto& source : config_manager.get_enabled_sources()) {
            scheduler.add_source(source,
                                 webhunter::AdapterFactory::create_adapter(source, &app_state, app_config.user_agent));
        }

        webhunter::Status loaded = scheduler.load_store();
        if (loaded.is_error()) {
            return kExitStore;
        }

        if (options.reseed) {
            auto seeded = scheduler.reseed();
            if (seeded.is_error()) {
                return kExitStore;
            }
        }

        if (!app_state.is_running()) {
            LOG_INFO("Interrupted before polling started");
            return kExitOk;
        }

        if (options.oneshot) {
            auto reports = scheduler.run_once();
            if (reports.is_error()) {
                return kExitStore;
            }
            LOG_INFO("Oneshot run finished for {} sources", reports.value().size());
            return kExitOk;
        }

        webhunter::Status started = scheduler.start();
        if (started.is_error()) {
            return kExitStore;
        }
        send_service_message(dispatcher, app_config.name, messages.startup);
        LOG_INFO("{} is running.", app_config.name);

        while (app_state.wait_for(std::chrono::seconds(1))) {
        }

        LOG_INFO("Stopping sources...");
        scheduler.stop();
    } catch (const webhunter::ConfigurationError& e) {
        LOG_CRITICAL("{}", e.what());
        exit_code = kExitConfig;
    } catch (const std::exception& e) {
        LOG_CRITICAL("Fatal error: {}", e.what());
        if (!messages.shutdown.empty()) {
            send_service_message(dispatcher, app_config.name, messages.shutdown + "\n" + e.what());
        }
        exit_code = kExitFatal;
    }

    store.close();
    LOG_INFO("{} has shut down.", app_config.name);
    webhunter::Logger::shutdown();
    return exit_code;
}
