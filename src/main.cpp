#include "alerting/webhook_transport.hpp"
#include "config/config_loader.hpp"
#include "core/alert_watcher.hpp"
#include "core/shutdown_signal.hpp"
#include "core/utils.hpp"
#include "tailer/file_tailer.hpp"

#include <chrono>
#include <cstdlib>
#include <format>
#include <memory>
#include <stop_token>
#include <thread>

using namespace alertwatch;

namespace {

std::string resolve_config_path(int argc, char* argv[]) {
    if (argc > 1) {
        return argv[1];
    }
    const char* from_env = std::getenv(env::CONFIG_FILE);
    return from_env ? std::string(from_env) : std::string{};
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    try {
        utils::log::info("Alert watcher starting...");

        ShutdownSignal::install();

        // Configuration
        const std::string config_file = resolve_config_path(argc, argv);
        if (config_file.empty()) {
            utils::log::info("[1/3] Loading configuration from environment");
        } else {
            utils::log::info(std::format("[1/3] Loading configuration from {}", config_file));
        }

        auto config_result = config_file.empty()
            ? ConfigLoader::load_from_env()
            : ConfigLoader::load_from_file(config_file);
        if (!config_result.success) {
            utils::log::error(config_result.error_message);
            return 1;
        }
        const WatcherConfig& cfg = config_result.config;

        if (auto level = utils::log::parse_level(cfg.log_level)) {
            utils::log::set_level(*level);
        }

        utils::log::info(std::format(
            "Config: window={} threshold={:.2f}% cooldown={}s primary_pool={} maintenance_flag={}",
            cfg.window_size, cfg.error_threshold * 100.0, cfg.cooldown.count(),
            cfg.primary_pool.empty() ? "<none>" : cfg.primary_pool,
            cfg.maintenance_flag_file.empty() ? "<none>" : cfg.maintenance_flag_file));

        // Detection pipeline
        utils::log::info("[2/3] Initializing detectors");
        auto transport = std::make_shared<WebhookTransport>(
            WebhookTransport::Config{cfg.webhook_url, cfg.webhook_timeout});
        AlertWatcher watcher(cfg, transport);

        FileTailer tailer(
            cfg.log_path,
            [&watcher](std::string_view line) { watcher.process_line(line); },
            cfg.tailer);

        // Turn the signal flag into a stop request for the tailing loop
        std::stop_source stop;
        std::jthread stop_relay([&stop](std::stop_token relay_stop) {
            while (!relay_stop.stop_requested()) {
                if (ShutdownSignal::requested()) {
                    stop.request_stop();
                    return;
                }
                std::this_thread::sleep_for(std::chrono::milliseconds{50});
            }
        });

        utils::log::info(std::format("[3/3] Watching {} (alerts via {})",
                                     cfg.log_path, transport->name()));
        tailer.run(stop.get_token());

        utils::log::info(std::format("Shutting down after interrupt (signal {}).",
                                     ShutdownSignal::received()));
        const auto stats = watcher.get_stats();
        utils::log::info(std::format(
            "Processed {} lines ({} skipped), {} alerts raised: {} sent, {} suppressed, {} failed",
            stats.lines_processed, stats.lines_skipped, stats.alerts_raised,
            stats.notifications.sent, stats.notifications.suppressed, stats.notifications.failed));

    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal: {}", e.what()));
        return 1;
    }

    return 0;
}
