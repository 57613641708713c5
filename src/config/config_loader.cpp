#include "config/config_loader.hpp"
#include "core/utils.hpp"

#include <toml++/toml.hpp>

#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <stdexcept>

using namespace std::string_literals;

namespace alertwatch {

// ============================================================================
// TOML Parsing Helpers (env expansion, extraction)
// ============================================================================

namespace {

/**
 * @brief Expand ${VAR_NAME} patterns in a string with environment variables.
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            const char* env_val = std::getenv(var_name.c_str());
            if (env_val) result += env_val;
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto&& [key, val] : tbl) {
        if (val.is_string()) {
            auto& s = *val.as_string();
            auto expanded = expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (val.is_table()) {
            expand_env_vars_recursive(*val.as_table());
        }
    }
}

std::optional<std::string> env_value(const char* name) {
    const char* value = std::getenv(name);
    if (!value) return std::nullopt;
    return std::string(value);
}

int64_t require_int(std::string_view source, std::string_view text) {
    const auto parsed = utils::try_parse_int<int64_t>(utils::trim(text));
    if (!parsed) {
        throw std::runtime_error(std::format("{} must be an integer, got '{}'", source, text));
    }
    return *parsed;
}

double require_double(std::string_view source, std::string_view text) {
    const auto parsed = utils::try_parse_double(utils::trim(text));
    if (!parsed) {
        throw std::runtime_error(std::format("{} must be a number, got '{}'", source, text));
    }
    return *parsed;
}

size_t to_window_size(std::string_view source, int64_t value) {
    if (value < 1) {
        throw std::runtime_error(std::format("{} must be >= 1, got {}", source, value));
    }
    return static_cast<size_t>(value);
}

std::chrono::seconds to_cooldown(std::string_view source, int64_t value) {
    if (value < 0) {
        throw std::runtime_error(std::format("{} must be >= 0, got {}", source, value));
    }
    return std::chrono::seconds{value};
}

std::chrono::milliseconds to_positive_ms(std::string_view source, int64_t value) {
    if (value <= 0) {
        throw std::runtime_error(std::format("{} must be > 0, got {}", source, value));
    }
    return std::chrono::milliseconds{value};
}

// ---- Extraction helpers ----------------------------------------------------

void extract_watcher(const toml::table& root, WatcherConfig& cfg) {
    const auto* tbl = root["watcher"].as_table();
    if (!tbl) return;

    if (auto v = (*tbl)["webhook_url"].value<std::string>()) cfg.webhook_url = *v;
    if (auto v = (*tbl)["log_path"].value<std::string>()) cfg.log_path = *v;
    if (auto v = (*tbl)["window_size"].value<int64_t>()) {
        cfg.window_size = to_window_size("watcher.window_size", *v);
    }
    if (auto v = (*tbl)["error_threshold"].value<double>()) cfg.error_threshold = *v;
    if (auto v = (*tbl)["cooldown_seconds"].value<int64_t>()) {
        cfg.cooldown = to_cooldown("watcher.cooldown_seconds", *v);
    }
    if (auto v = (*tbl)["primary_pool"].value<std::string>()) cfg.primary_pool = *v;
    if (auto v = (*tbl)["maintenance_flag_file"].value<std::string>()) cfg.maintenance_flag_file = *v;
    if (auto v = (*tbl)["log_level"].value<std::string>()) cfg.log_level = *v;
    if (auto v = (*tbl)["webhook_timeout_ms"].value<int64_t>()) {
        cfg.webhook_timeout = to_positive_ms("watcher.webhook_timeout_ms", *v);
    }
}

void extract_tailer(const toml::table& root, WatcherConfig& cfg) {
    const auto* tbl = root["tailer"].as_table();
    if (!tbl) return;

    if (auto v = (*tbl)["idle_interval_ms"].value<int64_t>()) {
        cfg.tailer.idle_interval = to_positive_ms("tailer.idle_interval_ms", *v);
    }
    if (auto v = (*tbl)["reopen_backoff_ms"].value<int64_t>()) {
        cfg.tailer.reopen_backoff = to_positive_ms("tailer.reopen_backoff_ms", *v);
    }
}

WatcherConfig extract_config(toml::table& root) {
    expand_env_vars_recursive(root);

    WatcherConfig cfg;
    extract_watcher(root, cfg);
    extract_tailer(root, cfg);
    return cfg;
}

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

void ConfigLoader::apply_env_overrides(WatcherConfig& config) {
    if (auto v = env_value(env::WEBHOOK_URL)) config.webhook_url = *v;
    if (auto v = env_value(env::LOG_PATH)) config.log_path = *v;
    if (auto v = env_value(env::WINDOW)) {
        config.window_size = to_window_size(env::WINDOW, require_int(env::WINDOW, *v));
    }
    if (auto v = env_value(env::THRESHOLD)) {
        config.error_threshold = require_double(env::THRESHOLD, *v);
    }
    if (auto v = env_value(env::COOLDOWN_SECONDS)) {
        config.cooldown = to_cooldown(env::COOLDOWN_SECONDS, require_int(env::COOLDOWN_SECONDS, *v));
    }
    if (auto v = env_value(env::PRIMARY_POOL)) config.primary_pool = *v;
    if (auto v = env_value(env::MAINTENANCE_FLAG)) config.maintenance_flag_file = *v;
    if (auto v = env_value(env::LOG_LEVEL)) config.log_level = *v;

    config.webhook_url = utils::trim(config.webhook_url);
    config.primary_pool = utils::to_lower(utils::trim(config.primary_pool));
    config.maintenance_flag_file = utils::trim(config.maintenance_flag_file);
}

std::optional<std::string> ConfigLoader::validate(const WatcherConfig& config) {
    if (utils::trim(config.webhook_url).empty()) {
        return std::format("{} is required.", env::WEBHOOK_URL);
    }
    if (config.log_path.empty()) {
        return "Log path must not be empty"s;
    }
    if (config.window_size < 1) {
        return "Window size must be >= 1"s;
    }
    if (std::isnan(config.error_threshold) ||
        config.error_threshold < 0.0 || config.error_threshold > 1.0) {
        return std::format("Error threshold must be a fraction between 0 and 1, got {}",
                           config.error_threshold);
    }
    if (config.cooldown.count() < 0) {
        return "Cooldown must be >= 0 seconds"s;
    }
    if (config.webhook_timeout.count() <= 0) {
        return "Webhook timeout must be > 0"s;
    }
    if (!utils::log::parse_level(config.log_level)) {
        return std::format("Unknown log level '{}' (expected debug, info, warn or error)",
                           config.log_level);
    }
    return std::nullopt;
}

ConfigLoader::LoadResult ConfigLoader::finish(WatcherConfig config) {
    try {
        apply_env_overrides(config);
    } catch (const std::exception& e) {
        return LoadResult::error(e.what());
    }

    if (auto problem = validate(config)) {
        return LoadResult::error(std::move(*problem));
    }
    return LoadResult::ok(std::move(config));
}

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    std::error_code ec;
    if (!std::filesystem::exists(config_path, ec)) {
        return LoadResult::error(std::format("Config file not found: {}", config_path));
    }

    WatcherConfig config;
    try {
        toml::table root = toml::parse_file(config_path);
        config = extract_config(root);
    } catch (const toml::parse_error& e) {
        return LoadResult::error(std::format("TOML parse error in {}: {}",
                                             config_path, e.description()));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Config error in {}: {}", config_path, e.what()));
    }
    return finish(std::move(config));
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    WatcherConfig config;
    try {
        toml::table root = toml::parse(toml_content);
        config = extract_config(root);
    } catch (const toml::parse_error& e) {
        return LoadResult::error(std::format("TOML parse error: {}", e.description()));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Config error: {}", e.what()));
    }
    return finish(std::move(config));
}

ConfigLoader::LoadResult ConfigLoader::load_from_env() {
    return finish(WatcherConfig{});
}

} // namespace alertwatch
