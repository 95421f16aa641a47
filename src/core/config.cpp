#include "core/config.hpp"
#include <spdlog/spdlog.h>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <nlohmann/json.hpp>
#include <sstream>

namespace matchcore {

using json = nlohmann::json;

namespace {

// Upper bound on async logger queue slots
constexpr std::size_t kMaxQueueSize = std::size_t{1} << 20;

/// Get environment variable value, or nullopt if not set
std::optional<std::string> get_env(const char* name) {
    const char* value = std::getenv(name);
    if (value != nullptr) {
        return std::string(value);
    }
    return std::nullopt;
}

/// Get environment variable as positive size_t
std::optional<std::size_t> get_env_size(const char* name, std::size_t max_val = std::numeric_limits<std::size_t>::max()) {
    auto value = get_env(name);
    if (!value) {
        return std::nullopt;
    }
    try {
        long long result = std::stoll(*value);
        if (result <= 0 || static_cast<unsigned long long>(result) > max_val) {
            spdlog::warn("{} value {} out of range (1..{}), ignoring", name, result, max_val);
            return std::nullopt;
        }
        return static_cast<std::size_t>(result);
    } catch (const std::exception&) {
        spdlog::warn("Invalid size value for {}: {}, ignoring", name, *value);
        return std::nullopt;
    }
}

/// Get environment variable as double
std::optional<double> get_env_double(const char* name) {
    auto value = get_env(name);
    if (!value) {
        return std::nullopt;
    }
    try {
        return std::stod(*value);
    } catch (const std::exception&) {
        spdlog::warn("Invalid numeric value for {}: {}, ignoring", name, *value);
        return std::nullopt;
    }
}

/// Get environment variable as bool ("1"/"true"/"0"/"false")
std::optional<bool> get_env_bool(const char* name) {
    auto value = get_env(name);
    if (!value) {
        return std::nullopt;
    }
    if (*value == "1" || *value == "true") {
        return true;
    }
    if (*value == "0" || *value == "false") {
        return false;
    }
    spdlog::warn("Invalid boolean value for {}: {}, ignoring", name, *value);
    return std::nullopt;
}

bool is_valid_tolerance(double v) {
    return std::isfinite(v) && v >= 0.0;
}

bool is_valid_level(const std::string& level) {
    return spdlog::level::from_str(level) != spdlog::level::off || level == "off";
}

/// Apply environment variable overrides to config
void apply_env_overrides(Config& config) {
    if (auto v = get_env_double("MATCHCORE_PRICE_TOLERANCE")) {
        if (is_valid_tolerance(*v)) {
            config.engine.price_tolerance = *v;
        } else {
            spdlog::warn("MATCHCORE_PRICE_TOLERANCE must be finite and >= 0, ignoring");
        }
    }

    if (auto v = get_env("MATCHCORE_LOG_LEVEL")) {
        if (is_valid_level(*v)) {
            config.logging.level = *v;
        } else {
            spdlog::warn("Unknown MATCHCORE_LOG_LEVEL '{}', ignoring", *v);
        }
    }
    if (auto v = get_env_bool("MATCHCORE_LOG_ASYNC")) {
        config.logging.async = *v;
    }
    if (auto v = get_env_size("MATCHCORE_LOG_QUEUE_SIZE", kMaxQueueSize)) {
        config.logging.queue_size = *v;
    }
}

}  // namespace

Result<Config, std::string> Config::load_from_file(const std::string& path) {
    // Read file contents
    std::ifstream file(path);
    if (!file.is_open()) {
        return Result<Config, std::string>::Err("Failed to open config file: " + path);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    std::string content = buffer.str();

    // Parse JSON
    json j;
    try {
        j = json::parse(content);
    } catch (const json::exception& e) {
        return Result<Config, std::string>::Err("Failed to parse JSON: " + std::string(e.what()));
    }

    // Start with defaults
    Config config = Config::defaults();

    try {
        // Engine section
        if (j.contains("engine")) {
            const auto& eng = j["engine"];
            if (eng.contains("price_tolerance")) {
                auto tolerance = eng["price_tolerance"].get<double>();
                if (!is_valid_tolerance(tolerance)) {
                    return Result<Config, std::string>::Err(
                        "engine.price_tolerance must be finite and >= 0");
                }
                config.engine.price_tolerance = tolerance;
            }
        }

        // Logging section
        if (j.contains("logging")) {
            const auto& log = j["logging"];
            if (log.contains("level")) {
                auto level = log["level"].get<std::string>();
                if (!is_valid_level(level)) {
                    return Result<Config, std::string>::Err("Unknown logging.level: " + level);
                }
                config.logging.level = level;
            }
            if (log.contains("async")) {
                config.logging.async = log["async"].get<bool>();
            }
            if (log.contains("queue_size")) {
                const auto& size = log["queue_size"];
                if (!size.is_number_integer() || size.get<long long>() <= 0 ||
                    size.get<unsigned long long>() > kMaxQueueSize) {
                    return Result<Config, std::string>::Err(
                        "logging.queue_size must be an integer in 1.." + std::to_string(kMaxQueueSize));
                }
                config.logging.queue_size = size.get<std::size_t>();
            }
        }

        // Demo section
        if (j.contains("demo")) {
            const auto& demo = j["demo"];
            if (demo.contains("orders_file")) {
                config.demo.orders_file = demo["orders_file"].get<std::string>();
            }
            if (demo.contains("product_id")) {
                config.demo.product_id = demo["product_id"].get<ProductId>();
            }
            if (demo.contains("update_price")) {
                config.demo.update_price = demo["update_price"].get<Price>();
            }
        }
    } catch (const json::exception& e) {
        return Result<Config, std::string>::Err("Error reading config field: " + std::string(e.what()));
    }

    return Result<Config, std::string>::Ok(config);
}

Config Config::load(const std::optional<std::string>& config_path) {
    Config config = Config::defaults();

    // Load from file if path provided
    if (config_path) {
        auto result = load_from_file(*config_path);
        if (result.is_ok()) {
            config = result.value();
        } else {
            spdlog::warn("Failed to load config from '{}': {} (using defaults with env overrides)",
                         *config_path, result.error());
        }
    }

    // Apply environment variable overrides (highest priority)
    apply_env_overrides(config);

    return config;
}

}  // namespace matchcore
