#pragma once

#include "core/status.hpp"
#include "core/types.hpp"
#include <cstddef>
#include <optional>
#include <string>

namespace matchcore {

/// Immutable configuration for matchcore
struct Config {
    /// Matching engine configuration
    struct Engine {
        Price price_tolerance = 0.05;  // max deviation kept on a price update
    };

    /// Logging configuration
    struct Logging {
        std::string level = "info";    // spdlog level name
        bool async = false;            // route through spdlog's thread pool
        std::size_t queue_size = 8192; // async queue slots
    };

    /// Demo harness configuration
    struct Demo {
        std::optional<std::string> orders_file;  // JSON book to load instead of the built-in one
        ProductId product_id = 1;
        std::optional<Price> update_price;       // price update applied after matching
    };

    Engine engine;
    Logging logging;
    Demo demo;

    /// Create default configuration
    [[nodiscard]] static Config defaults() {
        return Config{};
    }

    /// Load configuration from JSON file
    /// Falls back to defaults for any missing fields
    /// @param path Path to the JSON configuration file
    /// @return Config on success, error message on failure
    [[nodiscard]] static Result<Config, std::string> load_from_file(const std::string& path);

    /// Load configuration with optional file path and environment variable overrides
    /// Priority (highest to lowest): environment variables > config file > defaults
    [[nodiscard]] static Config load(const std::optional<std::string>& config_path = std::nullopt);
};

}  // namespace matchcore
