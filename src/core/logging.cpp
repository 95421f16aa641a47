#include "core/logging.hpp"
#include <spdlog/async.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <memory>

namespace matchcore::logging {

namespace {

constexpr const char* kLoggerName = "matchcore";
constexpr const char* kPattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";

}  // namespace

void setup(const Config::Logging& config) {
    spdlog::drop(kLoggerName);

    auto stdout_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    std::shared_ptr<spdlog::logger> logger;

    if (config.async) {
        // Trade lines are formatted on the pool thread
        spdlog::init_thread_pool(config.queue_size, 1);
        logger = std::make_shared<spdlog::async_logger>(
            kLoggerName,
            stdout_sink,
            spdlog::thread_pool(),
            spdlog::async_overflow_policy::overrun_oldest
        );
    } else {
        logger = std::make_shared<spdlog::logger>(kLoggerName, stdout_sink);
    }

    logger->set_pattern(kPattern);
    spdlog::set_default_logger(logger);
    spdlog::set_level(spdlog::level::from_str(config.level));
}

}  // namespace matchcore::logging
