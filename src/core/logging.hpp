#pragma once

#include "core/config.hpp"

namespace matchcore::logging {

/// Install the "matchcore" logger as spdlog's default
/// Safe to call more than once; the previous logger is replaced.
void setup(const Config::Logging& config);

}  // namespace matchcore::logging
