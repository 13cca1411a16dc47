#pragma once

#include "config.hpp"

namespace ctxsys::core {

// Configure the default spdlog logger: level from the config string, plus an
// optional file sink when log_path is set. Safe to call more than once.
Result<void, Error> init_logging(const ObservabilityConfig& config);

}  // namespace ctxsys::core
