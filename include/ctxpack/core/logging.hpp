#pragma once

#include "config.hpp"
#include "result.hpp"

namespace ctxpack::core {

// Installs the default spdlog logger: stderr, plus a file sink when
// observability.log_path is set. An unknown level name falls back to info.
Result<void, Error> init_logging(const ObservabilityConfig& config);

}  // namespace ctxpack::core
