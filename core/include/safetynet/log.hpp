#pragma once

#include <memory>
#include <spdlog/spdlog.h>

namespace safetynet {

// Shared "safetynet" logger. Level is info, or debug when DEBUG=true.
std::shared_ptr<spdlog::logger> logger();

// True when the DEBUG environment variable reads "true" in any case.
bool debug_logging_requested();

} // namespace safetynet
