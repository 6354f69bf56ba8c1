// =============================================================================
// logging.cpp - spdlog setup
// =============================================================================

#include "yield/logging.hpp"

#include <spdlog/spdlog.h>

namespace yield {
namespace logging {

void init(const GeneralConfig& config) {
    auto level = spdlog::level::from_str(config.log_level);
    // from_str maps unknown names to "off"
    if (level == spdlog::level::off && config.log_level != "off") {
        throw LedgerError(errors::CONFIG_ERROR, "unknown log level: " + config.log_level);
    }
    spdlog::set_level(level);
    spdlog::set_pattern(config.log_pattern);
}

} // namespace logging
} // namespace yield
