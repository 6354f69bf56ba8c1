#ifndef YIELD_LOGGING_HPP
#define YIELD_LOGGING_HPP

#include "config.hpp"

namespace yield {
namespace logging {

// Apply level and pattern from config to the default spdlog logger.
// Throws LedgerError(CONFIG_ERROR) on an unknown level name.
void init(const GeneralConfig& config);

} // namespace logging
} // namespace yield

#endif // YIELD_LOGGING_HPP
