#pragma once

/// @file logging_config.hpp
/// @brief Applies "logging.level.*" configuration keys to a QueryLogger.

#include <string>

#include "lq/foundation/config_manager.hpp"
#include "lq/foundation/query_logger.hpp"
#include "lq/foundation/query_result.hpp"

namespace lq::foundation {

/// Dotted config key holding the level of @p cat, e.g. "logging.level.query".
[[nodiscard]] std::string logLevelKey(LogCategory cat);

/// Set each category level found in @p config on @p logger.
///
/// Missing keys leave the category unchanged.  Level names are matched
/// case-insensitively ("trace" ... "off").
///
/// @return ConfigTypeMismatch naming the first key whose value is not a
///         known level; categories before it are already applied.
QueryResult<void> applyLoggingConfig(const ConfigManager& config, QueryLogger& logger);

} // namespace lq::foundation
