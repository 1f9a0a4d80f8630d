#include "lq/foundation/logging_config.hpp"

#include <cctype>

namespace lq::foundation {

std::string logLevelKey(LogCategory cat) {
    std::string key = "logging.level.";
    for (char c : logCategoryName(cat)) {
        key += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return key;
}

QueryResult<void> applyLoggingConfig(const ConfigManager& config, QueryLogger& logger) {
    for (std::size_t i = 0; i < kLogCategoryCount; ++i) {
        const auto cat = static_cast<LogCategory>(i);
        const auto key = logLevelKey(cat);
        if (!config.hasKey(key)) {
            continue;
        }

        auto name = config.get<std::string>(key);
        if (name.hasError()) {
            return QueryResult<void>::err(name.error());
        }

        auto level = parseLogLevel(name.value());
        if (!level) {
            return QueryResult<void>::err(
                QueryError(ErrorCode::ConfigTypeMismatch,
                           "unknown log level '" + name.value() + "' for key: " + key));
        }
        logger.setCategoryLevel(cat, *level);
    }
    return QueryResult<void>::ok();
}

}  // namespace lq::foundation
