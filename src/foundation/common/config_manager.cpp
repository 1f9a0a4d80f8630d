#include "lq/foundation/config_manager.hpp"

namespace lq::foundation {

QueryResult<void> ConfigManager::load(const std::filesystem::path& path) {
    try {
        replaceEntries(YAML::LoadFile(path.string()));
        return QueryResult<void>::ok();
    } catch (const YAML::BadFile&) {
        return QueryResult<void>::err(
            QueryError(ErrorCode::ConfigLoadFailed, "failed to open config file: " + path.string()));
    } catch (const YAML::ParserException& e) {
        return QueryResult<void>::err(
            QueryError(ErrorCode::ConfigLoadFailed, std::string("YAML parse error: ") + e.what()));
    }
}

QueryResult<void> ConfigManager::loadFromString(std::string_view yaml) {
    try {
        replaceEntries(YAML::Load(std::string(yaml)));
        return QueryResult<void>::ok();
    } catch (const YAML::ParserException& e) {
        return QueryResult<void>::err(
            QueryError(ErrorCode::ConfigLoadFailed, std::string("YAML parse error: ") + e.what()));
    }
}

void ConfigManager::watch(std::string_view key, ConfigWatchCallback callback) {
    std::lock_guard lock(mutex_);
    watchers_[std::string(key)].push_back(std::move(callback));
}

bool ConfigManager::hasKey(std::string_view key) const {
    std::lock_guard lock(mutex_);
    return entries_.count(std::string(key)) > 0;
}

void ConfigManager::replaceEntries(const YAML::Node& root) {
    std::unordered_map<std::string, YAML::Node> flattened;
    flatten("", root, flattened);

    std::lock_guard lock(mutex_);
    entries_ = std::move(flattened);
}

void ConfigManager::flatten(const std::string& prefix, const YAML::Node& node,
                            std::unordered_map<std::string, YAML::Node>& out) {
    if (node.IsMap()) {
        for (auto it = node.begin(); it != node.end(); ++it) {
            auto childKey = it->first.as<std::string>();
            auto fullKey = prefix.empty() ? childKey : prefix + "." + childKey;
            flatten(fullKey, it->second, out);
        }
    } else if (!prefix.empty()) {
        // Leaf node (scalar, sequence, null): store under its dotted key.
        out[prefix] = YAML::Clone(node);
    }
}

void ConfigManager::notifyWatchers(std::string_view key) {
    // Callbacks run unlocked so they may read the configuration.
    std::vector<ConfigWatchCallback> callbacks;
    {
        std::lock_guard lock(mutex_);
        auto it = watchers_.find(std::string(key));
        if (it == watchers_.end()) {
            return;
        }
        callbacks = it->second;
    }
    for (auto& cb : callbacks) {
        cb(key);
    }
}

}  // namespace lq::foundation
