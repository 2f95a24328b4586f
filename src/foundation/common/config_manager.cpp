#include "cgc/foundation/config_manager.hpp"

namespace cgc::foundation {

ClientResult<void> ConfigManager::load(const std::filesystem::path& path) {
    try {
        return replaceWith(YAML::LoadFile(path.string()));
    } catch (const YAML::BadFile&) {
        return ClientResult<void>::err(
            ClientError(ErrorCode::ConfigLoadFailed,
                        "failed to open config file: " + path.string()));
    } catch (const YAML::ParserException& e) {
        return ClientResult<void>::err(
            ClientError(ErrorCode::ConfigLoadFailed,
                        std::string("YAML parse error: ") + e.what()));
    }
}

ClientResult<void> ConfigManager::loadString(std::string_view yaml) {
    try {
        return replaceWith(YAML::Load(std::string(yaml)));
    } catch (const YAML::ParserException& e) {
        return ClientResult<void>::err(
            ClientError(ErrorCode::ConfigLoadFailed,
                        std::string("YAML parse error: ") + e.what()));
    }
}

ClientResult<void> ConfigManager::replaceWith(const YAML::Node& root) {
    if (root && !root.IsNull() && !root.IsMap()) {
        return ClientResult<void>::err(
            ClientError(ErrorCode::ConfigLoadFailed, "config root must be a mapping"));
    }
    std::lock_guard lock(mutex_);
    entries_.clear();
    if (root && root.IsMap()) {
        flatten("", root);
    }
    return ClientResult<void>::ok();
}

void ConfigManager::watch(std::string_view key, ConfigWatchCallback callback) {
    std::lock_guard lock(mutex_);
    watchers_[std::string(key)].push_back(std::move(callback));
}

bool ConfigManager::hasKey(std::string_view key) const {
    std::lock_guard lock(mutex_);
    return entries_.count(std::string(key)) > 0;
}

std::size_t ConfigManager::size() const {
    std::lock_guard lock(mutex_);
    return entries_.size();
}

void ConfigManager::flatten(const std::string& prefix, const YAML::Node& node) {
    if (node.IsMap()) {
        for (auto it = node.begin(); it != node.end(); ++it) {
            auto childKey = it->first.as<std::string>();
            auto fullKey = prefix.empty() ? childKey : prefix + "." + childKey;
            flatten(fullKey, it->second);
        }
    } else {
        entries_[prefix] = YAML::Clone(node);
    }
}

void ConfigManager::notifyWatchers(std::string_view key) {
    std::vector<ConfigWatchCallback> callbacks;
    {
        std::lock_guard lock(mutex_);
        auto it = watchers_.find(std::string(key));
        if (it == watchers_.end()) {
            return;
        }
        callbacks = it->second;
    }
    // Outside the lock so a watcher may read the new value back.
    for (auto& cb : callbacks) {
        cb(key);
    }
}

} // namespace cgc::foundation
