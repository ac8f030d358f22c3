#include "duel/foundation/config_manager.hpp"

#include <utility>

namespace duel::foundation {

namespace {

DuelError parseError(const YAML::ParserException& e) {
    return DuelError(ErrorCode::ConfigLoadFailed,
                     std::string("YAML parse error: ") + e.what());
}

DuelError structureError(const YAML::Exception& e) {
    return DuelError(ErrorCode::ConfigLoadFailed,
                     std::string("unsupported YAML structure: ") + e.what());
}

} // namespace

DuelResult<void> ConfigManager::load(const std::filesystem::path& path) {
    std::lock_guard lock(mutex_);
    try {
        auto root = YAML::LoadFile(path.string());
        Entries parsed;
        flatten("", root, parsed);
        entries_ = std::move(parsed);
        return DuelResult<void>::ok();
    } catch (const YAML::BadFile&) {
        return DuelResult<void>::err(
            DuelError(ErrorCode::ConfigLoadFailed, "failed to open config file: " + path.string()));
    } catch (const YAML::ParserException& e) {
        return DuelResult<void>::err(parseError(e));
    } catch (const YAML::Exception& e) {
        return DuelResult<void>::err(structureError(e));
    }
}

DuelResult<void> ConfigManager::loadFromString(std::string_view yaml) {
    std::lock_guard lock(mutex_);
    try {
        auto root = YAML::Load(std::string(yaml));
        Entries parsed;
        flatten("", root, parsed);
        entries_ = std::move(parsed);
        return DuelResult<void>::ok();
    } catch (const YAML::ParserException& e) {
        return DuelResult<void>::err(parseError(e));
    } catch (const YAML::Exception& e) {
        return DuelResult<void>::err(structureError(e));
    }
}

bool ConfigManager::hasKey(std::string_view key) const {
    std::lock_guard lock(mutex_);
    return entries_.count(std::string(key)) > 0;
}

std::size_t ConfigManager::size() const {
    std::lock_guard lock(mutex_);
    return entries_.size();
}

void ConfigManager::flatten(const std::string& prefix, const YAML::Node& node, Entries& out) {
    if (node.IsMap()) {
        for (auto it = node.begin(); it != node.end(); ++it) {
            auto childKey = it->first.as<std::string>();
            auto fullKey = prefix.empty() ? childKey : prefix + "." + childKey;
            flatten(fullKey, it->second, out);
        }
    } else if (!prefix.empty()) {
        out[prefix] = YAML::Clone(node);
    }
}

} // namespace duel::foundation
