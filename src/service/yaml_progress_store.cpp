/// @file yaml_progress_store.cpp
/// @brief YamlProgressStore implementation.

#include "duel/service/yaml_progress_store.hpp"

#include <fstream>
#include <mutex>
#include <string>
#include <system_error>

#include <yaml-cpp/yaml.h>

#include "duel/foundation/duel_logger.hpp"

namespace duel::service {

using duel::battle::kDefaultProgressLevel;
using duel::foundation::DuelError;
using duel::foundation::DuelResult;
using duel::foundation::ErrorCode;
using duel::foundation::LogCategory;

namespace {

constexpr const char* kPlayerLevelKey = "PlayerLevel";
constexpr const char* kEnemyLevelKey = "EnemyLevel";
constexpr const char* kBestLevelKey = "BestLevel";

DuelError readError(const std::filesystem::path& path, const std::string& what) {
    return DuelError(ErrorCode::PersistenceReadFailed,
                     "cannot read progress file " + path.string() + ": " + what,
                     path.string());
}

DuelError writeError(const std::filesystem::path& path, const std::string& what) {
    return DuelError(ErrorCode::PersistenceWriteFailed,
                     "cannot write progress file " + path.string() + ": " + what,
                     path.string());
}

} // namespace

// ── Impl ────────────────────────────────────────────────────────────────

struct YamlProgressStore::Impl {
    std::filesystem::path path;
    std::mutex mutex;

    /// Whole document; an empty map when the file does not exist yet.
    DuelResult<YAML::Node> readDocument() const {
        std::error_code ec;
        if (!std::filesystem::exists(path, ec)) {
            return DuelResult<YAML::Node>::ok(YAML::Node(YAML::NodeType::Map));
        }
        try {
            auto root = YAML::LoadFile(path.string());
            if (root.IsNull()) {
                return DuelResult<YAML::Node>::ok(YAML::Node(YAML::NodeType::Map));
            }
            if (!root.IsMap()) {
                return DuelResult<YAML::Node>::err(readError(path, "top level is not a map"));
            }
            return DuelResult<YAML::Node>::ok(root);
        } catch (const YAML::BadFile&) {
            return DuelResult<YAML::Node>::err(readError(path, "cannot open file"));
        } catch (const YAML::ParserException& e) {
            return DuelResult<YAML::Node>::err(readError(path, e.what()));
        }
    }

    DuelResult<int32_t> readLevel(const char* key) const {
        auto doc = readDocument();
        if (!doc) {
            DUEL_LOG_WARN(LogCategory::Persistence, std::string(doc.error().message()));
            return DuelResult<int32_t>::err(doc.error());
        }
        const auto node = doc.value()[key];
        if (!node.IsDefined() || node.IsNull()) {
            return DuelResult<int32_t>::ok(kDefaultProgressLevel);
        }
        try {
            return DuelResult<int32_t>::ok(node.as<int32_t>());
        } catch (const YAML::BadConversion&) {
            auto error = readError(path, std::string(key) + " is not an integer");
            DUEL_LOG_WARN(LogCategory::Persistence, std::string(error.message()));
            return DuelResult<int32_t>::err(error);
        }
    }

    /// Write @p doc to "<path>.tmp", then rename it over the real file.
    DuelResult<void> writeDocument(const YAML::Node& doc) const {
        std::error_code ec;
        if (path.has_parent_path()) {
            std::filesystem::create_directories(path.parent_path(), ec);
            if (ec) {
                return DuelResult<void>::err(writeError(path, ec.message()));
            }
        }

        YAML::Emitter out;
        out << doc;

        auto tmpPath = path;
        tmpPath += ".tmp";
        {
            std::ofstream file(tmpPath, std::ios::trunc);
            if (!file) {
                return DuelResult<void>::err(writeError(path, "cannot open temporary file"));
            }
            file << out.c_str() << '\n';
            file.flush();
            if (!file) {
                return DuelResult<void>::err(writeError(path, "short write"));
            }
        }

        std::filesystem::rename(tmpPath, path, ec);
        if (ec) {
            std::filesystem::remove(tmpPath, ec);
            return DuelResult<void>::err(writeError(path, "rename failed"));
        }
        return DuelResult<void>::ok();
    }

    DuelResult<void> writeLevel(const char* key, int32_t level) {
        if (level < 1) {
            return DuelResult<void>::err(DuelError(
                ErrorCode::InvalidArgument,
                std::string(key) + " must be >= 1, got " + std::to_string(level)));
        }
        auto doc = readDocument();
        if (!doc) {
            DUEL_LOG_WARN(LogCategory::Persistence, std::string(doc.error().message()));
            return DuelResult<void>::err(doc.error());
        }
        auto& root = doc.value();
        root[key] = level;

        auto written = writeDocument(root);
        if (!written) {
            DUEL_LOG_WARN(LogCategory::Persistence, std::string(written.error().message()));
            return written;
        }
        DUEL_LOG_DEBUG(LogCategory::Persistence,
                       std::string(key) + " = " + std::to_string(level));
        return written;
    }
};

// ── Public API ──────────────────────────────────────────────────────────

YamlProgressStore::YamlProgressStore(std::filesystem::path path)
    : impl_(std::make_unique<Impl>()) {
    impl_->path = std::move(path);
}

YamlProgressStore::~YamlProgressStore() = default;

DuelResult<int32_t> YamlProgressStore::getPlayerLevel() {
    std::lock_guard lock(impl_->mutex);
    return impl_->readLevel(kPlayerLevelKey);
}

DuelResult<void> YamlProgressStore::setPlayerLevel(int32_t level) {
    std::lock_guard lock(impl_->mutex);
    return impl_->writeLevel(kPlayerLevelKey, level);
}

DuelResult<int32_t> YamlProgressStore::getEnemyLevel() {
    std::lock_guard lock(impl_->mutex);
    return impl_->readLevel(kEnemyLevelKey);
}

DuelResult<void> YamlProgressStore::setEnemyLevel(int32_t level) {
    std::lock_guard lock(impl_->mutex);
    return impl_->writeLevel(kEnemyLevelKey, level);
}

DuelResult<int32_t> YamlProgressStore::getBestLevel() {
    std::lock_guard lock(impl_->mutex);
    return impl_->readLevel(kBestLevelKey);
}

DuelResult<void> YamlProgressStore::setBestLevel(int32_t level) {
    std::lock_guard lock(impl_->mutex);
    return impl_->writeLevel(kBestLevelKey, level);
}

DuelResult<void> YamlProgressStore::resetProgress() {
    std::lock_guard lock(impl_->mutex);
    auto doc = impl_->readDocument();
    if (!doc) {
        return DuelResult<void>::err(doc.error());
    }
    auto& root = doc.value();
    root.remove(kPlayerLevelKey);
    root.remove(kEnemyLevelKey);
    auto written = impl_->writeDocument(root);
    if (written) {
        DUEL_LOG_INFO(LogCategory::Persistence, "progress reset");
    }
    return written;
}

bool YamlProgressStore::hasSavedProgress() {
    std::lock_guard lock(impl_->mutex);
    auto level = impl_->readLevel(kPlayerLevelKey);
    return level && level.value() > kDefaultProgressLevel;
}

const std::filesystem::path& YamlProgressStore::path() const noexcept {
    return impl_->path;
}

} // namespace duel::service
