#pragma once

/// @file yaml_progress_store.hpp
/// @brief File-backed IProgressStore using a small YAML document.

#include <cstdint>
#include <filesystem>
#include <memory>

#include "duel/battle/progress_store.hpp"

namespace duel::service {

/// Progress saved as a YAML map next to the game:
///
/// @code
///   PlayerLevel: 7
///   EnemyLevel: 8
///   BestLevel: 9
/// @endcode
///
/// Every read goes to the file. Every setter rewrites the whole document
/// into "<path>.tmp" and renames it over @p path before returning, so a
/// successful set is visible to the next read even across processes.
///
/// A missing file or key reads as kDefaultProgressLevel. A file that does
/// not parse, or holds a non-integer level, fails with PersistenceReadFailed.
class YamlProgressStore final : public duel::battle::IProgressStore {
public:
    explicit YamlProgressStore(std::filesystem::path path);
    ~YamlProgressStore() override;

    YamlProgressStore(const YamlProgressStore&) = delete;
    YamlProgressStore& operator=(const YamlProgressStore&) = delete;

    [[nodiscard]] duel::foundation::DuelResult<int32_t> getPlayerLevel() override;
    [[nodiscard]] duel::foundation::DuelResult<void> setPlayerLevel(int32_t level) override;
    [[nodiscard]] duel::foundation::DuelResult<int32_t> getEnemyLevel() override;
    [[nodiscard]] duel::foundation::DuelResult<void> setEnemyLevel(int32_t level) override;
    [[nodiscard]] duel::foundation::DuelResult<int32_t> getBestLevel() override;
    [[nodiscard]] duel::foundation::DuelResult<void> setBestLevel(int32_t level) override;
    [[nodiscard]] duel::foundation::DuelResult<void> resetProgress() override;

    /// True when the file holds a player level above 1.
    [[nodiscard]] bool hasSavedProgress();

    [[nodiscard]] const std::filesystem::path& path() const noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace duel::service
