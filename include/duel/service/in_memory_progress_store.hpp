#pragma once

/// @file in_memory_progress_store.hpp
/// @brief Volatile IProgressStore for tests and throwaway runs.

#include <cstdint>
#include <mutex>
#include <optional>

#include "duel/battle/progress_store.hpp"

namespace duel::service {

/// Progress kept in process memory. Thread-safe.
class InMemoryProgressStore final : public duel::battle::IProgressStore {
public:
    InMemoryProgressStore() = default;

    [[nodiscard]] duel::foundation::DuelResult<int32_t> getPlayerLevel() override;
    [[nodiscard]] duel::foundation::DuelResult<void> setPlayerLevel(int32_t level) override;
    [[nodiscard]] duel::foundation::DuelResult<int32_t> getEnemyLevel() override;
    [[nodiscard]] duel::foundation::DuelResult<void> setEnemyLevel(int32_t level) override;
    [[nodiscard]] duel::foundation::DuelResult<int32_t> getBestLevel() override;
    [[nodiscard]] duel::foundation::DuelResult<void> setBestLevel(int32_t level) override;
    [[nodiscard]] duel::foundation::DuelResult<void> resetProgress() override;

    /// True when a player level above 1 has been saved.
    [[nodiscard]] bool hasSavedProgress() const;

private:
    mutable std::mutex mutex_;
    std::optional<int32_t> playerLevel_;
    std::optional<int32_t> enemyLevel_;
    std::optional<int32_t> bestLevel_;
};

} // namespace duel::service
