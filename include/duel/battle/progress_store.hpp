#pragma once

/// @file progress_store.hpp
/// @brief Persisted progress contract consumed by matches and sessions.

#include <cstdint>

#include "duel/foundation/duel_result.hpp"

namespace duel::battle {

/// Level assumed for any value that has never been written.
inline constexpr int32_t kDefaultProgressLevel = 1;

/// Durable player/enemy/best level storage.
///
/// Getters return kDefaultProgressLevel for values never written. A setter
/// that returns success has made the value durable, so the next read sees
/// it. Setters reject levels below 1 with InvalidArgument; I/O failures are
/// reported as PersistenceReadFailed / PersistenceWriteFailed.
class IProgressStore {
public:
    virtual ~IProgressStore() = default;

    [[nodiscard]] virtual duel::foundation::DuelResult<int32_t> getPlayerLevel() = 0;
    [[nodiscard]] virtual duel::foundation::DuelResult<void> setPlayerLevel(int32_t level) = 0;

    [[nodiscard]] virtual duel::foundation::DuelResult<int32_t> getEnemyLevel() = 0;
    [[nodiscard]] virtual duel::foundation::DuelResult<void> setEnemyLevel(int32_t level) = 0;

    [[nodiscard]] virtual duel::foundation::DuelResult<int32_t> getBestLevel() = 0;
    [[nodiscard]] virtual duel::foundation::DuelResult<void> setBestLevel(int32_t level) = 0;

    /// Forget player and enemy level. The best level is kept.
    [[nodiscard]] virtual duel::foundation::DuelResult<void> resetProgress() = 0;
};

} // namespace duel::battle
