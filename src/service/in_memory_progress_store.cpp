/// @file in_memory_progress_store.cpp
/// @brief InMemoryProgressStore implementation.

#include "duel/service/in_memory_progress_store.hpp"

#include <string>

namespace duel::service {

using duel::battle::kDefaultProgressLevel;
using duel::foundation::DuelError;
using duel::foundation::DuelResult;
using duel::foundation::ErrorCode;

namespace {

DuelResult<void> store(std::optional<int32_t>& slot, int32_t level, const char* key) {
    if (level < 1) {
        return DuelResult<void>::err(DuelError(
            ErrorCode::InvalidArgument,
            std::string(key) + " must be >= 1, got " + std::to_string(level)));
    }
    slot = level;
    return DuelResult<void>::ok();
}

} // namespace

DuelResult<int32_t> InMemoryProgressStore::getPlayerLevel() {
    std::lock_guard lock(mutex_);
    return DuelResult<int32_t>::ok(playerLevel_.value_or(kDefaultProgressLevel));
}

DuelResult<void> InMemoryProgressStore::setPlayerLevel(int32_t level) {
    std::lock_guard lock(mutex_);
    return store(playerLevel_, level, "PlayerLevel");
}

DuelResult<int32_t> InMemoryProgressStore::getEnemyLevel() {
    std::lock_guard lock(mutex_);
    return DuelResult<int32_t>::ok(enemyLevel_.value_or(kDefaultProgressLevel));
}

DuelResult<void> InMemoryProgressStore::setEnemyLevel(int32_t level) {
    std::lock_guard lock(mutex_);
    return store(enemyLevel_, level, "EnemyLevel");
}

DuelResult<int32_t> InMemoryProgressStore::getBestLevel() {
    std::lock_guard lock(mutex_);
    return DuelResult<int32_t>::ok(bestLevel_.value_or(kDefaultProgressLevel));
}

DuelResult<void> InMemoryProgressStore::setBestLevel(int32_t level) {
    std::lock_guard lock(mutex_);
    return store(bestLevel_, level, "BestLevel");
}

DuelResult<void> InMemoryProgressStore::resetProgress() {
    std::lock_guard lock(mutex_);
    playerLevel_.reset();
    enemyLevel_.reset();
    return DuelResult<void>::ok();
}

bool InMemoryProgressStore::hasSavedProgress() const {
    std::lock_guard lock(mutex_);
    return playerLevel_.has_value() && *playerLevel_ > kDefaultProgressLevel;
}

} // namespace duel::service
