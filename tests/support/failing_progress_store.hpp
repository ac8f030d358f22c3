#pragma once

/// @file failing_progress_store.hpp
/// @brief In-memory progress store whose reads or writes can be made to fail.

#include <cstdint>

#include "duel/service/in_memory_progress_store.hpp"

namespace duel::test {

class FailingProgressStore : public duel::battle::IProgressStore {
public:
    bool failReads = false;
    bool failWrites = false;
    int writeAttempts = 0;

    duel::foundation::DuelResult<int32_t> getPlayerLevel() override {
        if (failReads) return readFailure();
        return inner_.getPlayerLevel();
    }
    duel::foundation::DuelResult<void> setPlayerLevel(int32_t level) override {
        ++writeAttempts;
        if (failWrites) return writeFailure();
        return inner_.setPlayerLevel(level);
    }
    duel::foundation::DuelResult<int32_t> getEnemyLevel() override {
        if (failReads) return readFailure();
        return inner_.getEnemyLevel();
    }
    duel::foundation::DuelResult<void> setEnemyLevel(int32_t level) override {
        ++writeAttempts;
        if (failWrites) return writeFailure();
        return inner_.setEnemyLevel(level);
    }
    duel::foundation::DuelResult<int32_t> getBestLevel() override {
        if (failReads) return readFailure();
        return inner_.getBestLevel();
    }
    duel::foundation::DuelResult<void> setBestLevel(int32_t level) override {
        ++writeAttempts;
        if (failWrites) return writeFailure();
        return inner_.setBestLevel(level);
    }
    duel::foundation::DuelResult<void> resetProgress() override {
        ++writeAttempts;
        if (failWrites) return writeFailure();
        return inner_.resetProgress();
    }

    /// Backing store, for seeding values and checking what got through.
    duel::service::InMemoryProgressStore& inner() { return inner_; }

private:
    static duel::foundation::DuelResult<int32_t> readFailure() {
        return duel::foundation::DuelResult<int32_t>::err(duel::foundation::DuelError(
            duel::foundation::ErrorCode::PersistenceReadFailed, "disk unavailable"));
    }
    static duel::foundation::DuelResult<void> writeFailure() {
        return duel::foundation::DuelResult<void>::err(duel::foundation::DuelError(
            duel::foundation::ErrorCode::PersistenceWriteFailed, "disk full"));
    }

    duel::service::InMemoryProgressStore inner_;
};

} // namespace duel::test
