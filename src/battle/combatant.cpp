/// @file combatant.cpp
/// @brief Combatant implementation.

#include "duel/battle/combatant.hpp"

#include <algorithm>
#include <string>
#include <utility>

#include "duel/battle/action_resolver.hpp"
#include "duel/foundation/duel_logger.hpp"

namespace duel::battle {

using duel::foundation::LogCategory;

Combatant::Combatant(Side side, StatProfile profile, int32_t defenseConstant)
    : side_(side),
      profile_(std::move(profile)),
      defenseConstant_(defenseConstant) {
    recalculate();
    currentHp_ = stats_.maxHp;
}

void Combatant::initialize(int32_t level) {
    level_ = std::max<int32_t>(level, 1);
    recalculate();
    currentHp_ = stats_.maxHp;
    defending_ = false;
}

int32_t Combatant::levelUp(int32_t levels) {
    if (levels <= 0) {
        return 0;
    }
    int32_t oldMax = stats_.maxHp;
    level_ = StatScaler::offsetLevel(level_, levels);
    recalculate();

    int32_t gained = std::max<int32_t>(stats_.maxHp - oldMax, 0);
    currentHp_ = std::clamp(currentHp_ + gained, 0, stats_.maxHp);

    DUEL_LOG_DEBUG(LogCategory::Stats,
                   profile_.name + " reached level " + std::to_string(level_)
                   + " (+" + std::to_string(gained) + " max HP)");
    return gained;
}

DamageReceipt Combatant::takeDamage(int32_t amount) {
    DamageReceipt receipt;
    receipt.raw = std::max<int32_t>(amount, 0);
    receipt.applied = receipt.raw;

    if (defending_ && receipt.raw > 0) {
        receipt.applied = ActionResolver::mitigateDamage(
            receipt.raw, stats_.defense, defenseConstant_);
        receipt.mitigated = true;
    }

    currentHp_ = std::clamp(currentHp_ - receipt.applied, 0, stats_.maxHp);
    receipt.defeated = currentHp_ <= 0;
    return receipt;
}

int32_t Combatant::heal(int32_t amount) {
    int32_t restored = std::min(std::max<int32_t>(amount, 0), missingHp());
    currentHp_ += restored;
    return restored;
}

void Combatant::recalculate() {
    stats_ = StatScaler::compute(level_, profile_);
    currentHp_ = std::min(currentHp_, stats_.maxHp);
}

} // namespace duel::battle
