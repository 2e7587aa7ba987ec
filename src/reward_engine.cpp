#include "reward_engine.hpp"

#include <limits>
#include <stdexcept>

namespace hm {

std::uint32_t rewardLevel(std::uint64_t activeSessions, const MiningConfig& cfg) {
    if (cfg.levelCount == 0) {
        throw std::invalid_argument("levelCount must be at least 1");
    }
    if (activeSessions == 0) {
        return 0;
    }
    return static_cast<std::uint32_t>((activeSessions - 1) % cfg.levelCount);
}

Amount baseRewardForLevel(std::uint32_t level, const MiningConfig& cfg) {
    return checkedAdd(cfg.minReward, mulDiv(cfg.perLevelBonus, level, 1));
}

Amount stakeAdjustedReward(Amount baseReward, Amount stakedAmount) {
    return mulDiv(baseReward, stakedAmount, kStakeUnit);
}

bool isReferralEligible(const Address& caller,
                        const std::optional<Address>& referralTarget,
                        Timestamp openedAt,
                        std::optional<Timestamp> targetOpenedAt,
                        Timestamp cooldown) {
    if (!referralTarget || referralTarget->empty() || *referralTarget == caller) {
        return false;
    }
    if (openedAt == 0 || !targetOpenedAt) {
        return false;
    }
    const unsigned __int128 windowEnd =
        static_cast<unsigned __int128>(openedAt) + static_cast<unsigned __int128>(cooldown);
    return *targetOpenedAt > openedAt && static_cast<unsigned __int128>(*targetOpenedAt) < windowEnd;
}

StreakOutcome evaluateStreak(const StreakRecord& streak, Timestamp now, const MiningConfig& cfg) {
    StreakOutcome outcome;
    if (streak.lastFinishedAt == 0) {
        return outcome;
    }
    Timestamp elapsed = flooredSub(now, streak.lastFinishedAt);
    if (elapsed > cfg.streakWindow) {
        return outcome;
    }
    outcome.maintained = true;
    outcome.bonus = cfg.streakBonus;
    outcome.newCount = (streak.consecutiveCount == std::numeric_limits<std::uint32_t>::max())
                           ? streak.consecutiveCount
                           : streak.consecutiveCount + 1;
    return outcome;
}

RewardBreakdown computeReward(const RewardInputs& inputs, const MiningConfig& cfg) {
    RewardBreakdown out;
    out.rewardLevel = rewardLevel(inputs.activeSessions, cfg);
    out.baseReward = baseRewardForLevel(out.rewardLevel, cfg);
    out.payout = stakeAdjustedReward(out.baseReward, inputs.session.stakedAmount);

    out.referralApplied = isReferralEligible(inputs.caller,
                                             inputs.session.referralTarget,
                                             inputs.session.openedAt,
                                             inputs.referralTargetOpenedAt,
                                             cfg.cooldown);
    if (out.referralApplied) {
        out.referralBonus = applyBps(out.payout, cfg.referralBonusBps);
    }

    StreakOutcome streak = evaluateStreak(inputs.streak, inputs.now, cfg);
    out.streakBonus = streak.bonus;
    out.newStreakCount = streak.newCount;
    return out;
}

RewardRange estimateRewardRange(Amount stake, const MiningConfig& cfg) {
    RewardRange range;
    range.minimum = stakeAdjustedReward(baseRewardForLevel(0, cfg), stake);
    Amount top = stakeAdjustedReward(baseRewardForLevel(cfg.levelCount - 1, cfg), stake);
    range.maximum = checkedAdd(checkedAdd(top, applyBps(top, cfg.referralBonusBps)), cfg.streakBonus);
    return range;
}

} // namespace hm
