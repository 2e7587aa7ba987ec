#pragma once

#include "identity.hpp"
#include "mining_config.hpp"
#include "session_ledger.hpp"
#include "token_amount.hpp"

#include <cstdint>
#include <optional>

namespace hm {

struct StreakOutcome {
    std::uint32_t newCount = 1;
    Amount bonus = 0;
    bool maintained = false;
};

struct RewardBreakdown {
    std::uint32_t rewardLevel = 0;
    Amount baseReward = 0;     // per stake unit at rewardLevel
    Amount payout = 0;         // stake-adjusted reward, before bonuses
    Amount referralBonus = 0;
    Amount streakBonus = 0;
    std::uint32_t newStreakCount = 1;
    bool referralApplied = false;

    Amount total() const { return checkedAdd(checkedAdd(payout, referralBonus), streakBonus); }
};

// Everything the engine reads for one close, captured at the serialization point.
struct RewardInputs {
    Address caller;
    SessionRecord session;
    // Start of the referred participant's most recent session, if any.
    std::optional<Timestamp> referralTargetOpenedAt;
    StreakRecord streak;
    // Active sessions including the one being closed.
    std::uint64_t activeSessions = 0;
    Timestamp now = 0;
};

struct RewardRange {
    Amount minimum = 0;
    Amount maximum = 0;
};

// Levels cycle through [0, levelCount) as participation grows.
std::uint32_t rewardLevel(std::uint64_t activeSessions, const MiningConfig& cfg);
Amount baseRewardForLevel(std::uint32_t level, const MiningConfig& cfg);
// baseReward * stakedAmount / STAKE_UNIT, floored.
Amount stakeAdjustedReward(Amount baseReward, Amount stakedAmount);

// True iff the referred start lies strictly inside (openedAt, openedAt + cooldown)
// and the target is somebody other than the caller.
bool isReferralEligible(const Address& caller,
                        const std::optional<Address>& referralTarget,
                        Timestamp openedAt,
                        std::optional<Timestamp> targetOpenedAt,
                        Timestamp cooldown);

StreakOutcome evaluateStreak(const StreakRecord& streak, Timestamp now, const MiningConfig& cfg);

RewardBreakdown computeReward(const RewardInputs& inputs, const MiningConfig& cfg);

// Smallest and largest amount a close could pay for this stake under cfg.
RewardRange estimateRewardRange(Amount stake, const MiningConfig& cfg);

} // namespace hm
