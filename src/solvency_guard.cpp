#include "solvency_guard.hpp"

#include <boost/multiprecision/cpp_int.hpp>

#include <stdexcept>

namespace mp = boost::multiprecision;

namespace hm {

namespace {

Amount saturate(const mp::cpp_int& value, bool& saturated) {
    if (value > mp::cpp_int(kMaxAmount)) {
        saturated = true;
        return kMaxAmount;
    }
    return value.convert_to<Amount>();
}

} // namespace

ReserveBreakdown reserveBreakdown(Amount totalActiveStake, const MiningConfig& cfg) {
    if (cfg.levelCount == 0) {
        throw std::invalid_argument("levelCount must be at least 1");
    }
    ReserveBreakdown out;
    if (totalActiveStake == 0) {
        return out;
    }

    // Every session paid at the top level.
    const mp::cpp_int topLevelReward =
        mp::cpp_int(cfg.minReward) + mp::cpp_int(cfg.perLevelBonus) * (cfg.levelCount - 1);
    const mp::cpp_int worstCaseBase = topLevelReward * totalActiveStake / kStakeUnit;

    // Only an expected share of sessions collects the referral bonus.
    const mp::cpp_int referralLoad = worstCaseBase * cfg.referralBonusBps * cfg.expectedReferralShareBps /
                                     (mp::cpp_int(kBasisPoints) * kBasisPoints);

    const mp::cpp_int required = (worstCaseBase + referralLoad) * cfg.safetyDiscountBps / kBasisPoints;

    out.worstCaseBase = saturate(worstCaseBase, out.saturated);
    out.expectedReferralLoad = saturate(referralLoad, out.saturated);
    out.requiredReserve = saturate(required, out.saturated);
    return out;
}

Amount requiredReserve(Amount totalActiveStake, const MiningConfig& cfg) {
    return reserveBreakdown(totalActiveStake, cfg).requiredReserve;
}

bool isSolvent(Amount treasuryBalance, Amount totalActiveStake, const MiningConfig& cfg) {
    return treasuryBalance >= requiredReserve(totalActiveStake, cfg);
}

} // namespace hm
