#pragma once

#include "mining_config.hpp"
#include "token_amount.hpp"

namespace hm {

struct ReserveBreakdown {
    Amount worstCaseBase = 0;
    Amount expectedReferralLoad = 0;
    Amount requiredReserve = 0;
    bool saturated = false;
};

// Reserve the reward treasury must hold before admitting sessions whose
// stakes sum to totalActiveStake. Monotonic non-decreasing in the stake and
// zero only for zero stake (or a zero reward curve). Values beyond the amount
// range saturate at kMaxAmount.
ReserveBreakdown reserveBreakdown(Amount totalActiveStake, const MiningConfig& cfg);
Amount requiredReserve(Amount totalActiveStake, const MiningConfig& cfg);

// True when treasuryBalance covers the reserve for totalActiveStake.
bool isSolvent(Amount treasuryBalance, Amount totalActiveStake, const MiningConfig& cfg);

} // namespace hm
