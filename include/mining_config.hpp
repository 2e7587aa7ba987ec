#pragma once

#include "identity.hpp"
#include "token_amount.hpp"

#include <cstdint>
#include <functional>
#include <string>

namespace hm {

struct MiningConfig {
    Amount stakeMin = wholeTokens(1);
    Amount stakeMax = wholeTokens(1'000);
    Amount minReward = 100'000;     // 0.1 reward token per stake unit
    Amount perLevelBonus = 90'000;  // 0.09 per level
    std::uint32_t levelCount = 10;
    std::uint32_t referralBonusBps = 1'000;
    Timestamp cooldown = 24 * 60 * 60;
    Timestamp streakWindow = 48 * 60 * 60;
    Amount streakBonus = 50'000;
    // Reserve sizing: share of sessions assumed to collect the referral bonus,
    // and the discount applied to the worst case. Both strictly below 100%.
    std::uint32_t expectedReferralShareBps = 5'000;
    std::uint32_t safetyDiscountBps = 9'000;

    // Throws MiningError(InvalidConfiguration) naming the first violated bound.
    void validate() const;
};

// Overlays HM_* environment variables onto base and validates the result.
MiningConfig loadConfigFromEnvironment(MiningConfig base = {});
// Reads HM_APP_ID, HM_ACTION_ID and HM_GROUP_ID; appId must be deployment specific.
ProofScope loadProofScopeFromEnvironment();

// Change notification: field name and new value rendered as text. A callback
// that throws vetoes the change.
using ConfigChangeCallback = std::function<void(const std::string& field, const std::string& value)>;

// Holds the live configuration and the single administrator allowed to change it.
class ConfigurationStore {
public:
    ConfigurationStore(Address administrator, MiningConfig initial);

    const MiningConfig& current() const { return config_; }
    const Address& administrator() const { return administrator_; }
    void onChange(ConfigChangeCallback callback) { onChange_ = std::move(callback); }

    void setStakeBounds(const Address& caller, Amount stakeMin, Amount stakeMax);
    void setRewardCurve(const Address& caller,
                        Amount minReward,
                        Amount perLevelBonus,
                        std::uint32_t levelCount);
    void setReferralBonusBps(const Address& caller, std::uint32_t bps);
    void setCooldown(const Address& caller, Timestamp cooldown);
    void setStreakPolicy(const Address& caller, Timestamp window, Amount bonus);
    void setReservePolicy(const Address& caller,
                          std::uint32_t expectedReferralShareBps,
                          std::uint32_t safetyDiscountBps);
    void transferAdministration(const Address& caller, const Address& successor);

private:
    void requireAdministrator(const Address& caller) const;
    void apply(const MiningConfig& candidate, const std::string& field, const std::string& value);

    Address administrator_;
    MiningConfig config_;
    ConfigChangeCallback onChange_;
};

} // namespace hm
