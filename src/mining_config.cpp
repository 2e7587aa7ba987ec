#include "mining_config.hpp"

#include "mining_errors.hpp"

#include <cstdlib>
#include <optional>
#include <sstream>

namespace hm {

namespace {

[[noreturn]] void invalidConfig(const std::string& message) {
    throw MiningError(MiningErrorCode::InvalidConfiguration, message);
}

std::optional<std::string> readEnv(const char* name) {
    const char* env = std::getenv(name);
    if (env == nullptr) {
        return std::nullopt;
    }
    std::string value = trimWhitespace(env);
    if (value.empty()) {
        return std::nullopt;
    }
    return value;
}

std::uint64_t parseUnsigned(const char* name, const std::string& text) {
    try {
        std::size_t consumed = 0;
        unsigned long long parsed = std::stoull(text, &consumed, 10);
        if (consumed != text.size() || text.front() == '-') {
            invalidConfig(std::string(name) + " is not an unsigned integer: " + text);
        }
        return parsed;
    } catch (const std::logic_error&) {
        invalidConfig(std::string(name) + " is not an unsigned integer: " + text);
    }
}

std::uint32_t parseBps(const char* name, const std::string& text) {
    std::uint64_t value = parseUnsigned(name, text);
    if (value > kBasisPoints) {
        invalidConfig(std::string(name) + " exceeds 10000 basis points");
    }
    return static_cast<std::uint32_t>(value);
}

Amount parseAmount(const char* name, const std::string& text) {
    try {
        return parseTokenAmount(text);
    } catch (const std::exception& ex) {
        invalidConfig(std::string(name) + ": " + ex.what());
    }
}

template <typename T>
std::string render(const T& value) {
    std::ostringstream oss;
    oss << value;
    return oss.str();
}

} // namespace

void MiningConfig::validate() const {
    if (stakeMax == 0) {
        invalidConfig("stakeMax must be positive");
    }
    if (stakeMin > stakeMax) {
        invalidConfig("stakeMin must not exceed stakeMax");
    }
    if (levelCount < 1) {
        invalidConfig("levelCount must be at least 1");
    }
    if (referralBonusBps > kBasisPoints) {
        invalidConfig("referralBonusBps must not exceed 10000");
    }
    if (cooldown == 0) {
        invalidConfig("cooldown must be positive");
    }
    if (expectedReferralShareBps >= kBasisPoints) {
        invalidConfig("expectedReferralShareBps must be below 10000");
    }
    if (safetyDiscountBps == 0 || safetyDiscountBps >= kBasisPoints) {
        invalidConfig("safetyDiscountBps must be in (0, 10000)");
    }
    unsigned __int128 topLevelReward =
        static_cast<unsigned __int128>(minReward) +
        static_cast<unsigned __int128>(perLevelBonus) * static_cast<unsigned __int128>(levelCount - 1);
    if (topLevelReward > static_cast<unsigned __int128>(kMaxAmount)) {
        invalidConfig("reward curve exceeds the token amount range at the top level");
    }
}

MiningConfig loadConfigFromEnvironment(MiningConfig base) {
    if (auto v = readEnv("HM_STAKE_MIN")) {
        base.stakeMin = parseAmount("HM_STAKE_MIN", *v);
    }
    if (auto v = readEnv("HM_STAKE_MAX")) {
        base.stakeMax = parseAmount("HM_STAKE_MAX", *v);
    }
    if (auto v = readEnv("HM_MIN_REWARD")) {
        base.minReward = parseAmount("HM_MIN_REWARD", *v);
    }
    if (auto v = readEnv("HM_PER_LEVEL_BONUS")) {
        base.perLevelBonus = parseAmount("HM_PER_LEVEL_BONUS", *v);
    }
    if (auto v = readEnv("HM_LEVEL_COUNT")) {
        std::uint64_t levels = parseUnsigned("HM_LEVEL_COUNT", *v);
        if (levels > 0xFFFFFFFFULL) {
            invalidConfig("HM_LEVEL_COUNT is out of range");
        }
        base.levelCount = static_cast<std::uint32_t>(levels);
    }
    if (auto v = readEnv("HM_REFERRAL_BONUS_BPS")) {
        base.referralBonusBps = parseBps("HM_REFERRAL_BONUS_BPS", *v);
    }
    if (auto v = readEnv("HM_COOLDOWN")) {
        base.cooldown = parseUnsigned("HM_COOLDOWN", *v);
    }
    if (auto v = readEnv("HM_STREAK_WINDOW")) {
        base.streakWindow = parseUnsigned("HM_STREAK_WINDOW", *v);
    }
    if (auto v = readEnv("HM_STREAK_BONUS")) {
        base.streakBonus = parseAmount("HM_STREAK_BONUS", *v);
    }
    if (auto v = readEnv("HM_EXPECTED_REFERRAL_SHARE_BPS")) {
        base.expectedReferralShareBps = parseBps("HM_EXPECTED_REFERRAL_SHARE_BPS", *v);
    }
    if (auto v = readEnv("HM_SAFETY_DISCOUNT_BPS")) {
        base.safetyDiscountBps = parseBps("HM_SAFETY_DISCOUNT_BPS", *v);
    }
    base.validate();
    return base;
}

ProofScope loadProofScopeFromEnvironment() {
    ProofScope scope;
    auto appId = readEnv("HM_APP_ID");
    if (!appId) {
        invalidConfig("HM_APP_ID must be set to a deployment-specific application id");
    }
    if (*appId == "default") {
        invalidConfig("HM_APP_ID cannot be \"default\"; use a value such as \"app_mainnet\"");
    }
    scope.appId = *appId;
    if (auto action = readEnv("HM_ACTION_ID")) {
        scope.action = *action;
    }
    if (auto group = readEnv("HM_GROUP_ID")) {
        scope.groupId = parseUnsigned("HM_GROUP_ID", *group);
    }
    return scope;
}

ConfigurationStore::ConfigurationStore(Address administrator, MiningConfig initial)
    : administrator_(normalizeAddress(administrator))
    , config_(initial) {
    config_.validate();
}

void ConfigurationStore::requireAdministrator(const Address& caller) const {
    if (normalizeAddress(caller) != administrator_) {
        throw MiningError(MiningErrorCode::Unauthorized, caller + " is not the administrator");
    }
}

void ConfigurationStore::apply(const MiningConfig& candidate,
                               const std::string& field,
                               const std::string& value) {
    candidate.validate();
    const MiningConfig previous = config_;
    config_ = candidate;
    if (!onChange_) {
        return;
    }
    try {
        onChange_(field, value);
    } catch (...) {
        config_ = previous;
        throw;
    }
}

void ConfigurationStore::setStakeBounds(const Address& caller, Amount stakeMin, Amount stakeMax) {
    requireAdministrator(caller);
    MiningConfig next = config_;
    next.stakeMin = stakeMin;
    next.stakeMax = stakeMax;
    apply(next, "stakeBounds", formatTokenAmount(stakeMin) + ".." + formatTokenAmount(stakeMax));
}

void ConfigurationStore::setRewardCurve(const Address& caller,
                                        Amount minReward,
                                        Amount perLevelBonus,
                                        std::uint32_t levelCount) {
    requireAdministrator(caller);
    MiningConfig next = config_;
    next.minReward = minReward;
    next.perLevelBonus = perLevelBonus;
    next.levelCount = levelCount;
    apply(next,
          "rewardCurve",
          formatTokenAmount(minReward) + "+" + formatTokenAmount(perLevelBonus) + "x" + render(levelCount));
}

void ConfigurationStore::setReferralBonusBps(const Address& caller, std::uint32_t bps) {
    requireAdministrator(caller);
    MiningConfig next = config_;
    next.referralBonusBps = bps;
    apply(next, "referralBonusBps", render(bps));
}

void ConfigurationStore::setCooldown(const Address& caller, Timestamp cooldown) {
    requireAdministrator(caller);
    MiningConfig next = config_;
    next.cooldown = cooldown;
    apply(next, "cooldown", render(cooldown));
}

void ConfigurationStore::setStreakPolicy(const Address& caller, Timestamp window, Amount bonus) {
    requireAdministrator(caller);
    MiningConfig next = config_;
    next.streakWindow = window;
    next.streakBonus = bonus;
    apply(next, "streakPolicy", render(window) + "s/" + formatTokenAmount(bonus));
}

void ConfigurationStore::setReservePolicy(const Address& caller,
                                          std::uint32_t expectedReferralShareBps,
                                          std::uint32_t safetyDiscountBps) {
    requireAdministrator(caller);
    MiningConfig next = config_;
    next.expectedReferralShareBps = expectedReferralShareBps;
    next.safetyDiscountBps = safetyDiscountBps;
    apply(next, "reservePolicy", render(expectedReferralShareBps) + "/" + render(safetyDiscountBps));
}

void ConfigurationStore::transferAdministration(const Address& caller, const Address& successor) {
    requireAdministrator(caller);
    const Address previous = administrator_;
    administrator_ = normalizeAddress(successor);
    if (!onChange_) {
        return;
    }
    try {
        onChange_("administrator", administrator_);
    } catch (...) {
        administrator_ = previous;
        throw;
    }
}

} // namespace hm
