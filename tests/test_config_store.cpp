#include "mining_config.hpp"

#include "pool_harness.hpp"

#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

const std::string kSuite = "config_store_test";
const hm::Address kAdmin = "0xAdmin";

void expect(bool condition, const std::string& msg) {
    hm::test::expect(condition, kSuite, msg);
}

void expectError(hm::MiningErrorCode code, const std::function<void()>& fn, const std::string& msg) {
    hm::test::expectError(code, fn, kSuite, msg);
}

void clearEnvironment() {
    for (const char* name : { "HM_STAKE_MIN",
                              "HM_STAKE_MAX",
                              "HM_MIN_REWARD",
                              "HM_PER_LEVEL_BONUS",
                              "HM_LEVEL_COUNT",
                              "HM_REFERRAL_BONUS_BPS",
                              "HM_COOLDOWN",
                              "HM_STREAK_WINDOW",
                              "HM_STREAK_BONUS",
                              "HM_EXPECTED_REFERRAL_SHARE_BPS",
                              "HM_SAFETY_DISCOUNT_BPS",
                              "HM_APP_ID",
                              "HM_ACTION_ID",
                              "HM_GROUP_ID" }) {
        unsetenv(name);
    }
}

void defaultsAreValid() {
    hm::MiningConfig cfg;
    cfg.validate();
    expect(cfg.stakeMin <= cfg.stakeMax, "default stake bounds ordered");
    expect(cfg.levelCount >= 1, "default curve has a level");
}

void constructorRejectsInconsistentConfig() {
    hm::MiningConfig bad;
    bad.stakeMin = bad.stakeMax + 1;
    expectError(hm::MiningErrorCode::InvalidConfiguration,
                [&] { hm::ConfigurationStore store(kAdmin, bad); },
                "store refuses stakeMin > stakeMax");

    hm::MiningConfig noLevels;
    noLevels.levelCount = 0;
    expectError(hm::MiningErrorCode::InvalidConfiguration,
                [&] { noLevels.validate(); },
                "levelCount 0 rejected");

    hm::MiningConfig overflowCurve;
    overflowCurve.perLevelBonus = hm::kMaxAmount / 2;
    expectError(hm::MiningErrorCode::InvalidConfiguration,
                [&] { overflowCurve.validate(); },
                "curve overflowing the amount range rejected");
}

void settersAreAdministratorOnly() {
    hm::ConfigurationStore store(kAdmin, hm::MiningConfig{});
    expectError(hm::MiningErrorCode::Unauthorized,
                [&] { store.setCooldown("0xmallory", 10); },
                "non-administrator cannot set the cooldown");
    expectError(hm::MiningErrorCode::Unauthorized,
                [&] { store.setRewardCurve("0xmallory", 1, 1, 1); },
                "non-administrator cannot set the reward curve");

    store.setCooldown("0xadmin", 600);
    expect(store.current().cooldown == 600, "administrator address matched case-insensitively");
}

void settersValidateBeforeApplying() {
    hm::ConfigurationStore store(kAdmin, hm::MiningConfig{});
    const hm::MiningConfig before = store.current();

    expectError(hm::MiningErrorCode::InvalidConfiguration,
                [&] { store.setStakeBounds(kAdmin, hm::wholeTokens(5), hm::wholeTokens(4)); },
                "inverted stake bounds rejected");
    expect(store.current().stakeMin == before.stakeMin && store.current().stakeMax == before.stakeMax,
           "rejected bounds leave the old bounds");

    expectError(hm::MiningErrorCode::InvalidConfiguration,
                [&] { store.setRewardCurve(kAdmin, 1, 1, 0); },
                "zero levels rejected");
    expectError(hm::MiningErrorCode::InvalidConfiguration,
                [&] { store.setReferralBonusBps(kAdmin, 10'001); },
                "referral bonus above 100% rejected");
    expectError(hm::MiningErrorCode::InvalidConfiguration,
                [&] { store.setCooldown(kAdmin, 0); },
                "zero cooldown rejected");
    expectError(hm::MiningErrorCode::InvalidConfiguration,
                [&] { store.setReservePolicy(kAdmin, 5'000, 10'000); },
                "safety discount must stay below 100%");
    expectError(hm::MiningErrorCode::InvalidConfiguration,
                [&] { store.setReservePolicy(kAdmin, 10'000, 9'000); },
                "expected referral share must stay below 100%");

    store.setStakeBounds(kAdmin, hm::wholeTokens(2), hm::wholeTokens(2));
    store.setRewardCurve(kAdmin, 200'000, 0, 1);
    store.setStreakPolicy(kAdmin, 3'600, 1);
    expect(store.current().stakeMin == hm::wholeTokens(2), "equal stake bounds accepted");
    expect(store.current().levelCount == 1 && store.current().minReward == 200'000, "flat curve accepted");
    expect(store.current().streakWindow == 3'600 && store.current().streakBonus == 1, "streak policy applied");
}

void administrationCanBeHandedOver() {
    hm::ConfigurationStore store(kAdmin, hm::MiningConfig{});
    std::vector<std::string> fields;
    store.onChange([&](const std::string& field, const std::string&) { fields.push_back(field); });

    store.setReferralBonusBps(kAdmin, 500);
    store.transferAdministration(kAdmin, "0xSuccessor");
    expect(store.administrator() == "0xsuccessor", "successor stored normalized");
    expectError(hm::MiningErrorCode::Unauthorized,
                [&] { store.setReferralBonusBps(kAdmin, 600); },
                "previous administrator loses rights");
    store.setReferralBonusBps("0xsuccessor", 600);
    expect(store.current().referralBonusBps == 600, "successor can change settings");

    expect(fields.size() == 3, "every applied change is reported");
    expect(fields[0] == "referralBonusBps" && fields[1] == "administrator", "changes reported in order");
}

void environmentOverlaysDefaults() {
    clearEnvironment();
    setenv("HM_STAKE_MIN", " 2.5 ", 1);
    setenv("HM_STAKE_MAX", "40", 1);
    setenv("HM_LEVEL_COUNT", "5", 1);
    setenv("HM_COOLDOWN", "3600", 1);
    setenv("HM_MIN_REWARD", "0.25", 1);
    auto cfg = hm::loadConfigFromEnvironment();
    expect(cfg.stakeMin == 2'500'000, "decimal stake minimum parsed");
    expect(cfg.stakeMax == hm::wholeTokens(40), "whole stake maximum parsed");
    expect(cfg.levelCount == 5 && cfg.cooldown == 3'600, "integer settings parsed");
    expect(cfg.minReward == 250'000, "reward parsed in micro-units");
    expect(cfg.perLevelBonus == hm::MiningConfig{}.perLevelBonus, "unset variables keep defaults");

    setenv("HM_LEVEL_COUNT", "ten", 1);
    expectError(hm::MiningErrorCode::InvalidConfiguration,
                [] { hm::loadConfigFromEnvironment(); },
                "non-numeric level count rejected");
    setenv("HM_LEVEL_COUNT", "5", 1);
    setenv("HM_REFERRAL_BONUS_BPS", "12000", 1);
    expectError(hm::MiningErrorCode::InvalidConfiguration,
                [] { hm::loadConfigFromEnvironment(); },
                "basis points above 10000 rejected");
    unsetenv("HM_REFERRAL_BONUS_BPS");
    setenv("HM_STAKE_MIN", "50", 1);
    expectError(hm::MiningErrorCode::InvalidConfiguration,
                [] { hm::loadConfigFromEnvironment(); },
                "environment producing stakeMin > stakeMax rejected");
    clearEnvironment();
}

void proofScopeRequiresDeploymentAppId() {
    clearEnvironment();
    expectError(hm::MiningErrorCode::InvalidConfiguration,
                [] { hm::loadProofScopeFromEnvironment(); },
                "missing HM_APP_ID rejected");
    setenv("HM_APP_ID", "default", 1);
    expectError(hm::MiningErrorCode::InvalidConfiguration,
                [] { hm::loadProofScopeFromEnvironment(); },
                "placeholder app id rejected");
    setenv("HM_APP_ID", "app_staging", 1);
    setenv("HM_ACTION_ID", "mine-v2", 1);
    setenv("HM_GROUP_ID", "0", 1);
    auto scope = hm::loadProofScopeFromEnvironment();
    expect(scope.appId == "app_staging" && scope.action == "mine-v2" && scope.groupId == 0,
           "scope read from the environment");
    clearEnvironment();
}

void tokenAmountsRoundTripThroughText() {
    expect(hm::parseTokenAmount("0.1") == 100'000, "0.1 is 100000 micro-units");
    expect(hm::parseTokenAmount("12") == hm::wholeTokens(12), "whole tokens parsed");
    expect(hm::parseTokenAmount("3.000250") == 3'000'250, "six decimals parsed");
    expect(hm::parseTokenAmount(".5") == 500'000, "leading dot parsed");
    expect(hm::formatTokenAmount(100'000) == "0.1", "trailing zeros trimmed");
    expect(hm::formatTokenAmount(hm::wholeTokens(12)) == "12", "whole amounts print without a dot");
    expect(hm::formatTokenAmount(3'000'250) == "3.00025", "inner zeros kept");

    bool rejected = false;
    try {
        hm::parseTokenAmount("1.2345678");
    } catch (const std::invalid_argument&) {
        rejected = true;
    }
    expect(rejected, "seven decimals rejected");
    rejected = false;
    try {
        hm::parseTokenAmount("-1");
    } catch (const std::invalid_argument&) {
        rejected = true;
    }
    expect(rejected, "negative amounts rejected");
}

void throwingCallbackVetoesChange() {
    hm::ConfigurationStore store(kAdmin, hm::MiningConfig{});
    const hm::Timestamp cooldownBefore = store.current().cooldown;
    store.onChange([](const std::string& field, const std::string&) {
        throw std::runtime_error("cannot record " + field);
    });

    bool vetoed = false;
    try {
        store.setCooldown(kAdmin, 60);
    } catch (const std::runtime_error&) {
        vetoed = true;
    }
    expect(vetoed, "callback failure reaches the setter's caller");
    expect(store.current().cooldown == cooldownBefore, "vetoed setting keeps the previous value");

    vetoed = false;
    try {
        store.transferAdministration(kAdmin, "0xsuccessor");
    } catch (const std::runtime_error&) {
        vetoed = true;
    }
    expect(vetoed, "callback failure vetoes the hand-over");
    expect(store.administrator() == "0xadmin", "vetoed hand-over keeps the administrator");

    store.onChange(nullptr);
    store.setCooldown(kAdmin, 60);
    expect(store.current().cooldown == 60, "change applies once the callback accepts it");
}

void hoursParseIntoSeconds() {
    expect(hm::parseHoursAsSeconds("2") == 7'200, "two hours are 7200 seconds");
    expect(hm::parseHoursAsSeconds("0") == 0, "zero hours accepted");
    for (const std::string& text : { std::string("-1"), std::string("abc"), std::string(""), std::string("1.5"),
                                     std::string("99999999999999999999"), std::string("5124095576030432") }) {
        bool rejected = false;
        try {
            hm::parseHoursAsSeconds(text);
        } catch (const std::invalid_argument&) {
            rejected = true;
        }
        expect(rejected, "hours text rejected: '" + text + "'");
    }
}

} // namespace

int main() {
    defaultsAreValid();
    constructorRejectsInconsistentConfig();
    settersAreAdministratorOnly();
    settersValidateBeforeApplying();
    administrationCanBeHandedOver();
    environmentOverlaysDefaults();
    proofScopeRequiresDeploymentAppId();
    tokenAmountsRoundTripThroughText();
    throwingCallbackVetoesChange();
    hoursParseIntoSeconds();
    std::cout << kSuite << " passed" << std::endl;
    return 0;
}
