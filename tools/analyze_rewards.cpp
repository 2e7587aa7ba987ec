#include "mining_config.hpp"
#include "reward_engine.hpp"
#include "solvency_guard.hpp"

#include <iomanip>
#include <iostream>
#include <vector>

int main() {
    hm::MiningConfig cfg;
    try {
        cfg = hm::loadConfigFromEnvironment();
    } catch (const std::exception& ex) {
        std::cerr << ex.what() << "\n";
        return 1;
    }

    std::cout << "=== REWARD CURVE (per stake unit) ===\n";
    std::cout << "Levels: " << cfg.levelCount << "  referral bonus: " << (cfg.referralBonusBps / 100.0)
              << "%  streak bonus: " << hm::formatTokenAmount(cfg.streakBonus) << "\n\n";
    const std::uint32_t shown = cfg.levelCount < 20 ? cfg.levelCount : 20;
    for (std::uint32_t level = 0; level < shown; ++level) {
        hm::Amount base = hm::baseRewardForLevel(level, cfg);
        hm::Amount withReferral = hm::checkedAdd(base, hm::applyBps(base, cfg.referralBonusBps));
        std::cout << "  level " << std::setw(3) << level << " : " << std::setw(12) << hm::formatTokenAmount(base)
                  << "  with referral " << std::setw(12) << hm::formatTokenAmount(withReferral) << '\n';
    }
    if (shown < cfg.levelCount) {
        std::cout << "  ... " << (cfg.levelCount - shown) << " more levels\n";
    }

    std::cout << "\n=== REWARD RANGE BY STAKE ===\n";
    for (hm::Amount stake : { cfg.stakeMin, hm::wholeTokens(10), cfg.stakeMax }) {
        auto range = hm::estimateRewardRange(stake, cfg);
        std::cout << "  stake " << std::setw(12) << hm::formatTokenAmount(stake) << " : "
                  << hm::formatTokenAmount(range.minimum) << " .. " << hm::formatTokenAmount(range.maximum) << '\n';
    }

    std::cout << "\n=== RESERVE TABLE ===\n";
    std::cout << "Expected referral share: " << (cfg.expectedReferralShareBps / 100.0)
              << "%  safety discount: " << (cfg.safetyDiscountBps / 100.0) << "%\n";
    const std::vector<hm::Amount> totals{ hm::wholeTokens(1),       hm::wholeTokens(100),
                                          hm::wholeTokens(10'000),  hm::wholeTokens(1'000'000),
                                          hm::wholeTokens(100'000'000) };
    for (hm::Amount total : totals) {
        auto breakdown = hm::reserveBreakdown(total, cfg);
        std::cout << "  active stake " << std::setw(14) << hm::formatTokenAmount(total) << " : worst case "
                  << std::setw(16) << hm::formatTokenAmount(breakdown.worstCaseBase) << "  referral load "
                  << std::setw(14) << hm::formatTokenAmount(breakdown.expectedReferralLoad) << "  required "
                  << std::setw(16) << hm::formatTokenAmount(breakdown.requiredReserve)
                  << (breakdown.saturated ? "  (saturated)" : "") << '\n';
    }

    return 0;
}
