#include "identity_verifier.hpp"
#include "ledger_clock.hpp"
#include "mining_config.hpp"
#include "mining_errors.hpp"
#include "mining_pool.hpp"
#include "token_ledger.hpp"

#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace hm;

namespace {

const Address kPoolAddress = "0xpool";
const Address kOperator = "0xoperator";

struct Simulator {
    std::shared_ptr<InMemoryTokenLedger> stakeToken = std::make_shared<InMemoryTokenLedger>("SPEND");
    std::shared_ptr<InMemoryTokenLedger> rewardToken = std::make_shared<InMemoryTokenLedger>("MINE");
    std::shared_ptr<ManualClock> clock;
    Attestor attestor;
    ProofScope scope;
    std::unique_ptr<MiningPool> pool;
};

ProofScope scopeFromEnvironmentOr(const std::string& fallbackAppId) {
    if (std::getenv("HM_APP_ID") != nullptr) {
        return loadProofScopeFromEnvironment();
    }
    ProofScope scope;
    scope.appId = fallbackAppId;
    return scope;
}

void printHelp() {
    std::cout << "Commands:\n"
              << "  fund <who> <amount>             mint stake tokens and approve the pool\n"
              << "  open <who> <amount> [referral]  open a mining session\n"
              << "  close <who>                     close a session and collect the reward\n"
              << "  advance <hours>                 move the simulated clock forward\n"
              << "  status [who]                    pool state or one participant's session\n"
              << "  range <amount>                  reward range for a stake\n"
              << "  reserve <amount>                reserve required for a total active stake\n"
              << "  treasury <amount>               mint reward tokens into the treasury\n"
              << "  journal                         print the journal root and size\n"
              << "  help | quit\n";
}

void printStatus(const Simulator& sim, const std::string& who) {
    if (who.empty()) {
        auto state = sim.pool->poolState();
        std::cout << "Time " << sim.clock->now() << " | active sessions " << state.activeSessions << " | active stake "
                  << formatTokenAmount(state.activeStake) << " | treasury "
                  << formatTokenAmount(sim.pool->treasuryBalance()) << " | required reserve "
                  << formatTokenAmount(sim.pool->requiredReserve(state.activeStake)) << "\n";
        return;
    }
    auto view = sim.pool->session(who);
    std::cout << who << ": " << sessionPhaseName(sim.pool->sessionPhase(who)) << " | stake balance "
              << formatTokenAmount(sim.stakeToken->balanceOf(normalizeAddress(who))) << " | reward balance "
              << formatTokenAmount(sim.rewardToken->balanceOf(normalizeAddress(who)));
    if (view) {
        std::cout << " | staked " << formatTokenAmount(view->record.stakedAmount) << " | unlocks at "
                  << view->unlocksAt;
        if (view->record.referralTarget) {
            std::cout << " | referral " << *view->record.referralTarget
                      << (sim.pool->isReferralEligible(who) ? " (eligible)" : " (not yet eligible)");
        }
    }
    std::cout << "\n";
}

bool runCommand(Simulator& sim, const std::vector<std::string>& args) {
    const std::string& cmd = args.front();
    auto need = [&](std::size_t count) {
        if (args.size() < count) {
            throw std::invalid_argument("missing arguments for " + cmd + " (try help)");
        }
    };

    if (cmd == "quit" || cmd == "exit") {
        return false;
    }
    if (cmd == "help") {
        printHelp();
    } else if (cmd == "fund") {
        need(3);
        Address who = normalizeAddress(args[1]);
        sim.stakeToken->mint(who, parseTokenAmount(args[2]));
        sim.stakeToken->approve(who, kPoolAddress, kMaxAmount);
        std::cout << who << " now holds " << formatTokenAmount(sim.stakeToken->balanceOf(who)) << " "
                  << sim.stakeToken->symbol() << "\n";
    } else if (cmd == "open") {
        need(3);
        Address who = normalizeAddress(args[1]);
        std::optional<Address> referral;
        if (args.size() >= 4) {
            referral = args[3];
        }
        auto fingerprint = Attestor::fingerprintFor(who, sim.scope);
        auto proof = sim.attestor.attest(who, fingerprint, sim.scope);
        sim.pool->openSession(who, proof, referral, parseTokenAmount(args[2]));
    } else if (cmd == "close") {
        need(2);
        sim.pool->closeSession(args[1]);
    } else if (cmd == "advance") {
        need(2);
        sim.clock->advance(parseHoursAsSeconds(args[1]));
        std::cout << "Clock now " << sim.clock->now() << "\n";
    } else if (cmd == "status") {
        printStatus(sim, args.size() >= 2 ? args[1] : std::string());
    } else if (cmd == "range") {
        need(2);
        auto range = sim.pool->estimateRewardRange(parseTokenAmount(args[1]));
        std::cout << "Reward range: " << formatTokenAmount(range.minimum) << " .. "
                  << formatTokenAmount(range.maximum) << "\n";
    } else if (cmd == "reserve") {
        need(2);
        std::cout << "Required reserve: " << formatTokenAmount(sim.pool->requiredReserve(parseTokenAmount(args[1])))
                  << "\n";
    } else if (cmd == "treasury") {
        need(2);
        sim.rewardToken->mint(kPoolAddress, parseTokenAmount(args[1]));
        std::cout << "Treasury now " << formatTokenAmount(sim.pool->treasuryBalance()) << "\n";
    } else if (cmd == "journal") {
        const auto& journal = sim.pool->journal();
        std::cout << "Journal entries: " << journal.size() << "  root: " << journal.merkleRoot() << "\n";
    } else {
        std::cout << "Unknown command '" << cmd << "' (try help)\n";
    }
    return true;
}

} // namespace

int main() {
    Simulator sim;
    MiningConfig config;
    try {
        config = loadConfigFromEnvironment();
        sim.scope = scopeFromEnvironmentOr("local-simulator");
    } catch (const std::exception& ex) {
        std::cerr << ex.what() << "\n";
        return 1;
    }

    sim.clock = std::make_shared<ManualClock>(1'700'000'000);
    sim.rewardToken->mint(kPoolAddress, wholeTokens(10'000));

    MiningPoolDeps deps;
    deps.poolAddress = kPoolAddress;
    deps.stakeToken = sim.stakeToken;
    deps.rewardToken = sim.rewardToken;
    deps.verifier = std::make_shared<AttestorProofVerifier>(sim.attestor.publicKeyHex());
    deps.clock = sim.clock;
    deps.scope = sim.scope;
    sim.pool = std::make_unique<MiningPool>(std::move(deps), kOperator, config);
    sim.pool->setEventListener([](const MiningEvent& event) { std::cout << "[event] " << describeEvent(event) << "\n"; });

    std::cout << "HumanMine session simulator.\n";
    std::cout << "Attestor public key: " << sim.attestor.publicKeyHex() << "\n";
    std::cout << "Scope appId=" << sim.scope.appId << " action=" << sim.scope.action
              << " group=" << sim.scope.groupId << " (set HM_APP_ID/HM_ACTION_ID/HM_GROUP_ID to override)\n";
    std::cout << "Cooldown " << config.cooldown << "s, stake " << formatTokenAmount(config.stakeMin) << " .. "
              << formatTokenAmount(config.stakeMax) << ", " << config.levelCount << " reward levels\n";
    printHelp();

    std::string line;
    while (true) {
        std::cout << "> " << std::flush;
        if (!std::getline(std::cin, line)) {
            break;
        }
        std::istringstream iss(line);
        std::vector<std::string> args;
        for (std::string word; iss >> word;) {
            args.push_back(word);
        }
        if (args.empty()) {
            continue;
        }
        try {
            if (!runCommand(sim, args)) {
                break;
            }
        } catch (const MiningError& ex) {
            std::cout << "Rejected: " << ex.what();
            if (ex.retryable()) {
                std::cout << " (retry later)";
            }
            std::cout << "\n";
        } catch (const std::exception& ex) {
            std::cout << "Error: " << ex.what() << "\n";
        }
    }

    if (!sim.pool->isConsistent()) {
        std::cerr << "Pool aggregates diverged from session records\n";
        return 1;
    }
    std::cout << "Final journal root: " << sim.pool->journal().merkleRoot() << "\n";
    return 0;
}
