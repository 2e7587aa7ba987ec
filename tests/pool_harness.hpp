#pragma once

#include "identity_verifier.hpp"
#include "ledger_clock.hpp"
#include "mining_errors.hpp"
#include "mining_pool.hpp"
#include "token_ledger.hpp"

#include <cstdlib>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

namespace hm::test {

[[noreturn]] inline void fail(const std::string& suite, const std::string& msg) {
    std::cerr << suite << " failure: " << msg << std::endl;
    std::exit(1);
}

inline void expect(bool condition, const std::string& suite, const std::string& msg) {
    if (!condition) {
        fail(suite, msg);
    }
}

// Runs fn and requires it to throw a MiningError with the given code.
inline void expectError(MiningErrorCode code,
                        const std::function<void()>& fn,
                        const std::string& suite,
                        const std::string& msg) {
    try {
        fn();
    } catch (const MiningError& ex) {
        if (ex.code() != code) {
            fail(suite, msg + " (got " + errorCodeName(ex.code()) + ", wanted " + errorCodeName(code) + ")");
        }
        return;
    }
    fail(suite, msg + " (no error, wanted " + errorCodeName(code) + ")");
}

// Accepts proofs whose payload is "ok" and records what it was asked.
class ScriptedVerifier : public IdentityProofVerifier {
public:
    bool verify(const std::string& root,
                std::uint64_t groupId,
                const std::string& signal,
                const IdentityFingerprint& fingerprint,
                const std::string& scope,
                const std::string& proof) override {
        (void)root;
        (void)groupId;
        (void)fingerprint;
        ++calls;
        lastSignal = signal;
        lastScope = scope;
        return proof == "ok";
    }

    int calls = 0;
    std::string lastSignal;
    std::string lastScope;
};

constexpr Timestamp kGenesis = 1'700'000'000;
constexpr Timestamp kHour = 60 * 60;
constexpr Timestamp kDay = 24 * kHour;

struct PoolHarness {
    static constexpr const char* kPoolAddress = "0xpool";
    static constexpr const char* kAdmin = "0xadmin";

    std::shared_ptr<InMemoryTokenLedger> stakeToken;
    std::shared_ptr<InMemoryTokenLedger> rewardToken;
    std::shared_ptr<ScriptedVerifier> verifier = std::make_shared<ScriptedVerifier>();
    std::shared_ptr<ManualClock> clock = std::make_shared<ManualClock>(kGenesis);
    std::unique_ptr<MiningPool> pool;

    explicit PoolHarness(MiningConfig cfg = {},
                         Amount treasury = wholeTokens(1'000'000),
                         std::shared_ptr<InMemoryTokenLedger> stake = nullptr)
        : stakeToken(stake ? std::move(stake) : std::make_shared<InMemoryTokenLedger>("SPEND"))
        , rewardToken(std::make_shared<InMemoryTokenLedger>("MINE")) {
        rewardToken->mint(kPoolAddress, treasury);
        MiningPoolDeps deps;
        deps.poolAddress = kPoolAddress;
        deps.stakeToken = stakeToken;
        deps.rewardToken = rewardToken;
        deps.verifier = verifier;
        deps.clock = clock;
        deps.scope = ProofScope{ "app_test", "mine", 1 };
        pool = std::make_unique<MiningPool>(std::move(deps), kAdmin, cfg);
    }

    Address participant(const std::string& name, Amount funds = wholeTokens(10'000)) {
        Address who = "0x" + name;
        stakeToken->mint(who, funds);
        stakeToken->approve(who, kPoolAddress, kMaxAmount);
        return who;
    }

    static IdentityProof proofFor(const Address& who) {
        return IdentityProof{ "root", "fp-" + who, "ok" };
    }

    SessionOpened open(const Address& who,
                       Amount amount = wholeTokens(1),
                       const std::optional<Address>& referral = std::nullopt) {
        return pool->openSession(who, proofFor(who), referral, amount);
    }
};

} // namespace hm::test
