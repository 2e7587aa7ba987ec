#pragma once

#include "event_journal.hpp"
#include "identity.hpp"
#include "identity_verifier.hpp"
#include "ledger_clock.hpp"
#include "mining_config.hpp"
#include "mining_events.hpp"
#include "reward_engine.hpp"
#include "session_ledger.hpp"
#include "solvency_guard.hpp"
#include "token_ledger.hpp"

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace hm {

struct MiningPoolDeps {
    // Account that receives stakes and pays rewards from its reward-token balance.
    Address poolAddress;
    TokenLedgerPtr stakeToken;
    TokenLedgerPtr rewardToken;
    VerifierPtr verifier;
    std::shared_ptr<LedgerClock> clock;
    ProofScope scope;
};

enum class SessionPhase { Idle, Cooling, Claimable };

const char* sessionPhaseName(SessionPhase phase);

struct SessionView {
    SessionPhase phase = SessionPhase::Idle;
    IdentityFingerprint fingerprint;
    SessionRecord record;
    Timestamp unlocksAt = 0;
};

// Session orchestrator. Every public call is one serialized transaction: it
// either commits completely or leaves the ledger exactly as it found it.
class MiningPool {
public:
    MiningPool(MiningPoolDeps deps, Address administrator, MiningConfig config);

    SessionOpened openSession(const Address& caller,
                              const IdentityProof& proof,
                              const std::optional<Address>& referralTarget,
                              Amount amount,
                              const StakeAuthorization& authorization = StakeAuthorization::allowance());
    SessionFinished closeSession(const Address& caller);

    SessionPhase sessionPhase(const Address& caller) const;
    std::optional<SessionView> session(const Address& caller) const;
    RewardRange estimateRewardRange(Amount stake) const;
    bool isReferralEligible(const Address& caller) const;
    Amount requiredReserve(Amount totalActiveStake) const;
    Amount treasuryBalance() const;
    PoolState poolState() const;
    MiningConfig config() const;
    Address administrator() const;

    void setStakeBounds(const Address& caller, Amount stakeMin, Amount stakeMax);
    void setRewardCurve(const Address& caller, Amount minReward, Amount perLevelBonus, std::uint32_t levelCount);
    void setReferralBonusBps(const Address& caller, std::uint32_t bps);
    void setCooldown(const Address& caller, Timestamp cooldown);
    void setStreakPolicy(const Address& caller, Timestamp window, Amount bonus);
    void setReservePolicy(const Address& caller,
                          std::uint32_t expectedReferralShareBps,
                          std::uint32_t safetyDiscountBps);
    void transferAdministration(const Address& caller, const Address& successor);

    // Invoked after each committed event, while the pool lock is held. A
    // listener that throws is counted in listenerFailures(); the operation
    // that produced the event still succeeds.
    void setEventListener(EventListener listener);
    std::uint64_t listenerFailures() const;
    std::string lastListenerError() const;
    const EventJournal& journal() const { return journal_; }
    // Pool aggregates match the stored session records.
    bool isConsistent() const;

private:
    void record(const MiningEvent& event);
    void pullStake(const Address& caller, Amount amount, const StakeAuthorization& authorization, Timestamp now);

    MiningPoolDeps deps_;
    std::string scopeHash_;
    ConfigurationStore config_;
    IdentitySessionLedger ledger_;
    EventJournal journal_;
    EventListener listener_;
    std::uint64_t listenerFailures_ = 0;
    std::string lastListenerError_;
    mutable std::recursive_mutex mutex_;
};

} // namespace hm
