#include "mining_pool.hpp"

#include "mining_errors.hpp"

#include <stdexcept>

namespace hm {

namespace {

using Lock = std::lock_guard<std::recursive_mutex>;

std::optional<Address> normalizeReferral(const std::optional<Address>& referral) {
    if (!referral) {
        return std::nullopt;
    }
    if (trimWhitespace(*referral).empty()) {
        return std::nullopt;
    }
    return normalizeAddress(*referral);
}

Timestamp unlockTime(const SessionRecord& record, const MiningConfig& cfg) {
    if (record.openedAt > kMaxAmount - cfg.cooldown) {
        return kMaxAmount;
    }
    return record.openedAt + cfg.cooldown;
}

} // namespace

const char* sessionPhaseName(SessionPhase phase) {
    switch (phase) {
    case SessionPhase::Idle:
        return "idle";
    case SessionPhase::Cooling:
        return "cooling";
    case SessionPhase::Claimable:
        return "claimable";
    }
    return "unknown";
}

MiningPool::MiningPool(MiningPoolDeps deps, Address administrator, MiningConfig config)
    : deps_(std::move(deps))
    , scopeHash_(scopeHash(deps_.scope))
    , config_(std::move(administrator), config) {
    if (!deps_.stakeToken || !deps_.rewardToken) {
        throw std::invalid_argument("mining pool requires stake and reward token ledgers");
    }
    if (!deps_.verifier) {
        throw std::invalid_argument("mining pool requires an identity proof verifier");
    }
    if (!deps_.clock) {
        throw std::invalid_argument("mining pool requires a clock");
    }
    deps_.poolAddress = normalizeAddress(deps_.poolAddress);
    config_.onChange([this](const std::string& field, const std::string& value) {
        record(ConfigurationChanged{ field, value });
    });
}

SessionOpened MiningPool::openSession(const Address& caller,
                                      const IdentityProof& proof,
                                      const std::optional<Address>& referralTarget,
                                      Amount amount,
                                      const StakeAuthorization& authorization) {
    Lock lock(mutex_);
    const Address who = normalizeAddress(caller);
    const std::optional<Address> referral = normalizeReferral(referralTarget);
    const MiningConfig& cfg = config_.current();
    const Timestamp now = deps_.clock->now();

    if (ledger_.findSession(proof.fingerprint) != nullptr || ledger_.activeFingerprint(who)) {
        throw MiningError(MiningErrorCode::AlreadyMining, who + " already has an open session");
    }
    if (referral && *referral == who) {
        throw MiningError(MiningErrorCode::CannotReferSelf, who + " named itself as referral");
    }
    if (amount < cfg.stakeMin || amount > cfg.stakeMax) {
        throw InvalidStakeAmount(amount, cfg.stakeMin, cfg.stakeMax);
    }
    const Amount stakeAfter = checkedAdd(ledger_.pool().activeStake, amount);
    const Amount required = hm::requiredReserve(stakeAfter, cfg);
    const Amount balance = deps_.rewardToken->balanceOf(deps_.poolAddress);
    if (balance < required) {
        throw InsufficientReserve(balance, required);
    }

    if (!deps_.verifier->verify(proof.root,
                                deps_.scope.groupId,
                                signalHash(who),
                                proof.fingerprint,
                                scopeHash_,
                                proof.proof)) {
        throw MiningError(MiningErrorCode::ProofInvalid, "identity proof rejected for " + who);
    }

    SessionOpened event{ who, referral, proof.fingerprint, amount, now };
    LedgerUndo undo = ledger_.capture(who, proof.fingerprint);
    try {
        undo.satisfiedReferrals = ledger_.admit(who, proof.fingerprint, amount, referral, now);
        pullStake(who, amount, authorization, now);
    } catch (...) {
        ledger_.restore(undo);
        throw;
    }
    record(event);
    return event;
}

SessionFinished MiningPool::closeSession(const Address& caller) {
    Lock lock(mutex_);
    const Address who = normalizeAddress(caller);
    const MiningConfig& cfg = config_.current();
    const Timestamp now = deps_.clock->now();

    auto fingerprint = ledger_.activeFingerprint(who);
    const SessionRecord* active = fingerprint ? ledger_.findSession(*fingerprint) : nullptr;
    if (active == nullptr) {
        throw MiningError(MiningErrorCode::SessionNotOpen, who + " has no open session");
    }
    const Timestamp unlocksAt = unlockTime(*active, cfg);
    if (now < unlocksAt) {
        throw CooldownNotElapsed(now, unlocksAt);
    }

    RewardInputs inputs;
    inputs.caller = who;
    inputs.session = *active;
    inputs.referralTargetOpenedAt = active->referredStartAt;
    inputs.streak = ledger_.streak(who);
    inputs.activeSessions = ledger_.pool().activeSessions;
    inputs.now = now;
    const RewardBreakdown reward = computeReward(inputs, cfg);

    SessionFinished event;
    event.caller = who;
    event.referralTarget = inputs.session.referralTarget;
    event.fingerprint = *fingerprint;
    event.total = reward.total();
    event.payout = reward.payout;
    event.referralBonus = reward.referralBonus;
    event.streakBonus = reward.streakBonus;
    event.rewardLevel = reward.rewardLevel;
    event.streakCount = reward.newStreakCount;
    event.referralApplied = reward.referralApplied;
    event.stakedAmount = inputs.session.stakedAmount;
    event.finishedAt = now;

    LedgerUndo undo = ledger_.capture(who, *fingerprint);
    try {
        ledger_.release(who, *fingerprint, now, reward.newStreakCount);
        deps_.rewardToken->transfer(deps_.poolAddress, who, event.total);
    } catch (...) {
        ledger_.restore(undo);
        throw;
    }
    record(event);
    return event;
}

void MiningPool::pullStake(const Address& caller,
                           Amount amount,
                           const StakeAuthorization& authorization,
                           Timestamp now) {
    if (authorization.kind == StakeAuthorization::Kind::Permit) {
        if (!authorization.permit) {
            throw MiningError(MiningErrorCode::TransferFailed, "permit authorization without a permit");
        }
        if (normalizeAddress(authorization.permit->spender) != deps_.poolAddress) {
            throw MiningError(MiningErrorCode::TransferFailed, "permit names a different spender");
        }
        deps_.stakeToken->permitTransferFrom(*authorization.permit, caller, deps_.poolAddress, amount, now);
        return;
    }
    deps_.stakeToken->transferFrom(deps_.poolAddress, caller, deps_.poolAddress, amount);
}

void MiningPool::record(const MiningEvent& event) {
    journal_.append(event);
    if (!listener_) {
        return;
    }
    // The event is already committed; a failing listener cannot undo it.
    try {
        listener_(event);
    } catch (const std::exception& ex) {
        ++listenerFailures_;
        lastListenerError_ = ex.what();
    }
}

SessionPhase MiningPool::sessionPhase(const Address& caller) const {
    auto view = session(caller);
    return view ? view->phase : SessionPhase::Idle;
}

std::optional<SessionView> MiningPool::session(const Address& caller) const {
    Lock lock(mutex_);
    const Address who = normalizeAddress(caller);
    auto fingerprint = ledger_.activeFingerprint(who);
    if (!fingerprint) {
        return std::nullopt;
    }
    const SessionRecord* active = ledger_.findSession(*fingerprint);
    if (active == nullptr) {
        return std::nullopt;
    }
    SessionView view;
    view.fingerprint = *fingerprint;
    view.record = *active;
    view.unlocksAt = unlockTime(*active, config_.current());
    view.phase = (deps_.clock->now() < view.unlocksAt) ? SessionPhase::Cooling : SessionPhase::Claimable;
    return view;
}

RewardRange MiningPool::estimateRewardRange(Amount stake) const {
    Lock lock(mutex_);
    return hm::estimateRewardRange(stake, config_.current());
}

bool MiningPool::isReferralEligible(const Address& caller) const {
    Lock lock(mutex_);
    auto view = session(caller);
    if (!view) {
        return false;
    }
    return hm::isReferralEligible(normalizeAddress(caller),
                                  view->record.referralTarget,
                                  view->record.openedAt,
                                  view->record.referredStartAt,
                                  config_.current().cooldown);
}

Amount MiningPool::requiredReserve(Amount totalActiveStake) const {
    Lock lock(mutex_);
    return hm::requiredReserve(totalActiveStake, config_.current());
}

Amount MiningPool::treasuryBalance() const {
    Lock lock(mutex_);
    return deps_.rewardToken->balanceOf(deps_.poolAddress);
}

PoolState MiningPool::poolState() const {
    Lock lock(mutex_);
    return ledger_.pool();
}

MiningConfig MiningPool::config() const {
    Lock lock(mutex_);
    return config_.current();
}

Address MiningPool::administrator() const {
    Lock lock(mutex_);
    return config_.administrator();
}

void MiningPool::setStakeBounds(const Address& caller, Amount stakeMin, Amount stakeMax) {
    Lock lock(mutex_);
    config_.setStakeBounds(caller, stakeMin, stakeMax);
}

void MiningPool::setRewardCurve(const Address& caller,
                                Amount minReward,
                                Amount perLevelBonus,
                                std::uint32_t levelCount) {
    Lock lock(mutex_);
    config_.setRewardCurve(caller, minReward, perLevelBonus, levelCount);
}

void MiningPool::setReferralBonusBps(const Address& caller, std::uint32_t bps) {
    Lock lock(mutex_);
    config_.setReferralBonusBps(caller, bps);
}

void MiningPool::setCooldown(const Address& caller, Timestamp cooldown) {
    Lock lock(mutex_);
    config_.setCooldown(caller, cooldown);
}

void MiningPool::setStreakPolicy(const Address& caller, Timestamp window, Amount bonus) {
    Lock lock(mutex_);
    config_.setStreakPolicy(caller, window, bonus);
}

void MiningPool::setReservePolicy(const Address& caller,
                                  std::uint32_t expectedReferralShareBps,
                                  std::uint32_t safetyDiscountBps) {
    Lock lock(mutex_);
    config_.setReservePolicy(caller, expectedReferralShareBps, safetyDiscountBps);
}

void MiningPool::transferAdministration(const Address& caller, const Address& successor) {
    Lock lock(mutex_);
    config_.transferAdministration(caller, successor);
}

std::uint64_t MiningPool::listenerFailures() const {
    Lock lock(mutex_);
    return listenerFailures_;
}

std::string MiningPool::lastListenerError() const {
    Lock lock(mutex_);
    return lastListenerError_;
}

void MiningPool::setEventListener(EventListener listener) {
    Lock lock(mutex_);
    listener_ = std::move(listener);
}

bool MiningPool::isConsistent() const {
    Lock lock(mutex_);
    const PoolState& pool = ledger_.pool();
    return ledger_.countActiveSessions() == pool.activeSessions &&
           ledger_.sumActiveStake() == pool.activeStake;
}

} // namespace hm
