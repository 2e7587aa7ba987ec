#include "session_ledger.hpp"

#include <stdexcept>

namespace hm {

const SessionRecord* IdentitySessionLedger::findSession(const IdentityFingerprint& fingerprint) const {
    auto it = sessions_.find(fingerprint);
    if (it == sessions_.end() || !it->second.active()) {
        return nullptr;
    }
    return &it->second;
}

std::optional<IdentityFingerprint> IdentitySessionLedger::activeFingerprint(const Address& caller) const {
    auto it = callerIndex_.find(caller);
    if (it == callerIndex_.end()) {
        return std::nullopt;
    }
    return it->second;
}

StreakRecord IdentitySessionLedger::streak(const Address& caller) const {
    auto it = streaks_.find(caller);
    if (it == streaks_.end()) {
        return StreakRecord{};
    }
    return it->second;
}

void IdentitySessionLedger::linkReferral(const IdentityFingerprint& fingerprint, const SessionRecord& record) {
    if (record.referralTarget) {
        referrers_[*record.referralTarget].insert(fingerprint);
    }
}

void IdentitySessionLedger::unlinkReferral(const IdentityFingerprint& fingerprint, const SessionRecord& record) {
    if (!record.referralTarget) {
        return;
    }
    auto it = referrers_.find(*record.referralTarget);
    if (it == referrers_.end()) {
        return;
    }
    it->second.erase(fingerprint);
    if (it->second.empty()) {
        referrers_.erase(it);
    }
}

void IdentitySessionLedger::addToPool(const SessionRecord& record) {
    pool_.activeStake = checkedAdd(pool_.activeStake, record.stakedAmount);
    pool_.activeSessions += 1;
}

void IdentitySessionLedger::removeFromPool(const SessionRecord& record) {
    pool_.activeSessions = (pool_.activeSessions == 0) ? 0 : pool_.activeSessions - 1;
    pool_.activeStake = flooredSub(pool_.activeStake, record.stakedAmount);
}

std::vector<IdentityFingerprint> IdentitySessionLedger::admit(const Address& caller,
                                                              const IdentityFingerprint& fingerprint,
                                                              Amount stake,
                                                              const std::optional<Address>& referralTarget,
                                                              Timestamp now) {
    if (now == 0) {
        throw std::invalid_argument("session open time must be non-zero");
    }
    if (findSession(fingerprint) != nullptr || callerIndex_.count(caller) != 0) {
        throw std::logic_error("admit called for an identity with an active session");
    }

    SessionRecord record;
    record.openedAt = now;
    record.stakedAmount = stake;
    record.referralTarget = referralTarget;
    addToPool(record);
    linkReferral(fingerprint, record);
    sessions_[fingerprint] = std::move(record);
    callerIndex_[caller] = fingerprint;

    std::vector<IdentityFingerprint> satisfied;
    auto referrers = referrers_.find(caller);
    if (referrers != referrers_.end()) {
        for (const auto& referrer : referrers->second) {
            SessionRecord& waiting = sessions_.at(referrer);
            if (!waiting.referredStartAt && waiting.openedAt < now) {
                waiting.referredStartAt = now;
                satisfied.push_back(referrer);
            }
        }
    }
    return satisfied;
}

void IdentitySessionLedger::release(const Address& caller,
                                    const IdentityFingerprint& fingerprint,
                                    Timestamp now,
                                    std::uint32_t newStreakCount) {
    auto it = sessions_.find(fingerprint);
    if (it == sessions_.end()) {
        throw std::logic_error("release called without a stored session");
    }
    removeFromPool(it->second);
    unlinkReferral(fingerprint, it->second);
    sessions_.erase(it);
    callerIndex_.erase(caller);

    StreakRecord& record = streaks_[caller];
    record.lastFinishedAt = now;
    record.consecutiveCount = newStreakCount;
}

LedgerUndo IdentitySessionLedger::capture(const Address& caller,
                                          const IdentityFingerprint& fingerprint) const {
    LedgerUndo undo;
    undo.fingerprint = fingerprint;
    auto session = sessions_.find(fingerprint);
    if (session != sessions_.end()) {
        undo.session = session->second;
    }
    undo.caller = caller;
    undo.callerFingerprint = activeFingerprint(caller);
    auto streak = streaks_.find(caller);
    if (streak != streaks_.end()) {
        undo.streak = streak->second;
    }
    undo.captured = true;
    return undo;
}

void IdentitySessionLedger::restore(const LedgerUndo& undo) {
    if (!undo.captured) {
        return;
    }
    for (const auto& referrer : undo.satisfiedReferrals) {
        auto waiting = sessions_.find(referrer);
        if (waiting != sessions_.end()) {
            waiting->second.referredStartAt.reset();
        }
    }

    auto current = sessions_.find(undo.fingerprint);
    if (current != sessions_.end()) {
        if (current->second.active()) {
            removeFromPool(current->second);
            unlinkReferral(undo.fingerprint, current->second);
        }
        sessions_.erase(current);
    }
    if (undo.session) {
        sessions_[undo.fingerprint] = *undo.session;
        if (undo.session->active()) {
            addToPool(*undo.session);
            linkReferral(undo.fingerprint, *undo.session);
        }
    }

    if (undo.callerFingerprint) {
        callerIndex_[undo.caller] = *undo.callerFingerprint;
    } else {
        callerIndex_.erase(undo.caller);
    }
    if (undo.streak) {
        streaks_[undo.caller] = *undo.streak;
    } else {
        streaks_.erase(undo.caller);
    }
}

std::uint64_t IdentitySessionLedger::countActiveSessions() const {
    std::uint64_t count = 0;
    for (const auto& [fingerprint, record] : sessions_) {
        (void)fingerprint;
        if (record.active()) {
            ++count;
        }
    }
    return count;
}

Amount IdentitySessionLedger::sumActiveStake() const {
    Amount total = 0;
    for (const auto& [fingerprint, record] : sessions_) {
        (void)fingerprint;
        if (record.active()) {
            total = checkedAdd(total, record.stakedAmount);
        }
    }
    return total;
}

} // namespace hm
