#pragma once

#include "identity.hpp"
#include "token_amount.hpp"

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace hm {

// openedAt == 0 means the fingerprint has no active session.
struct SessionRecord {
    Timestamp openedAt = 0;
    Amount stakedAmount = 0;
    std::optional<Address> referralTarget;
    // First time the referral target opened a session after openedAt.
    std::optional<Timestamp> referredStartAt;

    bool active() const { return openedAt != 0; }
};

// Per-caller history that survives across sessions.
struct StreakRecord {
    Timestamp lastFinishedAt = 0;
    std::uint32_t consecutiveCount = 0;
};

struct PoolState {
    std::uint64_t activeSessions = 0;
    Amount activeStake = 0;
};

// Prior values of the entries one transaction touched. restore() puts them
// back and reverses only that transaction's share of the pool totals, so
// commits nested inside the transaction survive its rollback.
struct LedgerUndo {
    IdentityFingerprint fingerprint;
    std::optional<SessionRecord> session;
    Address caller;
    std::optional<IdentityFingerprint> callerFingerprint;
    std::optional<StreakRecord> streak;
    // Sessions whose referral this transaction satisfied.
    std::vector<IdentityFingerprint> satisfiedReferrals;
    bool captured = false;
};

class IdentitySessionLedger {
public:
    const SessionRecord* findSession(const IdentityFingerprint& fingerprint) const;
    std::optional<IdentityFingerprint> activeFingerprint(const Address& caller) const;
    StreakRecord streak(const Address& caller) const;
    const PoolState& pool() const { return pool_; }

    // Record the admission of a new session and fold it into the pool totals.
    // Open sessions naming the caller as referral, opened before now and not
    // yet satisfied, get referredStartAt = now; their fingerprints are returned.
    std::vector<IdentityFingerprint> admit(const Address& caller,
               const IdentityFingerprint& fingerprint,
               Amount stake,
               const std::optional<Address>& referralTarget,
               Timestamp now);
    // Remove the caller's session, release its stake and record the streak.
    void release(const Address& caller,
                 const IdentityFingerprint& fingerprint,
                 Timestamp now,
                 std::uint32_t newStreakCount);

    LedgerUndo capture(const Address& caller, const IdentityFingerprint& fingerprint) const;
    void restore(const LedgerUndo& undo);

    // Number of stored sessions with openedAt != 0; must equal pool().activeSessions.
    std::uint64_t countActiveSessions() const;
    Amount sumActiveStake() const;

private:
    std::unordered_map<IdentityFingerprint, SessionRecord> sessions_;
    std::unordered_map<Address, IdentityFingerprint> callerIndex_;
    std::unordered_map<Address, StreakRecord> streaks_;
    // Referral target -> open sessions naming it.
    std::unordered_map<Address, std::set<IdentityFingerprint>> referrers_;
    PoolState pool_;

    void linkReferral(const IdentityFingerprint& fingerprint, const SessionRecord& record);
    void unlinkReferral(const IdentityFingerprint& fingerprint, const SessionRecord& record);
    void addToPool(const SessionRecord& record);
    void removeFromPool(const SessionRecord& record);
};

} // namespace hm
