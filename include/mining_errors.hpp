#pragma once

#include "token_amount.hpp"

#include <stdexcept>
#include <string>

namespace hm {

enum class MiningErrorCode {
    AlreadyMining,
    CannotReferSelf,
    InvalidStakeAmount,
    InsufficientReserve,
    ProofInvalid,
    SessionNotOpen,
    CooldownNotElapsed,
    TransferFailed,
    Unauthorized,
    InvalidConfiguration
};

// Input errors are the caller's to fix; capacity errors may clear on retry;
// collaborator errors come from the proof verifier or a token ledger.
enum class ErrorClass { Input, Capacity, Collaborator, Administration };

const char* errorCodeName(MiningErrorCode code);
ErrorClass classify(MiningErrorCode code);

class MiningError : public std::runtime_error {
public:
    MiningError(MiningErrorCode code, const std::string& message);

    MiningErrorCode code() const { return code_; }
    ErrorClass errorClass() const { return classify(code_); }
    bool retryable() const { return errorClass() == ErrorClass::Capacity; }

private:
    MiningErrorCode code_;
};

class InvalidStakeAmount : public MiningError {
public:
    InvalidStakeAmount(Amount amount, Amount min, Amount max);

    Amount amount() const { return amount_; }
    Amount min() const { return min_; }
    Amount max() const { return max_; }

private:
    Amount amount_;
    Amount min_;
    Amount max_;
};

class InsufficientReserve : public MiningError {
public:
    InsufficientReserve(Amount treasuryBalance, Amount requiredReserve);

    Amount treasuryBalance() const { return treasuryBalance_; }
    Amount requiredReserve() const { return requiredReserve_; }

private:
    Amount treasuryBalance_;
    Amount requiredReserve_;
};

class CooldownNotElapsed : public MiningError {
public:
    CooldownNotElapsed(Timestamp now, Timestamp unlocksAt);

    Timestamp unlocksAt() const { return unlocksAt_; }

private:
    Timestamp unlocksAt_;
};

} // namespace hm
