#include "mining_errors.hpp"

#include <sstream>

namespace hm {

const char* errorCodeName(MiningErrorCode code) {
    switch (code) {
    case MiningErrorCode::AlreadyMining:
        return "AlreadyMining";
    case MiningErrorCode::CannotReferSelf:
        return "CannotReferSelf";
    case MiningErrorCode::InvalidStakeAmount:
        return "InvalidStakeAmount";
    case MiningErrorCode::InsufficientReserve:
        return "InsufficientReserve";
    case MiningErrorCode::ProofInvalid:
        return "ProofInvalid";
    case MiningErrorCode::SessionNotOpen:
        return "SessionNotOpen";
    case MiningErrorCode::CooldownNotElapsed:
        return "CooldownNotElapsed";
    case MiningErrorCode::TransferFailed:
        return "TransferFailed";
    case MiningErrorCode::Unauthorized:
        return "Unauthorized";
    case MiningErrorCode::InvalidConfiguration:
        return "InvalidConfiguration";
    }
    return "Unknown";
}

ErrorClass classify(MiningErrorCode code) {
    switch (code) {
    case MiningErrorCode::InsufficientReserve:
        return ErrorClass::Capacity;
    case MiningErrorCode::ProofInvalid:
    case MiningErrorCode::TransferFailed:
        return ErrorClass::Collaborator;
    case MiningErrorCode::Unauthorized:
    case MiningErrorCode::InvalidConfiguration:
        return ErrorClass::Administration;
    default:
        return ErrorClass::Input;
    }
}

MiningError::MiningError(MiningErrorCode code, const std::string& message)
    : std::runtime_error(std::string(errorCodeName(code)) + ": " + message)
    , code_(code) {}

namespace {

std::string describeStake(Amount amount, Amount min, Amount max) {
    std::ostringstream oss;
    oss << "stake " << formatTokenAmount(amount) << " outside [" << formatTokenAmount(min) << ", "
        << formatTokenAmount(max) << "]";
    return oss.str();
}

std::string describeReserve(Amount balance, Amount required) {
    std::ostringstream oss;
    oss << "treasury holds " << formatTokenAmount(balance) << " but "
        << formatTokenAmount(required) << " is required";
    return oss.str();
}

std::string describeCooldown(Timestamp now, Timestamp unlocksAt) {
    std::ostringstream oss;
    oss << "session unlocks at " << unlocksAt << " (now " << now << ")";
    return oss.str();
}

} // namespace

InvalidStakeAmount::InvalidStakeAmount(Amount amount, Amount min, Amount max)
    : MiningError(MiningErrorCode::InvalidStakeAmount, describeStake(amount, min, max))
    , amount_(amount)
    , min_(min)
    , max_(max) {}

InsufficientReserve::InsufficientReserve(Amount treasuryBalance, Amount requiredReserve)
    : MiningError(MiningErrorCode::InsufficientReserve,
                  describeReserve(treasuryBalance, requiredReserve))
    , treasuryBalance_(treasuryBalance)
    , requiredReserve_(requiredReserve) {}

CooldownNotElapsed::CooldownNotElapsed(Timestamp now, Timestamp unlocksAt)
    : MiningError(MiningErrorCode::CooldownNotElapsed, describeCooldown(now, unlocksAt))
    , unlocksAt_(unlocksAt) {}

} // namespace hm
