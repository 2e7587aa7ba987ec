#include "token_ledger.hpp"

#include "mining_errors.hpp"
#include "signing_key.hpp"

#include <sstream>

namespace hm {

namespace {

[[noreturn]] void transferFailed(const std::string& symbol, const std::string& reason) {
    throw MiningError(MiningErrorCode::TransferFailed, symbol + " " + reason);
}

} // namespace

std::string buildPermitMessage(const std::string& tokenSymbol,
                               const Address& holder,
                               const TransferPermit& permit) {
    std::ostringstream oss;
    oss << "humanmine:permit:v1|" << tokenSymbol.size() << ':' << tokenSymbol << '|' << holder.size()
        << ':' << holder << '|' << permit.spender.size() << ':' << permit.spender << '|'
        << permit.maxAmount << '|' << permit.nonce << '|' << permit.deadline;
    return oss.str();
}

InMemoryTokenLedger::InMemoryTokenLedger(std::string symbol)
    : symbol_(std::move(symbol)) {
    if (symbol_.empty()) {
        throw std::invalid_argument("token symbol must not be empty");
    }
}

void InMemoryTokenLedger::mint(const Address& holder, Amount amount) {
    totalSupply_ = checkedAdd(totalSupply_, amount);
    balances_[holder] += amount;
}

void InMemoryTokenLedger::approve(const Address& holder, const Address& spender, Amount amount) {
    allowances_[{ holder, spender }] = amount;
}

Amount InMemoryTokenLedger::allowance(const Address& holder, const Address& spender) const {
    auto it = allowances_.find({ holder, spender });
    return it == allowances_.end() ? 0 : it->second;
}

void InMemoryTokenLedger::registerPermitSigner(const Address& holder, const std::string& publicKeyHex) {
    permitSigners_[holder] = publicKeyHex;
}

Amount InMemoryTokenLedger::balanceOf(const Address& holder) const {
    auto it = balances_.find(holder);
    return it == balances_.end() ? 0 : it->second;
}

void InMemoryTokenLedger::transfer(const Address& sender, const Address& to, Amount amount) {
    move(sender, to, amount);
}

void InMemoryTokenLedger::transferFrom(const Address& spender,
                                       const Address& holder,
                                       const Address& to,
                                       Amount amount) {
    auto it = allowances_.find({ holder, spender });
    if (it == allowances_.end() || it->second < amount) {
        transferFailed(symbol_, "allowance too low");
    }
    move(holder, to, amount);
    it->second -= amount;
}

void InMemoryTokenLedger::permitTransferFrom(const TransferPermit& permit,
                                             const Address& holder,
                                             const Address& to,
                                             Amount amount,
                                             Timestamp now) {
    if (now > permit.deadline) {
        transferFailed(symbol_, "permit expired");
    }
    if (amount > permit.maxAmount) {
        transferFailed(symbol_, "permit amount exceeded");
    }
    if (usedNonces_.count({ holder, permit.nonce }) != 0) {
        transferFailed(symbol_, "permit nonce already used");
    }
    auto signer = permitSigners_.find(holder);
    if (signer == permitSigners_.end()) {
        transferFailed(symbol_, "no permit signer registered for holder");
    }
    if (!verifySignatureHex(signer->second, buildPermitMessage(symbol_, holder, permit), permit.signatureHex)) {
        transferFailed(symbol_, "permit signature invalid");
    }
    move(holder, to, amount);
    usedNonces_.insert({ holder, permit.nonce });
}

void InMemoryTokenLedger::move(const Address& from, const Address& to, Amount amount) {
    if (amount == 0) {
        return;
    }
    auto it = balances_.find(from);
    if (it == balances_.end() || it->second < amount) {
        transferFailed(symbol_, "balance too low");
    }
    if (from == to) {
        return;
    }
    Amount credited = checkedAdd(balanceOf(to), amount);
    it->second -= amount;
    balances_[to] = credited;
}

} // namespace hm
