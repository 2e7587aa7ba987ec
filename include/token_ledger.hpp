#pragma once

#include "identity.hpp"
#include "token_amount.hpp"

#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <utility>

namespace hm {

// Off-ledger signed authorization letting a spender move a holder's tokens
// without a prior approve().
struct TransferPermit {
    Address spender;
    Amount maxAmount = 0;
    std::uint64_t nonce = 0;
    Timestamp deadline = 0;
    std::string signatureHex;
};

// How the holder authorized the stake pull at session open.
struct StakeAuthorization {
    enum class Kind { Allowance, Permit };

    Kind kind = Kind::Allowance;
    std::optional<TransferPermit> permit;

    static StakeAuthorization allowance() { return StakeAuthorization{}; }
    static StakeAuthorization withPermit(TransferPermit permit) {
        return StakeAuthorization{ Kind::Permit, std::move(permit) };
    }
};

// Fungible token contract as seen by the mining pool. Failed movements throw
// and leave balances untouched.
class TokenLedger {
public:
    virtual ~TokenLedger() = default;

    virtual Amount balanceOf(const Address& holder) const = 0;
    virtual void transfer(const Address& sender, const Address& to, Amount amount) = 0;
    virtual void transferFrom(const Address& spender,
                              const Address& holder,
                              const Address& to,
                              Amount amount) = 0;
    virtual void permitTransferFrom(const TransferPermit& permit,
                                    const Address& holder,
                                    const Address& to,
                                    Amount amount,
                                    Timestamp now) = 0;
};

using TokenLedgerPtr = std::shared_ptr<TokenLedger>;

// Canonical bytes a holder signs to produce a TransferPermit.
std::string buildPermitMessage(const std::string& tokenSymbol,
                               const Address& holder,
                               const TransferPermit& permit);

// In-process token used by the simulator and tests.
class InMemoryTokenLedger : public TokenLedger {
public:
    explicit InMemoryTokenLedger(std::string symbol);

    const std::string& symbol() const { return symbol_; }

    void mint(const Address& holder, Amount amount);
    void approve(const Address& holder, const Address& spender, Amount amount);
    Amount allowance(const Address& holder, const Address& spender) const;
    void registerPermitSigner(const Address& holder, const std::string& publicKeyHex);
    Amount totalSupply() const { return totalSupply_; }

    Amount balanceOf(const Address& holder) const override;
    void transfer(const Address& sender, const Address& to, Amount amount) override;
    void transferFrom(const Address& spender,
                      const Address& holder,
                      const Address& to,
                      Amount amount) override;
    void permitTransferFrom(const TransferPermit& permit,
                            const Address& holder,
                            const Address& to,
                            Amount amount,
                            Timestamp now) override;

private:
    void move(const Address& from, const Address& to, Amount amount);

    std::string symbol_;
    Amount totalSupply_ = 0;
    std::map<Address, Amount> balances_;
    std::map<std::pair<Address, Address>, Amount> allowances_;
    std::map<Address, std::string> permitSigners_;
    std::set<std::pair<Address, std::uint64_t>> usedNonces_;
};

} // namespace hm
