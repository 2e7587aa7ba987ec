#include "event_journal.hpp"
#include "identity.hpp"
#include "identity_verifier.hpp"
#include "ledger_clock.hpp"
#include "token_ledger.hpp"

#include "pool_harness.hpp"

#include <iostream>
#include <stdexcept>
#include <string>

namespace {

const std::string kSuite = "event_journal_test";
const std::string kSeed = "4242424242424242424242424242424242424242424242424242424242424242";

void expect(bool condition, const std::string& msg) {
    hm::test::expect(condition, kSuite, msg);
}

hm::MiningEvent openedEvent(std::size_t n) {
    hm::SessionOpened ev;
    ev.caller = "0xminer" + std::to_string(n);
    ev.fingerprint = "fp-" + std::to_string(n);
    ev.amount = hm::wholeTokens(n + 1);
    ev.openedAt = hm::test::kGenesis + n;
    return ev;
}

void emptyJournalHasNoRoot() {
    hm::EventJournal journal;
    expect(journal.merkleRoot().empty(), "empty journal has no root");
    expect(journal.merkleProof(0).empty(), "no proof for a missing leaf");
    expect(journal.getLeaf(3).empty(), "out of range leaf is empty");
}

void proofsVerifyForEveryLeaf() {
    for (std::size_t count = 1; count <= 7; ++count) {
        hm::EventJournal journal;
        for (std::size_t i = 0; i < count; ++i) {
            journal.append(openedEvent(i));
        }
        const std::string root = journal.merkleRoot();
        for (std::size_t i = 0; i < count; ++i) {
            auto proof = journal.merkleProof(i);
            if (!hm::EventJournal::verifyProof(journal.getLeaf(i), proof, root)) {
                hm::test::fail(kSuite,
                               "leaf " + std::to_string(i) + " of " + std::to_string(count) + " did not verify");
            }
        }
        if (count > 1) {
            auto proof = journal.merkleProof(0);
            proof.front().siblingHash = journal.getLeaf(0);
            expect(!hm::EventJournal::verifyProof(journal.getLeaf(0), proof, root), "tampered proof must fail");
            expect(!hm::EventJournal::verifyProof(journal.getLeaf(1), journal.merkleProof(0), root),
                   "proof for another leaf must fail");
        }
    }
}

void rootCommitsToEveryField() {
    hm::SessionFinished finished;
    finished.caller = "0xalice";
    finished.fingerprint = "fp-alice";
    finished.total = 150'000;
    finished.payout = 100'000;
    finished.streakBonus = 50'000;
    finished.streakCount = 2;

    hm::EventJournal a;
    a.append(finished);
    finished.referralTarget = hm::Address("0xbob");
    hm::EventJournal b;
    b.append(finished);
    expect(a.merkleRoot() != b.merkleRoot(), "referral target is part of the leaf");

    hm::ConfigurationChanged left{ "cooldown", "3600" };
    hm::ConfigurationChanged right{ "cooldow", "n3600" };
    expect(hm::encodeEvent(left) != hm::encodeEvent(right), "length prefixes keep fields apart");
    expect(!hm::describeEvent(finished).empty(), "events render for display");
}

void attestationsBindCallerAndScope() {
    hm::Attestor attestor(kSeed);
    hm::AttestorProofVerifier verifier(attestor.publicKeyHex());
    hm::ProofScope scope{ "app_journal", "mine", 1 };
    const std::string scope1 = hm::scopeHash(scope);

    auto fingerprint = hm::Attestor::fingerprintFor("alice-secret", scope);
    expect(fingerprint == hm::Attestor::fingerprintFor("alice-secret", scope), "fingerprint is stable");
    expect(fingerprint != hm::Attestor::fingerprintFor("bob-secret", scope), "fingerprint differs per person");

    auto proof = attestor.attest("0xalice", fingerprint, scope);
    expect(verifier.verify(proof.root, scope.groupId, hm::signalHash("0xalice"), proof.fingerprint, scope1, proof.proof),
           "valid attestation verifies");
    expect(!verifier.verify(proof.root, scope.groupId, hm::signalHash("0xbob"), proof.fingerprint, scope1, proof.proof),
           "attestation for another caller is rejected");

    hm::ProofScope otherAction = scope;
    otherAction.action = "vote";
    expect(!verifier.verify(proof.root,
                            scope.groupId,
                            hm::signalHash("0xalice"),
                            proof.fingerprint,
                            hm::scopeHash(otherAction),
                            proof.proof),
           "attestation for another action is rejected");
    expect(!verifier.verify(proof.root, 2, hm::signalHash("0xalice"), proof.fingerprint, scope1, proof.proof),
           "attestation for another group is rejected");
    expect(!verifier.verify(proof.root, scope.groupId, hm::signalHash("0xalice"), proof.fingerprint, scope1, "zz"),
           "garbage proof is rejected");

    hm::Attestor stranger;
    auto forged = stranger.attest("0xalice", fingerprint, scope);
    expect(!verifier.verify(forged.root, scope.groupId, hm::signalHash("0xalice"), forged.fingerprint, scope1, forged.proof),
           "attestation from an untrusted key is rejected");
}

void signalsAreCaseInsensitiveAddresses() {
    expect(hm::normalizeAddress("  0xABCdef ") == "0xabcdef", "addresses normalize");
    expect(hm::signalHash("0xalice") != hm::signalHash("0xalice2"), "signals differ per caller");
    expect(hm::trimWhitespace("  x \t\n") == "x", "surrounding whitespace trimmed");
    expect(hm::trimWhitespace(" \t ").empty(), "blank text trims to empty");
    expect(hm::trimWhitespace("a b") == "a b", "inner whitespace kept");
    bool rejected = false;
    try {
        hm::normalizeAddress("   ");
    } catch (const std::invalid_argument&) {
        rejected = true;
    }
    expect(rejected, "blank address rejected");
    rejected = false;
    try {
        hm::scopeHash(hm::ProofScope{});
    } catch (const std::invalid_argument&) {
        rejected = true;
    }
    expect(rejected, "scope without an app id is rejected");
}

void permitsAreSingleUse() {
    hm::InMemoryTokenLedger ledger("SPEND");
    hm::SigningKey holderKey(kSeed);
    ledger.registerPermitSigner("0xholder", holderKey.publicKeyHex());
    ledger.mint("0xholder", hm::wholeTokens(5));

    hm::TransferPermit permit;
    permit.spender = "0xpool";
    permit.maxAmount = hm::wholeTokens(2);
    permit.nonce = 7;
    permit.deadline = hm::test::kGenesis + hm::test::kHour;
    permit.signatureHex = holderKey.signHex(hm::buildPermitMessage("SPEND", "0xholder", permit));

    hm::test::expectError(hm::MiningErrorCode::TransferFailed,
                          [&] { ledger.permitTransferFrom(permit, "0xholder", "0xpool", hm::wholeTokens(3), hm::test::kGenesis); },
                          kSuite,
                          "amount above the permit maximum");
    ledger.permitTransferFrom(permit, "0xholder", "0xpool", hm::wholeTokens(2), hm::test::kGenesis);
    expect(ledger.balanceOf("0xpool") == hm::wholeTokens(2), "permit moved the funds");
    hm::test::expectError(hm::MiningErrorCode::TransferFailed,
                          [&] { ledger.permitTransferFrom(permit, "0xholder", "0xpool", 1, hm::test::kGenesis); },
                          kSuite,
                          "nonce cannot be reused");

    permit.nonce = 8;
    permit.signatureHex = holderKey.signHex(hm::buildPermitMessage("SPEND", "0xholder", permit));
    hm::test::expectError(hm::MiningErrorCode::TransferFailed,
                          [&] { ledger.permitTransferFrom(permit, "0xholder", "0xpool", 1, permit.deadline + 1); },
                          kSuite,
                          "expired permit rejected");
    permit.maxAmount = hm::wholeTokens(3);
    hm::test::expectError(hm::MiningErrorCode::TransferFailed,
                          [&] { ledger.permitTransferFrom(permit, "0xholder", "0xpool", 1, hm::test::kGenesis); },
                          kSuite,
                          "altered permit fails its signature");
    expect(ledger.totalSupply() == hm::wholeTokens(5), "transfers conserve supply");
}

void clocksReportLedgerTime() {
    hm::SystemClock wall;
    expect(wall.now() > hm::test::kGenesis, "system clock reads epoch seconds");
    hm::ManualClock manual(hm::test::kGenesis);
    manual.advance(hm::test::kDay);
    expect(manual.now() == hm::test::kGenesis + hm::test::kDay, "manual clock advances");
    bool rejected = false;
    try {
        manual.advance(hm::kMaxAmount);
    } catch (const std::overflow_error&) {
        rejected = true;
    }
    expect(rejected && manual.now() == hm::test::kGenesis + hm::test::kDay, "clock overflow rejected");
}

} // namespace

int main() {
    emptyJournalHasNoRoot();
    proofsVerifyForEveryLeaf();
    rootCommitsToEveryField();
    attestationsBindCallerAndScope();
    signalsAreCaseInsensitiveAddresses();
    permitsAreSingleUse();
    clocksReportLedgerTime();
    std::cout << kSuite << " passed" << std::endl;
    return 0;
}
