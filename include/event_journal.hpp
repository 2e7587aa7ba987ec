#pragma once

#include "mining_events.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace hm {

struct JournalProofStep {
    std::string siblingHash;
    bool siblingIsLeft = false;
};

// Append-only record of committed pool events. Each leaf is the SHA-256 of
// the canonical event encoding; the Merkle root commits to the whole history.
class EventJournal {
public:
    void append(const MiningEvent& event);

    std::size_t size() const { return leaves_.size(); }
    const std::vector<MiningEvent>& events() const { return events_; }
    std::string getLeaf(std::size_t index) const;

    std::string merkleRoot() const;
    std::vector<JournalProofStep> merkleProof(std::size_t leafIndex) const;
    static bool verifyProof(const std::string& leafHash,
                            const std::vector<JournalProofStep>& proof,
                            const std::string& root);

    void clear();

private:
    static std::string hashPair(const std::string& left, const std::string& right);
    static std::vector<std::string> foldLayer(const std::vector<std::string>& layer);

    std::vector<MiningEvent> events_;
    std::vector<std::string> leaves_;
};

} // namespace hm
