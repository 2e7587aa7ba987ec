#include "event_journal.hpp"

#include "identity.hpp"

#include <algorithm>

namespace hm {

void EventJournal::append(const MiningEvent& event) {
    leaves_.push_back(sha256Hex(encodeEvent(event)));
    events_.push_back(event);
}

std::string EventJournal::getLeaf(std::size_t index) const {
    if (index >= leaves_.size()) {
        return {};
    }
    return leaves_[index];
}

std::string EventJournal::hashPair(const std::string& left, const std::string& right) {
    return sha256Hex(left + right);
}

// Pairs adjacent nodes; an unpaired last node is hashed with itself.
std::vector<std::string> EventJournal::foldLayer(const std::vector<std::string>& layer) {
    std::vector<std::string> parents;
    parents.reserve((layer.size() + 1) / 2);
    for (std::size_t left = 0; left < layer.size(); left += 2) {
        const std::size_t right = std::min(left + 1, layer.size() - 1);
        parents.push_back(hashPair(layer[left], layer[right]));
    }
    return parents;
}

std::string EventJournal::merkleRoot() const {
    if (leaves_.empty()) {
        return {};
    }

    std::vector<std::string> layer = leaves_;
    while (layer.size() > 1) {
        layer = foldLayer(layer);
    }
    return layer.front();
}

std::vector<JournalProofStep> EventJournal::merkleProof(std::size_t leafIndex) const {
    std::vector<JournalProofStep> proof;
    if (leafIndex >= leaves_.size()) {
        return proof;
    }

    std::vector<std::string> layer = leaves_;
    std::size_t index = leafIndex;
    while (layer.size() > 1) {
        std::size_t siblingIndex = (index % 2 == 0) ? index + 1 : index - 1;
        if (siblingIndex >= layer.size()) {
            siblingIndex = index;
        }
        proof.push_back({ layer[siblingIndex], index % 2 == 1 });

        layer = foldLayer(layer);
        index /= 2;
    }
    return proof;
}

bool EventJournal::verifyProof(const std::string& leafHash,
                               const std::vector<JournalProofStep>& proof,
                               const std::string& root) {
    if (leafHash.empty() || root.empty()) {
        return false;
    }
    std::string current = leafHash;
    for (const auto& step : proof) {
        current = step.siblingIsLeft ? hashPair(step.siblingHash, current)
                                     : hashPair(current, step.siblingHash);
    }
    return current == root;
}

void EventJournal::clear() {
    events_.clear();
    leaves_.clear();
}

} // namespace hm
