#pragma once

#include "tree/thought_node.hpp"

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace metatot {

// ─── Thought Tree ──────────────────────────────────────────────
// Session-owned node store. Ids are dense and sequential (root = 0),
// so id order doubles as creation order for deterministic tie-breaks.
// Nodes are never removed. Not thread-safe: only the search thread
// mutates it.

class ThoughtTree {
public:
    explicit ThoughtTree(std::string session_id = {});

    /// Create the root. Throws std::logic_error if one exists.
    uint64_t createRoot(const std::string& thought, ActiveInferenceState state,
                        DomainPhase phase = DomainPhase::Explore);

    /// Append a child under parent_id: depth = parent depth + 1,
    /// score = -EFE, value prior = score, zero visits.
    uint64_t addChild(uint64_t parent_id, DomainPhase phase,
                      std::string thought, ActiveInferenceState state);

    ThoughtNode* getNode(uint64_t id);
    const ThoughtNode* getNode(uint64_t id) const;

    /// Throws std::out_of_range for an unknown id.
    const ThoughtNode& at(uint64_t id) const;

    bool empty() const { return nodes_.empty(); }
    size_t size() const { return nodes_.size(); }
    uint64_t rootId() const { return 0; }
    const std::string& sessionId() const { return session_id_; }

    // ── Traversal ──
    std::vector<uint64_t> pathTo(uint64_t id) const;
    std::vector<uint64_t> siblings(uint64_t id) const;
    bool isRootToLeafChain(const std::vector<uint64_t>& path) const;
    void forEachNode(const std::function<void(const ThoughtNode&)>& fn) const;

    // ── Search bookkeeping ──
    void markExpanded(uint64_t id);
    void markTerminal(uint64_t id);

    /// Turn a failed expansion into a dead-end leaf, lowering its score.
    void markDeadEnd(uint64_t id, double malus);

    /// recordVisit(value) on id and every ancestor up to the root.
    void backup(uint64_t id, double value);

    /// Recompute the exhausted flag of id and its ancestors.
    void refreshExhaustion(uint64_t id);

    // ── Finalization ──

    /// Root-to-leaf path following the highest value_estimate,
    /// ties broken by the lowest id.
    std::vector<uint64_t> bestPath() const;

    /// Sum of node EFE along the path. Throws std::invalid_argument if
    /// the path is not a root-to-leaf chain.
    double pathEfe(const std::vector<uint64_t>& path) const;

    void markSelected(const std::vector<uint64_t>& path);

    /// Check structural invariants; throws std::logic_error on breach.
    void validate() const;

private:
    std::string session_id_;
    std::vector<ThoughtNode> nodes_;

    ThoughtNode& mutableAt(uint64_t id);
};

} // namespace metatot
