#include "tree/thought_tree.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace metatot {

std::string toString(DomainPhase phase) {
    switch (phase) {
        case DomainPhase::Explore:   return "explore";
        case DomainPhase::Challenge: return "challenge";
        case DomainPhase::Evolve:    return "evolve";
        case DomainPhase::Integrate: return "integrate";
        case DomainPhase::Leaf:      return "leaf";
    }
    return "leaf";
}

std::optional<DomainPhase> parseDomainPhase(const std::string& name) {
    if (name == "explore")   return DomainPhase::Explore;
    if (name == "challenge") return DomainPhase::Challenge;
    if (name == "evolve")    return DomainPhase::Evolve;
    if (name == "integrate") return DomainPhase::Integrate;
    if (name == "leaf")      return DomainPhase::Leaf;
    return std::nullopt;
}

ThoughtTree::ThoughtTree(std::string session_id)
    : session_id_(std::move(session_id)) {}

// ─── Node creation ─────────────────────────────────────────────

uint64_t ThoughtTree::createRoot(const std::string& thought, ActiveInferenceState state,
                                 DomainPhase phase) {
    if (!nodes_.empty()) {
        throw std::logic_error("Tree already has a root");
    }
    ThoughtNode root;
    root.id = 0;
    root.session_id = session_id_;
    root.depth = 0;
    root.phase = phase;
    root.thought = thought;
    root.state = std::move(state);
    root.score = root.state.efe.score();
    root.value_estimate = root.score;
    nodes_.push_back(std::move(root));
    return 0;
}

uint64_t ThoughtTree::addChild(uint64_t parent_id, DomainPhase phase,
                               std::string thought, ActiveInferenceState state) {
    if (parent_id >= nodes_.size()) {
        throw std::out_of_range("Parent node not found: " + std::to_string(parent_id));
    }

    ThoughtNode child;
    child.id = nodes_.size();
    child.parent_id = parent_id;
    child.session_id = session_id_;
    child.depth = nodes_[parent_id].depth + 1;
    child.phase = phase;
    child.thought = std::move(thought);
    child.state = std::move(state);
    child.score = child.state.efe.score();
    child.value_estimate = child.score;

    uint64_t id = child.id;
    nodes_.push_back(std::move(child));
    nodes_[parent_id].children.push_back(id);
    nodes_[parent_id].expanded = true;
    return id;
}

ThoughtNode* ThoughtTree::getNode(uint64_t id) {
    return id < nodes_.size() ? &nodes_[id] : nullptr;
}

const ThoughtNode* ThoughtTree::getNode(uint64_t id) const {
    return id < nodes_.size() ? &nodes_[id] : nullptr;
}

const ThoughtNode& ThoughtTree::at(uint64_t id) const {
    if (id >= nodes_.size()) {
        throw std::out_of_range("Node not found: " + std::to_string(id));
    }
    return nodes_[id];
}

ThoughtNode& ThoughtTree::mutableAt(uint64_t id) {
    if (id >= nodes_.size()) {
        throw std::out_of_range("Node not found: " + std::to_string(id));
    }
    return nodes_[id];
}

// ─── Traversal ─────────────────────────────────────────────────

std::vector<uint64_t> ThoughtTree::pathTo(uint64_t id) const {
    std::vector<uint64_t> path;
    const ThoughtNode* current = &at(id);
    while (true) {
        path.push_back(current->id);
        if (!current->parent_id) break;
        current = &at(*current->parent_id);
    }
    std::reverse(path.begin(), path.end());
    return path;
}

std::vector<uint64_t> ThoughtTree::siblings(uint64_t id) const {
    const ThoughtNode& node = at(id);
    std::vector<uint64_t> result;
    if (!node.parent_id) return result;
    for (uint64_t sib : at(*node.parent_id).children) {
        if (sib != id) result.push_back(sib);
    }
    return result;
}

bool ThoughtTree::isRootToLeafChain(const std::vector<uint64_t>& path) const {
    if (path.empty() || path.front() != rootId() || nodes_.empty()) return false;
    for (size_t i = 0; i < path.size(); i++) {
        const ThoughtNode* node = getNode(path[i]);
        if (!node) return false;
        if (i > 0 && node->parent_id != path[i - 1]) return false;
    }
    return at(path.back()).children.empty();
}

void ThoughtTree::forEachNode(const std::function<void(const ThoughtNode&)>& fn) const {
    for (const auto& node : nodes_) fn(node);
}

// ─── Search bookkeeping ────────────────────────────────────────

void ThoughtTree::markExpanded(uint64_t id) {
    mutableAt(id).expanded = true;
}

void ThoughtTree::markTerminal(uint64_t id) {
    mutableAt(id).terminal = true;
    refreshExhaustion(id);
}

void ThoughtTree::markDeadEnd(uint64_t id, double malus) {
    ThoughtNode& node = mutableAt(id);
    node.expanded = true;
    node.terminal = true;
    node.phase = DomainPhase::Leaf;
    node.score -= malus;
    node.value_estimate = node.visit_count == 0
        ? node.score
        : node.value_estimate - malus;
    refreshExhaustion(id);
}

void ThoughtTree::backup(uint64_t id, double value) {
    ThoughtNode* current = &mutableAt(id);
    while (true) {
        current->recordVisit(value);
        if (!current->parent_id) break;
        current = &mutableAt(*current->parent_id);
    }
}

void ThoughtTree::refreshExhaustion(uint64_t id) {
    ThoughtNode* current = &mutableAt(id);
    while (true) {
        bool exhausted = current->terminal;
        if (!exhausted && current->expanded && !current->children.empty()) {
            exhausted = std::all_of(current->children.begin(), current->children.end(),
                                    [this](uint64_t c) { return nodes_[c].exhausted; });
        }
        if (exhausted == current->exhausted && current->id != id) break;
        current->exhausted = exhausted;
        if (!current->parent_id) break;
        current = &mutableAt(*current->parent_id);
    }
}

// ─── Finalization ──────────────────────────────────────────────

std::vector<uint64_t> ThoughtTree::bestPath() const {
    std::vector<uint64_t> path;
    if (nodes_.empty()) return path;

    uint64_t current = rootId();
    path.push_back(current);
    while (!nodes_[current].children.empty()) {
        uint64_t best = nodes_[current].children.front();
        for (uint64_t child : nodes_[current].children) {
            const ThoughtNode& c = nodes_[child];
            const ThoughtNode& b = nodes_[best];
            if (c.value_estimate > b.value_estimate ||
                (c.value_estimate == b.value_estimate && c.id < b.id)) {
                best = child;
            }
        }
        current = best;
        path.push_back(current);
    }
    return path;
}

double ThoughtTree::pathEfe(const std::vector<uint64_t>& path) const {
    if (!isRootToLeafChain(path)) {
        throw std::invalid_argument("Path is not a root-to-leaf chain of this tree");
    }
    double total = 0.0;
    for (uint64_t id : path) total += nodes_[id].efe();
    return total;
}

void ThoughtTree::markSelected(const std::vector<uint64_t>& path) {
    for (auto& node : nodes_) node.is_selected = false;
    for (uint64_t id : path) mutableAt(id).is_selected = true;
}

void ThoughtTree::validate() const {
    for (const auto& node : nodes_) {
        if (node.parent_id) {
            const ThoughtNode* parent = getNode(*node.parent_id);
            if (!parent) {
                throw std::logic_error("Node " + std::to_string(node.id) + " has a dangling parent");
            }
            if (node.depth != parent->depth + 1) {
                throw std::logic_error("Node " + std::to_string(node.id) + " has depth " +
                                       std::to_string(node.depth) + ", parent has " +
                                       std::to_string(parent->depth));
            }
        } else if (node.id != rootId() || node.depth != 0) {
            throw std::logic_error("Only node 0 may be parentless, at depth 0");
        }
        if (!node.children.empty() && (!node.expanded || node.visit_count < 1)) {
            throw std::logic_error("Node " + std::to_string(node.id) +
                                   " has children but was never visited");
        }
        double sum = 0.0;
        for (const auto& [_, p] : node.state.beliefs.probabilities()) sum += p;
        if (std::abs(sum - 1.0) > BeliefDistribution::kTolerance) {
            throw std::logic_error("Node " + std::to_string(node.id) + " beliefs are not normalized");
        }
    }
}

} // namespace metatot
