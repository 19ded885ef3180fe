#pragma once

#include "tree/thought_node.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace metatot {

/// Everything the generator needs to ask for children of one node.
/// Captured by value so worker threads never touch the live tree.
struct ExpansionRequest {
    uint64_t node_id = 0;
    int depth = 0;
    DomainPhase phase = DomainPhase::Explore;
    std::string task;
    std::string thought;
    std::vector<std::string> path;      // thoughts from root down to the parent
    std::vector<std::string> siblings;  // other branches at this level
    std::vector<std::string> hypotheses;
};

/// Phase-specific instruction templates.
class PromptBuilder {
public:
    static std::string instruction(DomainPhase phase);
    static std::string build(const ExpansionRequest& request);

    /// Context object sent alongside the prompt: the request fields
    /// plus the caller's context under "caller".
    static nlohmann::json requestContext(const ExpansionRequest& request,
                                         const nlohmann::json& caller_context);
};

} // namespace metatot
