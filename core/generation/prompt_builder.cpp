#include "generation/prompt_builder.hpp"

#include <sstream>

namespace metatot {

std::string PromptBuilder::instruction(DomainPhase phase) {
    switch (phase) {
        case DomainPhase::Explore:
            return "Generate 2 to 4 divergent next steps that move the task forward. "
                   "Each step must take a different approach.";
        case DomainPhase::Challenge:
            return "Critique the current line of thought: name its weakest assumption. "
                   "Then give at least one counter-proposal that avoids it.";
        case DomainPhase::Evolve:
            return "Refine the current line of thought into one more specific, "
                   "concrete variant.";
        case DomainPhase::Integrate:
            return "Synthesize the surviving branches into a single terminal action "
                   "that can be executed as stated.";
        case DomainPhase::Leaf:
            break;
    }
    return "State the final action.";
}

std::string PromptBuilder::build(const ExpansionRequest& request) {
    std::ostringstream out;
    out << "Meta-ToT reasoning step (phase: " << toString(request.phase)
        << ", depth: " << request.depth << ").\n";
    out << "Task: " << request.task << "\n";

    if (!request.path.empty()) {
        out << "Reasoning so far:\n";
        for (size_t i = 0; i < request.path.size(); i++) {
            out << "  " << (i + 1) << ". " << request.path[i] << "\n";
        }
    }
    out << "Current thought: " << request.thought << "\n";

    if (!request.siblings.empty() &&
        (request.phase == DomainPhase::Challenge || request.phase == DomainPhase::Integrate)) {
        out << "Other branches under consideration:\n";
        for (const auto& s : request.siblings) out << "  - " << s << "\n";
    }

    out << "Instruction: " << instruction(request.phase) << "\n";

    if (!request.hypotheses.empty()) {
        out << "For every proposal give a confidence in [0,1] for each hypothesis:";
        for (const auto& h : request.hypotheses) out << " " << h << ";";
        out << "\n";
    }
    return out.str();
}

nlohmann::json PromptBuilder::requestContext(const ExpansionRequest& request,
                                             const nlohmann::json& caller_context) {
    nlohmann::json ctx;
    ctx["phase"] = toString(request.phase);
    ctx["depth"] = request.depth;
    ctx["task"] = request.task;
    ctx["thought"] = request.thought;
    ctx["path"] = request.path;
    ctx["siblings"] = request.siblings;
    ctx["hypotheses"] = request.hypotheses;
    ctx["caller"] = caller_context;
    return ctx;
}

} // namespace metatot
