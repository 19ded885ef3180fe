#include "generation/completion_client.hpp"
#include "generation/response_parser.hpp"

namespace metatot {

CompletionInferenceClient::CompletionInferenceClient(CompletionFn fn, size_t max_line_proposals)
    : fn_(std::move(fn)), max_line_proposals_(max_line_proposals) {}

std::string CompletionInferenceClient::systemPrompt(const nlohmann::json& context) {
    std::string prompt =
        "Return JSON only, shaped as "
        "{\"proposals\": [{\"content\": string, \"belief_hypotheses\": {name: confidence}}]}.";

    auto it = context.find("hypotheses");
    if (it != context.end() && it->is_array() && !it->empty()) {
        prompt += " Score each proposal against these hypotheses with confidences in [0,1]:";
        for (const auto& h : *it) {
            if (h.is_string()) prompt += " " + h.get<std::string>() + ";";
        }
    }
    return prompt;
}

GenerationResponse CompletionInferenceClient::generate(const std::string& prompt,
                                                       const nlohmann::json& context) {
    if (!fn_) throw InferenceError("No completion backend configured");
    std::string raw = fn_(systemPrompt(context), prompt);
    return ResponseParser::parse(raw, max_line_proposals_);
}

} // namespace metatot
