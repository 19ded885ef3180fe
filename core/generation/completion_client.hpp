#pragma once

#include "generation/inference_client.hpp"

#include <functional>
#include <string>

namespace metatot {

/// Raw text completion: (system prompt, user prompt) → model output.
using CompletionFn = std::function<std::string(const std::string& system_prompt,
                                               const std::string& prompt)>;

/// Adapts a chat/text completion backend to InferenceClient by asking
/// for JSON proposals and parsing whatever comes back.
class CompletionInferenceClient : public InferenceClient {
public:
    explicit CompletionInferenceClient(CompletionFn fn, size_t max_line_proposals = 4);

    GenerationResponse generate(const std::string& prompt,
                                const nlohmann::json& context) override;

    std::string name() const override { return "completion"; }

    /// System prompt sent with every request; lists the hypotheses the
    /// model should score when the context names any.
    static std::string systemPrompt(const nlohmann::json& context);

private:
    CompletionFn fn_;
    size_t max_line_proposals_;
};

} // namespace metatot
