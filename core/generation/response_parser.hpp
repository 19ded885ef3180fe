#pragma once

#include "generation/inference_client.hpp"

#include <string>

namespace metatot {

/// Turns raw model output into proposals. Accepted shapes, tried in order:
///   {"proposals": [...]}                       object wrapper
///   [ "text", {"content": ..., "belief_hypotheses": {...}} ]
///   the above inside a ``` / ```json fence
///   bulleted or numbered lines                  (no hypotheses)
class ResponseParser {
public:
    /// Throws InferenceError when the text is blank.
    static GenerationResponse parse(const std::string& raw, size_t max_line_proposals = 4);

    /// Parse an already-decoded JSON value (object wrapper or array).
    /// Throws InferenceError for any other shape.
    static GenerationResponse fromJson(const nlohmann::json& value);

private:
    static std::string stripFence(const std::string& text);
    static Proposal proposalFromJson(const nlohmann::json& item);
};

} // namespace metatot
