#pragma once

#include "generation/inference_client.hpp"

#include <cstdint>
#include <string>

namespace metatot {

/// Offline candidate source. Produces phase-labelled variants of the
/// current thought and hash-derived hypothesis confidences, so runs
/// without a model are reproducible.
class TemplateInferenceClient : public InferenceClient {
public:
    explicit TemplateInferenceClient(size_t excerpt_length = 160)
        : excerpt_length_(excerpt_length) {}

    GenerationResponse generate(const std::string& prompt,
                                const nlohmann::json& context) override;

    std::string name() const override { return "template"; }

    /// Stable 64-bit FNV-1a.
    static uint64_t stableHash(const std::string& text);

    /// Prefix of at most max_bytes that never ends inside a UTF-8 sequence.
    static std::string excerpt(const std::string& text, size_t max_bytes);

private:
    size_t excerpt_length_;
};

} // namespace metatot
