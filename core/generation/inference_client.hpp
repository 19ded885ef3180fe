#pragma once

#include <nlohmann/json.hpp>

#include <functional>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

namespace metatot {

/// One candidate thought returned by the inference service, with the
/// service's confidence per named hypothesis (not yet normalized).
struct Proposal {
    std::string content;
    std::map<std::string, double> belief_hypotheses;
};

struct GenerationResponse {
    std::vector<Proposal> proposals;
};

/// Raised by inference backends on transport errors, bad responses
/// or upstream 5xx. The candidate generator treats it as an empty
/// expansion.
class InferenceError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// ─── Inference Client ──────────────────────────────────────────
// Capability boundary to the model that proposes thoughts.
// Implementations must be safe to call from several worker threads
// at once and hold no per-session state.

class InferenceClient {
public:
    virtual ~InferenceClient() = default;

    /// Blocking call. Throws InferenceError on failure.
    virtual GenerationResponse generate(const std::string& prompt,
                                        const nlohmann::json& context) = 0;

    virtual std::string name() const = 0;
};

using GenerateFn = std::function<GenerationResponse(const std::string& prompt,
                                                    const nlohmann::json& context)>;

/// Adapts a plain callable. Used for test stubs and the Python bridge.
class CallbackInferenceClient : public InferenceClient {
public:
    explicit CallbackInferenceClient(GenerateFn fn, std::string name = "callback")
        : fn_(std::move(fn)), name_(std::move(name)) {}

    GenerationResponse generate(const std::string& prompt,
                                const nlohmann::json& context) override {
        if (!fn_) throw InferenceError("No generate callback configured");
        return fn_(prompt, context);
    }

    std::string name() const override { return name_; }

private:
    GenerateFn fn_;
    std::string name_;
};

} // namespace metatot
