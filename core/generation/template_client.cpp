#include "generation/template_client.hpp"

#include <utility>
#include <vector>

namespace metatot {

uint64_t TemplateInferenceClient::stableHash(const std::string& text) {
    uint64_t h = 1469598103934665603ULL;
    for (unsigned char c : text) {
        h ^= c;
        h *= 1099511628211ULL;
    }
    return h;
}

std::string TemplateInferenceClient::excerpt(const std::string& text, size_t max_bytes) {
    if (text.size() <= max_bytes) return text;
    size_t cut = max_bytes;
    // back off continuation bytes (10xxxxxx) to the start of the code point
    while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) cut--;
    return text.substr(0, cut);
}

GenerationResponse TemplateInferenceClient::generate(const std::string& prompt,
                                                     const nlohmann::json& context) {
    std::string phase = context.value("phase", std::string("explore"));
    std::string thought = context.value("thought", prompt);
    std::string prefix = excerpt(thought, excerpt_length_);

    std::vector<std::string> labels;
    if (phase == "challenge") {
        labels = {"Challenge critique", "Challenge counter-proposal"};
    } else if (phase == "evolve") {
        labels = {"Evolve refinement"};
    } else if (phase == "integrate") {
        labels = {"Integrate synthesis"};
    } else {
        labels = {"Explore branch", "Explore alternative", "Explore refinement"};
    }

    std::vector<std::string> hypotheses;
    auto it = context.find("hypotheses");
    if (it != context.end() && it->is_array()) {
        for (const auto& h : *it) {
            if (h.is_string()) hypotheses.push_back(h.get<std::string>());
        }
    }
    if (hypotheses.empty()) hypotheses = {"viable", "risky"};

    GenerationResponse response;
    for (const auto& label : labels) {
        Proposal p;
        p.content = label + ": " + prefix;
        for (const auto& h : hypotheses) {
            uint64_t bucket = stableHash(p.content + "|" + h) % 1000;
            p.belief_hypotheses[h] = 0.05 + static_cast<double>(bucket) / 1000.0;
        }
        response.proposals.push_back(std::move(p));
    }
    return response;
}

} // namespace metatot
