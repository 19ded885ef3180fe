#include "generation/response_parser.hpp"

#include <cctype>
#include <initializer_list>
#include <sstream>

namespace metatot {

namespace {

std::string trim(const std::string& s) {
    size_t begin = 0, end = s.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) begin++;
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) end--;
    return s.substr(begin, end - begin);
}

// Drop "- ", "* ", "• " and "1. " / "2) " style list markers.
std::string stripListMarker(const std::string& line) {
    std::string s = trim(line);
    if (s.rfind("- ", 0) == 0 || s.rfind("* ", 0) == 0) return trim(s.substr(2));
    if (s.rfind("•", 0) == 0) return trim(s.substr(std::string("•").size()));

    size_t i = 0;
    while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) i++;
    if (i > 0 && i < s.size() && (s[i] == '.' || s[i] == ')')) return trim(s.substr(i + 1));
    return s;
}

const nlohmann::json* firstField(const nlohmann::json& obj,
                                 std::initializer_list<const char*> names) {
    for (const char* name : names) {
        auto it = obj.find(name);
        if (it != obj.end() && !it->is_null()) return &*it;
    }
    return nullptr;
}

} // namespace

std::string ResponseParser::stripFence(const std::string& text) {
    std::string s = trim(text);
    if (s.rfind("```", 0) != 0) return s;

    size_t first_newline = s.find('\n');
    if (first_newline == std::string::npos) return s;
    size_t closing = s.rfind("```");
    if (closing <= first_newline) closing = s.size();
    return trim(s.substr(first_newline + 1, closing - first_newline - 1));
}

Proposal ResponseParser::proposalFromJson(const nlohmann::json& item) {
    Proposal p;
    if (item.is_string()) {
        p.content = trim(item.get<std::string>());
        return p;
    }
    if (!item.is_object()) {
        p.content = item.dump();
        return p;
    }

    if (const auto* content = firstField(item, {"content", "thought", "text"})) {
        p.content = content->is_string() ? trim(content->get<std::string>()) : content->dump();
    }
    if (const auto* beliefs = firstField(item, {"belief_hypotheses", "beliefs", "hypotheses"})) {
        if (beliefs->is_object()) {
            for (auto it = beliefs->begin(); it != beliefs->end(); ++it) {
                if (it.value().is_number()) {
                    p.belief_hypotheses[it.key()] = it.value().get<double>();
                }
            }
        }
    }
    return p;
}

GenerationResponse ResponseParser::fromJson(const nlohmann::json& value) {
    const nlohmann::json* items = &value;
    if (value.is_object()) {
        auto it = value.find("proposals");
        if (it == value.end()) {
            throw InferenceError("Response object has no 'proposals' field");
        }
        items = &*it;
    }
    if (!items->is_array()) {
        throw InferenceError("Proposals must be a JSON array");
    }

    GenerationResponse response;
    for (const auto& item : *items) {
        Proposal p = proposalFromJson(item);
        if (!p.content.empty()) response.proposals.push_back(std::move(p));
    }
    return response;
}

GenerationResponse ResponseParser::parse(const std::string& raw, size_t max_line_proposals) {
    std::string cleaned = stripFence(raw);
    if (cleaned.empty()) {
        throw InferenceError("Empty completion");
    }

    nlohmann::json value = nlohmann::json::parse(cleaned, nullptr, false);
    if (!value.is_discarded() && (value.is_array() || value.is_object())) {
        return fromJson(value);
    }

    GenerationResponse response;
    std::istringstream lines(cleaned);
    std::string line;
    while (std::getline(lines, line) && response.proposals.size() < max_line_proposals) {
        std::string content = stripListMarker(line);
        if (content.empty()) continue;
        Proposal p;
        p.content = content;
        response.proposals.push_back(std::move(p));
    }
    return response;
}

} // namespace metatot
