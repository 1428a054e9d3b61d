#include "validation/EscalationPolicy.hpp"
#include <algorithm>
#include <cctype>

namespace code_agent {

namespace {
std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}
}

KeywordEscalation::KeywordEscalation(std::vector<std::string> keywords) {
    for (auto& k : keywords) {
        if (!k.empty()) keywords_.push_back(to_lower(std::move(k)));
    }
}

bool KeywordEscalation::should_escalate(const std::string& tool_output) const {
    if (keywords_.empty()) return false;
    std::string haystack = to_lower(tool_output);
    return std::any_of(keywords_.begin(), keywords_.end(), [&haystack](const std::string& k) {
        return haystack.find(k) != std::string::npos;
    });
}

std::string KeywordEscalation::describe() const {
    std::string out = "keywords [";
    for (size_t i = 0; i < keywords_.size(); ++i) {
        if (i) out += ", ";
        out += keywords_[i];
    }
    return out + "]";
}

bool AnyOutputEscalation::should_escalate(const std::string& tool_output) const {
    return tool_output.find_first_not_of(" \t\r\n") != std::string::npos;
}

std::shared_ptr<IEscalationPolicy> make_policy(const ToolSpec& tool) {
    switch (tool.escalation) {
        case EscalationKind::Keywords:
            return std::make_shared<KeywordEscalation>(tool.keywords);
        case EscalationKind::AnyOutput:
            return std::make_shared<AnyOutputEscalation>();
    }
    return std::make_shared<AnyOutputEscalation>();
}

} // namespace code_agent
