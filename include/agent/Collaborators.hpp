#pragma once
#include <optional>
#include <string>
#include <vector>
#include "LanguageRegistry.hpp"

namespace code_agent {

struct SynthesisRequest {
    Language language = Language::Python;
    std::string problem;
    std::vector<std::string> requirements;
    std::string prior_feedback;     // empty on the first iteration
};

struct SynthesisResult {
    bool ok = false;
    std::string code;
    std::string raw_text;
    int tokens_used = 0;
    std::string error;
};

struct CritiqueResult {
    bool ok = false;
    std::string feedback;
    std::string error;
};

// Produces candidate programs. Implementations report failure through the
// result instead of throwing.
class ISynthesizer {
public:
    virtual ~ISynthesizer() = default;
    virtual SynthesisResult synthesize(const SynthesisRequest& request) = 0;
};

// Reviews a candidate before it is executed.
class ICritic {
public:
    virtual ~ICritic() = default;
    virtual CritiqueResult critique(const std::string& problem,
                                    const std::vector<std::string>& requirements,
                                    const std::string& code,
                                    const std::optional<std::string>& execution_output) = 0;
};

// The critique protocol: "PASS" anywhere in the feedback, any case, approves.
bool review_passed(const std::string& feedback);

} // namespace code_agent
