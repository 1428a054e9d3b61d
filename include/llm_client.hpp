#pragma once
#include <memory>
#include <string>
#include "AppConfig.hpp"
#include "KeyManager.hpp"
#include "agent/Collaborators.hpp"

namespace code_agent {

std::string utf8_safe_substr(const std::string& str, size_t length);

// Pulls the program out of a model reply: the first ``` or ~~~ fenced block,
// else the reply minus a leading fence line and trailing fence, else the
// trimmed reply.
std::string extract_code(const std::string& response);

struct ChatReply {
    bool ok = false;
    std::string text;
    int tokens_used = 0;
    long status_code = 0;
    std::string error;
};

// Thin chat-completions client for an OpenAI-compatible endpoint.
class LlmClient {
public:
    LlmClient(std::shared_ptr<KeyManager> key_manager, LlmSettings settings);

    // purpose tags the call in LogManager ("synthesis", "critique"). Never throws.
    ChatReply complete(const std::string& prompt, const std::string& purpose);

    const LlmSettings& settings() const { return settings_; }

private:
    std::shared_ptr<KeyManager> key_manager_;
    LlmSettings settings_;
};

class LlmCodeSynthesizer : public ISynthesizer {
public:
    explicit LlmCodeSynthesizer(std::shared_ptr<LlmClient> client) : client_(std::move(client)) {}

    SynthesisResult synthesize(const SynthesisRequest& request) override;

    static std::string build_prompt(const SynthesisRequest& request);

private:
    std::shared_ptr<LlmClient> client_;
};

class LlmCodeReviewer : public ICritic {
public:
    explicit LlmCodeReviewer(std::shared_ptr<LlmClient> client) : client_(std::move(client)) {}

    CritiqueResult critique(const std::string& problem,
                            const std::vector<std::string>& requirements,
                            const std::string& code,
                            const std::optional<std::string>& execution_output) override;

    static std::string build_prompt(const std::string& problem,
                                    const std::vector<std::string>& requirements,
                                    const std::string& code,
                                    const std::optional<std::string>& execution_output);

private:
    std::shared_ptr<LlmClient> client_;
};

} // namespace code_agent
