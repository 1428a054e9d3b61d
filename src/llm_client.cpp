#include "llm_client.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <thread>
#include <cpr/cpr.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include "LogManager.hpp"
#include "SystemMonitor.hpp"
#include "sandbox/SandboxExecutor.hpp"

namespace code_agent {

using json = nlohmann::json;

std::string utf8_safe_substr(const std::string& str, size_t length) {
    if (str.length() <= length) return str;
    std::string sub = str.substr(0, length);
    while (!sub.empty()) {
        unsigned char c = static_cast<unsigned char>(sub.back());
        if (c < 0x80) break;
        if (c >= 0xC0) { sub.pop_back(); break; }
        sub.pop_back();
    }
    return sub;
}

namespace {

std::string upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

// Body of the first fenced block opened by `fence`, if it is closed.
std::optional<std::string> fenced_block(const std::string& text, const std::string& fence) {
    size_t open = text.find(fence);
    if (open == std::string::npos) return std::nullopt;
    size_t body = text.find('\n', open);
    if (body == std::string::npos) return std::nullopt;
    ++body;
    size_t close = text.find(fence, body);
    if (close == std::string::npos) return std::nullopt;
    return trim_copy(text.substr(body, close - body));
}

template<typename Func>
cpr::Response perform_request_with_retry(Func request_factory, const std::shared_ptr<KeyManager>& km,
                                         int max_retries) {
    cpr::Response r;
    for (int i = 0; i < max_retries; ++i) {
        r = request_factory();
        if (r.status_code == 200) {
            if (km) km->report_success();
            return r;
        }
        if ((r.status_code == 429 || r.status_code == 503) && km) {
            spdlog::warn("⚠️ API {} ({}). Rotating key and cooling down (Attempt {}/{})...",
                         r.status_code, (r.status_code == 429 ? "Quota" : "Overload"), i + 1, max_retries);
            km->report_rate_limit();
            if (i + 1 < max_retries) {
                std::this_thread::sleep_for(std::chrono::milliseconds(2000 + (i * 1000)));
            }
            continue;
        }
        break;
    }
    return r;
}

} // namespace

std::string extract_code(const std::string& response) {
    std::string text = trim_copy(response);

    auto backtick = text.find("```");
    auto tilde = text.find("~~~");
    // Whichever fence style opens first wins.
    if (backtick != std::string::npos && (tilde == std::string::npos || backtick < tilde)) {
        if (auto block = fenced_block(text, "```")) return *block;
    } else if (tilde != std::string::npos) {
        if (auto block = fenced_block(text, "~~~")) return *block;
    }

    if (text.rfind("```", 0) == 0) {
        size_t first_nl = text.find('\n');
        if (first_nl == std::string::npos) return "";
        std::string rest = text.substr(first_nl + 1);
        std::string trimmed = trim_copy(rest);
        if (trimmed.size() >= 3 && trimmed.compare(trimmed.size() - 3, 3, "```") == 0) {
            trimmed.resize(trimmed.size() - 3);
        }
        return trim_copy(trimmed);
    }
    return text;
}

LlmClient::LlmClient(std::shared_ptr<KeyManager> key_manager, LlmSettings settings)
    : key_manager_(std::move(key_manager)), settings_(std::move(settings)) {}

ChatReply LlmClient::complete(const std::string& prompt, const std::string& purpose) {
    ChatReply reply;
    const std::string model = key_manager_ ? key_manager_->get_current_model() : settings_.model;

    json payload = {
        {"model", model},
        {"messages", json::array({{{"role", "user"}, {"content", prompt}}})},
        {"temperature", settings_.temperature},
        {"max_tokens", settings_.max_tokens}
    };
    const std::string body = payload.dump(-1, ' ', false, json::error_handler_t::replace);
    const auto timeout_ms = static_cast<int32_t>(settings_.timeout_seconds) * 1000;

    auto start = std::chrono::high_resolution_clock::now();
    auto r = perform_request_with_retry([&]() {
        // Re-read the key on every attempt so a rotation takes effect.
        std::string key = key_manager_ ? key_manager_->get_current_key() : "";
        return cpr::Post(cpr::Url{settings_.endpoint},
                         cpr::Header{{"Content-Type", "application/json"},
                                     {"Authorization", "Bearer " + key}},
                         cpr::Body{body},
                         cpr::ConnectTimeout{timeout_ms},
                         cpr::Timeout{timeout_ms});
    }, key_manager_, std::max(1, settings_.max_retries));
    double duration = std::chrono::duration<double, std::milli>(
        std::chrono::high_resolution_clock::now() - start).count();
    SystemMonitor::global_llm_generation_ms.store(duration);

    reply.status_code = r.status_code;
    if (r.error.code != cpr::ErrorCode::OK) {
        reply.error = "LLM request failed: " + r.error.message;
    } else if (r.status_code != 200) {
        reply.error = "LLM API error [" + std::to_string(r.status_code) + "]: " + utf8_safe_substr(r.text, 300);
    } else {
        try {
            auto j = json::parse(r.text);
            const auto& choices = j.at("choices");
            if (choices.empty()) throw std::runtime_error("response has no choices");
            reply.text = choices[0].at("message").at("content").get<std::string>();
            if (j.contains("usage") && j["usage"].contains("total_tokens")) {
                reply.tokens_used = j["usage"]["total_tokens"].get<int>();
            }
            reply.ok = true;
        } catch (const std::exception& e) {
            reply.error = std::string("Malformed LLM response: ") + e.what();
        }
    }

    if (reply.ok) {
        SystemMonitor::global_output_tokens.fetch_add(reply.tokens_used);
        spdlog::info("🧠 {} call finished in {:.0f} ms ({} tokens)", purpose, duration, reply.tokens_used);
    } else {
        spdlog::error("❌ {} call failed: {}", purpose, reply.error);
    }

    LogManager::instance().add_log({
        0, purpose, model, prompt,
        reply.ok ? reply.text : reply.error,
        reply.tokens_used, duration, reply.ok
    });
    return reply;
}

std::string LlmCodeSynthesizer::build_prompt(const SynthesisRequest& request) {
    const auto& spec = language_spec(request.language);
    const std::string lang = spec.name;
    const std::string LANG = upper(lang);

    std::string prompt =
        "You are an expert " + LANG + " programmer. Generate clean, production-ready code.\n\n"
        "PROBLEM:\n" + request.problem + "\n\n"
        "PROGRAMMING LANGUAGE: " + LANG + "\n\n";

    if (!request.requirements.empty()) {
        prompt += "SPECIFIC REQUIREMENTS:\n";
        for (const auto& req : request.requirements) prompt += "- " + req + "\n";
        prompt += "\n";
    }

    prompt +=
        "REQUIREMENTS:\n"
        "1. Write complete, runnable code\n"
        "2. Include all necessary imports\n"
        "3. Add clear comments explaining the logic\n"
        "4. Handle edge cases and errors\n"
        "5. Follow " + lang + " best practices and style guidelines\n"
        "6. Make the code efficient and readable\n";
    if (request.language == Language::Java) {
        prompt += "7. The public class containing main() MUST be named Main\n";
    }
    prompt += "\n";

    if (!request.prior_feedback.empty()) {
        prompt +=
            "\nPREVIOUS ATTEMPT FAILED. FEEDBACK:\n" + request.prior_feedback + "\n\n"
            "IMPORTANT: Fix the issues mentioned above and generate improved code.\n\n";
    }

    prompt +=
        "\nCRITICAL OUTPUT RULES:\n"
        "1. DO NOT include markdown code blocks (no ```)\n"
        "2. DO NOT include language tags like ```\n"
        "3. DO NOT add any explanations before or after the code\n"
        "4. START IMMEDIATELY with the first line of actual " + lang + " code\n"
        "5. END with the last line of actual " + lang + " code\n\n"
        "Your response MUST start with actual " + lang + " code, not with ```:\n";
    return prompt;
}

SynthesisResult LlmCodeSynthesizer::synthesize(const SynthesisRequest& request) {
    SynthesisResult result;
    spdlog::info("✍️ Synthesizing {} candidate{}", to_string(request.language),
                 request.prior_feedback.empty() ? "" : " with feedback");

    ChatReply reply = client_->complete(build_prompt(request), "synthesis");
    result.tokens_used = reply.tokens_used;
    if (!reply.ok) {
        result.error = "Code generation failed: " + reply.error;
        return result;
    }
    result.raw_text = reply.text;
    result.code = extract_code(reply.text);
    if (result.code.empty()) {
        result.error = "Code generation failed: model returned no code";
        return result;
    }
    result.ok = true;
    return result;
}

std::string LlmCodeReviewer::build_prompt(const std::string& problem,
                                          const std::vector<std::string>& requirements,
                                          const std::string& code,
                                          const std::optional<std::string>& execution_output) {
    std::string prompt =
        "You are a strict senior code reviewer. Check whether the code below fully solves the problem.\n\n"
        "PROBLEM:\n" + problem + "\n\n";
    if (!requirements.empty()) {
        prompt += "REQUIREMENTS:\n";
        for (const auto& req : requirements) prompt += "- " + req + "\n";
        prompt += "\n";
    }
    prompt += "CODE:\n" + code + "\n\n";
    if (execution_output) {
        prompt += "OUTPUT OF THE PREVIOUS RUN:\n" + *execution_output + "\n\n";
    }
    prompt +=
        "If the code is correct, complete and runnable, reply with the single word PASS.\n"
        "Otherwise reply with a numbered list of concrete defects and how to fix them. "
        "Do not rewrite the code.\n";
    return prompt;
}

CritiqueResult LlmCodeReviewer::critique(const std::string& problem,
                                         const std::vector<std::string>& requirements,
                                         const std::string& code,
                                         const std::optional<std::string>& execution_output) {
    CritiqueResult result;
    ChatReply reply = client_->complete(build_prompt(problem, requirements, code, execution_output), "critique");
    if (!reply.ok) {
        result.error = "Code review failed: " + reply.error;
        return result;
    }
    result.ok = true;
    result.feedback = trim_copy(reply.text);
    return result;
}

} // namespace code_agent
