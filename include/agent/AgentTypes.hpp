#pragma once
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "LanguageRegistry.hpp"
#include "sandbox/SandboxExecutor.hpp"
#include "validation/ValidationAggregator.hpp"

namespace code_agent {

enum class SessionStatus {
    Pending,
    Succeeded,
    Exhausted,
    Fatal       // ceiling reached without a single candidate
};

enum class SessionState {
    Generating,
    Reviewing,
    Executing,
    Validating,
    Retrying,
    Complete,
    ExhaustedRetry
};

inline const char* to_string(SessionStatus s) {
    switch (s) {
        case SessionStatus::Pending: return "pending";
        case SessionStatus::Succeeded: return "succeeded";
        case SessionStatus::Exhausted: return "exhausted";
        case SessionStatus::Fatal: return "fatal";
    }
    return "unknown";
}

inline const char* to_string(SessionState s) {
    switch (s) {
        case SessionState::Generating: return "GENERATING";
        case SessionState::Reviewing: return "REVIEWING";
        case SessionState::Executing: return "EXECUTING";
        case SessionState::Validating: return "VALIDATING";
        case SessionState::Retrying: return "RETRYING";
        case SessionState::Complete: return "COMPLETE";
        case SessionState::ExhaustedRetry: return "EXHAUSTED_RETRY";
    }
    return "UNKNOWN";
}

// One question taken from an assignment file.
struct Question {
    int number = 0;
    std::string problem;
    Language language = Language::Python;
    std::vector<std::string> requirements;
};

struct AssignmentMeta {
    std::string subject;
    int assignment_number = 1;
    std::string name;
    std::string class_name;
    std::string division;
    std::string roll_no;
    std::string batch;

    nlohmann::json to_json() const {
        return {
            {"subject", subject},
            {"assignment_number", assignment_number},
            {"name", name},
            {"class", class_name},
            {"div", division},
            {"roll_no", roll_no},
            {"batch", batch}
        };
    }
};

// Working state of one retry loop. Owned by RetryOrchestrator::run.
struct Session {
    std::string id;
    std::string problem;
    Language language = Language::Python;
    std::vector<std::string> requirements;
    int iteration = 0;
    int ceiling = 1;
    std::string candidate;
    std::string executed_code;      // candidate that last_execution/last_verdict belong to
    std::optional<ExecutionResult> last_execution;
    std::optional<ValidationVerdict> last_verdict;
    std::vector<std::string> feedback_history;
    SessionStatus status = SessionStatus::Pending;
    SessionState state = SessionState::Generating;
    int tokens_used = 0;
    int llm_calls = 0;
};

// What a finished session hands back.
struct SessionOutcome {
    std::string final_code;
    std::string final_output;
    ValidationVerdict verdict;
    SessionStatus status = SessionStatus::Pending;
    SessionState state = SessionState::Generating;
    int iterations = 0;
    std::vector<std::string> feedback_history;
    int tokens_used = 0;
    int llm_calls = 0;
    std::optional<ExecutionResult> last_execution;

    bool succeeded() const { return status == SessionStatus::Succeeded; }

    nlohmann::json to_json() const {
        nlohmann::json j = {
            {"final_code", final_code},
            {"final_output", final_output},
            {"verdict", verdict.to_json()},
            {"status", to_string(status)},
            {"state", to_string(state)},
            {"iterations", iterations},
            {"feedback_history", feedback_history},
            {"tokens_used", tokens_used},
            {"llm_calls", llm_calls}
        };
        j["execution"] = last_execution ? last_execution->to_json() : nlohmann::json(nullptr);
        return j;
    }
};

} // namespace code_agent
