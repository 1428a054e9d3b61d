#pragma once
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "AppConfig.hpp"
#include "agent/RetryOrchestrator.hpp"
#include "input_parser.hpp"

namespace code_agent {

struct QuestionResult {
    int number = 0;
    std::string question;
    Language language = Language::Python;
    std::string code;
    std::string output;
    SessionStatus session_status = SessionStatus::Pending;
    int iterations = 0;

    // "done" when the session validated, "needs attention" otherwise.
    std::string status() const { return session_status == SessionStatus::Succeeded ? "done" : "needs attention"; }

    nlohmann::json to_json() const;
};

struct BatchReport {
    AssignmentMeta meta;
    std::vector<QuestionResult> results;    // in question order
    std::string manifest_path;

    bool all_done() const;
    nlohmann::json to_json() const;
};

// Runs one retry session per question and writes the renderer manifest.
class BatchDriver {
public:
    BatchDriver(std::shared_ptr<RetryOrchestrator> orchestrator, BatchSettings settings);

    // Both throw ParseError for bad input; SandboxUnavailableError aborts the batch.
    BatchReport run_contents(const std::string& contents, const std::string& output_dir = "");
    BatchReport run_file(const std::string& path, const std::string& output_dir = "");

    BatchReport run(const ParsedAssignment& assignment, const std::string& output_dir = "");

    static std::string manifest_file_name(const AssignmentMeta& meta);

private:
    QuestionResult solve(const Question& q);
    std::string write_manifest(const BatchReport& report, const std::string& output_dir) const;

    std::shared_ptr<RetryOrchestrator> orchestrator_;
    BatchSettings settings_;
};

} // namespace code_agent
