#include "batch_driver.hpp"
#include <algorithm>
#include <atomic>
#include <filesystem>
#include <fstream>
#include <future>
#include <spdlog/spdlog.h>
#include "ThreadPool.hpp"

namespace code_agent {

namespace fs = std::filesystem;

nlohmann::json QuestionResult::to_json() const {
    return {
        {"number", number},
        {"question", question},
        {"language", to_string(language)},
        {"code", code},
        {"output", output},
        {"status", status()},
        {"iterations", iterations}
    };
}

bool BatchReport::all_done() const {
    return std::all_of(results.begin(), results.end(),
                       [](const QuestionResult& r) { return r.session_status == SessionStatus::Succeeded; });
}

nlohmann::json BatchReport::to_json() const {
    nlohmann::json list = nlohmann::json::array();
    for (const auto& r : results) list.push_back(r.to_json());
    return {
        {"meta", meta.to_json()},
        {"questions", list}
    };
}

BatchDriver::BatchDriver(std::shared_ptr<RetryOrchestrator> orchestrator, BatchSettings settings)
    : orchestrator_(std::move(orchestrator)), settings_(std::move(settings)) {
    if (!orchestrator_) throw std::invalid_argument("BatchDriver needs an orchestrator");
}

std::string BatchDriver::manifest_file_name(const AssignmentMeta& meta) {
    std::string subject = meta.subject.empty() ? "Assignment" : meta.subject;
    std::replace(subject.begin(), subject.end(), ' ', '_');
    std::replace(subject.begin(), subject.end(), '/', '_');
    return subject + "_Assignment_" + std::to_string(meta.assignment_number) + ".json";
}

BatchReport BatchDriver::run_contents(const std::string& contents, const std::string& output_dir) {
    return run(InputParser::parse(contents), output_dir);
}

BatchReport BatchDriver::run_file(const std::string& path, const std::string& output_dir) {
    return run(InputParser::parse_file(path), output_dir);
}

QuestionResult BatchDriver::solve(const Question& q) {
    spdlog::info("📌 Processing Question {} ({})", q.number, to_string(q.language));
    SessionOutcome outcome = orchestrator_->run(q.problem, q.language, q.requirements);

    QuestionResult r;
    r.number = q.number;
    r.question = q.problem;
    r.language = q.language;
    r.code = outcome.final_code;
    r.output = outcome.final_output;
    r.session_status = outcome.status;
    r.iterations = outcome.iterations;
    return r;
}

BatchReport BatchDriver::run(const ParsedAssignment& assignment, const std::string& output_dir) {
    BatchReport report;
    report.meta = assignment.meta;

    const size_t workers = std::min<size_t>(std::max(1, settings_.max_parallel_sessions),
                                            std::max<size_t>(1, assignment.questions.size()));
    spdlog::info("📦 Batch start: {} question(s) on {} worker(s)", assignment.questions.size(), workers);

    std::vector<std::future<QuestionResult>> pending;
    std::atomic<bool> sandbox_lost{false};
    {
        ThreadPool pool(workers);
        for (const auto& q : assignment.questions) {
            // Queued questions bail out once any worker has lost the sandbox.
            pending.push_back(pool.enqueue([this, q, &sandbox_lost]() {
                if (sandbox_lost) throw SandboxUnavailableError("Batch aborted: container runtime unavailable");
                try {
                    return solve(q);
                } catch (const SandboxUnavailableError&) {
                    sandbox_lost = true;
                    throw;
                }
            }));
        }

        for (size_t i = 0; i < pending.size(); ++i) {
            const auto& q = assignment.questions[i];
            try {
                report.results.push_back(pending[i].get());
            } catch (const SandboxUnavailableError& e) {
                sandbox_lost = true;
                spdlog::critical("🚨 Question {}: {}", q.number, e.what());
                throw;
            } catch (const std::exception& e) {
                spdlog::error("💥 Question {} crashed: {}", q.number, e.what());
                QuestionResult failed;
                failed.number = q.number;
                failed.question = q.problem;
                failed.language = q.language;
                failed.output = std::string("Internal error: ") + e.what();
                failed.session_status = SessionStatus::Fatal;
                report.results.push_back(std::move(failed));
            }
        }
    }

    report.manifest_path = write_manifest(report, output_dir.empty() ? settings_.output_dir : output_dir);
    size_t done = std::count_if(report.results.begin(), report.results.end(),
                                [](const QuestionResult& r) { return r.session_status == SessionStatus::Succeeded; });
    spdlog::info("✅ Batch finished: {}/{} done, manifest {}", done, report.results.size(), report.manifest_path);
    return report;
}

std::string BatchDriver::write_manifest(const BatchReport& report, const std::string& output_dir) const {
    fs::path dir(output_dir);
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) throw std::runtime_error("Cannot create output directory " + dir.string() + ": " + ec.message());

    fs::path target = dir / manifest_file_name(report.meta);
    std::ofstream out(target, std::ios::binary | std::ios::trunc);
    if (!out) throw std::runtime_error("Cannot write manifest " + target.string());
    out << report.to_json().dump(2);
    if (!out) throw std::runtime_error("Failed writing manifest " + target.string());
    return target.string();
}

} // namespace code_agent
