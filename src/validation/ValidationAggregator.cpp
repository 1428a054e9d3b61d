#include "validation/ValidationAggregator.hpp"
#include <algorithm>
#include <chrono>
#include <spdlog/spdlog.h>
#include "LogManager.hpp"

namespace code_agent {

ValidationVerdict ValidationVerdict::from(std::vector<std::string> diagnostics,
                                          std::map<std::string, std::string> raw_outputs) {
    ValidationVerdict v;
    v.diagnostics = std::move(diagnostics);
    v.raw_outputs = std::move(raw_outputs);
    v.passed = v.diagnostics.empty();
    return v;
}

std::string ValidationVerdict::digest() const {
    if (diagnostics.empty()) return "";
    std::string out = "Validation errors:";
    for (const auto& d : diagnostics) {
        out += "\n- ";
        out += d;
    }
    return out;
}

nlohmann::json ValidationVerdict::to_json() const {
    return {
        {"passed", passed},
        {"diagnostics", diagnostics},
        {"raw_outputs", raw_outputs}
    };
}

ValidationAggregator::ValidationAggregator(std::shared_ptr<IContainerRuntime> runtime,
                                           SandboxSettings sandbox,
                                           ValidationSettings settings)
    : runtime_(std::move(runtime)),
      sandbox_(std::move(sandbox)),
      settings_(std::move(settings)),
      cache_(settings_.cache_entries, std::chrono::seconds(settings_.cache_ttl_seconds)) {
    if (!runtime_) throw std::invalid_argument("ValidationAggregator needs a container runtime");
}

void ValidationAggregator::set_policy(const std::string& tool_name,
                                      std::shared_ptr<IEscalationPolicy> policy) {
    std::lock_guard<std::mutex> lock(policy_mtx_);
    if (policy) {
        policy_overrides_[tool_name] = std::move(policy);
    } else {
        policy_overrides_.erase(tool_name);
    }
    cache_.clear();
}

std::shared_ptr<IEscalationPolicy> ValidationAggregator::policy_for(const ToolSpec& tool) const {
    {
        std::lock_guard<std::mutex> lock(policy_mtx_);
        auto it = policy_overrides_.find(tool.name);
        if (it != policy_overrides_.end()) return it->second;
    }
    return make_policy(tool);
}

bool ValidationAggregator::is_disabled(const std::string& tool_name) const {
    const auto& off = settings_.disabled_tools;
    return std::find(off.begin(), off.end(), tool_name) != off.end();
}

std::string ValidationAggregator::escalated_message(const std::string& tool_name,
                                                    const std::string& output) const {
    std::string body = trim_copy(output);
    if (body.size() > settings_.max_diagnostic_chars) {
        body.resize(settings_.max_diagnostic_chars);
    }
    return tool_name + ": " + body;
}

ValidationVerdict ValidationAggregator::validate(const std::string& source_code,
                                                 const std::string& language) {
    auto lang = language_from_string(language);
    if (!lang) {
        return ValidationVerdict::from({"Unsupported language: " + language});
    }
    return validate(source_code, *lang);
}

ValidationVerdict ValidationAggregator::validate(const std::string& source_code, Language language) {
    const auto& spec = language_spec(language);
    if (source_code.size() > sandbox_.max_source_bytes) {
        return ValidationVerdict::from({"Source exceeds " + std::to_string(sandbox_.max_source_bytes) +
                                        " bytes, refusing to validate it"});
    }

    const std::string key = content_key(spec.name, source_code);
    if (auto cached = cache_.get(key)) {
        spdlog::debug("♻️ Validation cache hit for {} ({} bytes)", spec.name, source_code.size());
        return *cached;
    }

    std::vector<std::string> diagnostics;
    std::map<std::string, std::string> raw;
    bool infra_error = false;   // a finding about the sandbox, not the code

    try {
        ScratchDir scratch("code_agent_lint");
        scratch.write_file(spec.source_file, source_code);

        for (const auto& tool : spec.tools) {
            if (is_disabled(tool.name)) {
                spdlog::debug("🔕 Skipping disabled tool {}", tool.name);
                continue;
            }
            try {
                ToolOutcome outcome = run_tool(tool, language, scratch.path());
                raw[tool.name] = outcome.output;
                if (outcome.timed_out) {
                    infra_error = true;
                    diagnostics.push_back(tool.name + ": timed out after " +
                                          std::to_string(settings_.tool_timeout_seconds) + " seconds");
                } else if (policy_for(tool)->should_escalate(outcome.output)) {
                    diagnostics.push_back(escalated_message(tool.name, outcome.output));
                }
            } catch (const SandboxUnavailableError&) {
                throw;
            } catch (const std::exception& e) {
                spdlog::warn("⚠️ Validation tool {} failed: {}", tool.name, e.what());
                infra_error = true;
                diagnostics.push_back("validation engine error: " + tool.name + ": " + e.what());
            }
        }
    } catch (const SandboxUnavailableError&) {
        throw;
    } catch (const std::exception& e) {
        // Scratch setup failed before any tool ran.
        spdlog::error("💥 Validation setup failed: {}", e.what());
        return ValidationVerdict::from({std::string("validation engine error: setup: ") + e.what()}, raw);
    }

    auto verdict = ValidationVerdict::from(std::move(diagnostics), std::move(raw));
    spdlog::info("🔍 Validation of {} code: {} ({} findings)",
                 spec.name, verdict.passed ? "clean" : "flagged", verdict.diagnostics.size());
    if (!infra_error) cache_.set(key, verdict);
    return verdict;
}

ValidationAggregator::ToolOutcome ValidationAggregator::run_tool(const ToolSpec& tool,
                                                                 Language language,
                                                                 const fs::path& mount_dir) {
    ContainerSpec container;
    container.name = IContainerRuntime::unique_container_name("lint-" + tool.name);
    container.image = image_for(sandbox_, language);
    container.command = tool.command;
    container.mount_dir = mount_dir;
    container.read_only_mount = false;
    container.memory_limit = sandbox_.memory_limit;
    container.cpu_limit = sandbox_.cpu_limit;
    container.pids_limit = sandbox_.pids_limit;
    container.timeout_seconds = settings_.tool_timeout_seconds;
    container.output_limit = sandbox_.max_output_bytes;

    ContainerRunResult run;
    {
        ContainerLease lease(*runtime_, container.name);
        run = runtime_->run(container);
    }

    LogManager::instance().add_trace({"VALIDATION", tool.name, to_string(language),
                                      run.timed_out ? "timeout" : "exit " + std::to_string(run.exit_code),
                                      run.elapsed_ms});

    if (!run.launched) {
        if (!runtime_->is_available()) {
            throw SandboxUnavailableError("Container runtime went away while running " + tool.name + ": " +
                                          trim_copy(run.std_err));
        }
        throw std::runtime_error("could not launch container: " + trim_copy(run.std_err));
    }

    ToolOutcome outcome;
    outcome.timed_out = run.timed_out;
    outcome.output = run.std_out;
    if (!run.std_err.empty()) {
        if (!outcome.output.empty()) outcome.output += "\n";
        outcome.output += run.std_err;
    }
    return outcome;
}

ValidationVerdict ValidationAggregator::judge(const std::string& source_code,
                                              Language language,
                                              const ExecutionResult& execution) {
    ValidationVerdict verdict = validate(source_code, language);
    if (execution.success) return verdict;

    std::string detail = execution.error;
    if (detail.size() > settings_.max_diagnostic_chars) detail.resize(settings_.max_diagnostic_chars);

    std::string diag = execution.timed_out
        ? "execution: " + detail
        : "execution: exit code " + std::to_string(execution.exit_code) + ": " + detail;

    auto diagnostics = verdict.diagnostics;
    diagnostics.push_back(std::move(diag));
    return ValidationVerdict::from(std::move(diagnostics), verdict.raw_outputs);
}

} // namespace code_agent
