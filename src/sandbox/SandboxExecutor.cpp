#include "sandbox/SandboxExecutor.hpp"
#include <algorithm>
#include <chrono>
#include <spdlog/spdlog.h>
#include "sandbox/ScratchDir.hpp"

namespace code_agent {

std::string trim_copy(const std::string& s) {
    size_t start = s.find_first_not_of(" \n\r\t");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \n\r\t");
    return s.substr(start, end - start + 1);
}

ExecutionResult ExecutionResult::failure(std::string error, double elapsed_ms) {
    ExecutionResult r;
    r.success = false;
    r.error = std::move(error);
    r.exit_code = -1;
    r.elapsed_ms = elapsed_ms;
    return r;
}

nlohmann::json ExecutionResult::to_json() const {
    return {
        {"success", success},
        {"output", output},
        {"error", error},
        {"exit_code", exit_code},
        {"execution_time_ms", elapsed_ms},
        {"timed_out", timed_out}
    };
}

SandboxExecutor::SandboxExecutor(std::shared_ptr<IContainerRuntime> runtime, SandboxSettings settings)
    : runtime_(std::move(runtime)), settings_(std::move(settings)) {
    if (!runtime_ || !runtime_->is_available()) {
        throw SandboxUnavailableError(
            "Container runtime is not available. Install Docker and make sure the daemon is running.");
    }
    spdlog::info("🛡️ Sandbox ready on {} ({} live containers max)",
                 runtime_->name(), settings_.max_concurrent_containers);
}

ExecutionResult SandboxExecutor::execute(const std::string& source_code,
                                         const std::string& language,
                                         int timeout_seconds) {
    auto lang = language_from_string(language);
    if (!lang) {
        return ExecutionResult::failure("Unsupported language: " + language);
    }
    return execute(source_code, *lang, timeout_seconds);
}

ExecutionResult SandboxExecutor::execute(const std::string& source_code,
                                         Language language,
                                         int timeout_seconds) {
    if (source_code.size() > settings_.max_source_bytes) {
        return ExecutionResult::failure("Source exceeds " + std::to_string(settings_.max_source_bytes) +
                                        " bytes, refusing to run it");
    }

    int timeout = timeout_seconds > 0 ? timeout_seconds : settings_.timeout_seconds;
    timeout = std::min(timeout, 300);
    const auto& spec = language_spec(language);

    spdlog::info("🐳 Executing {} code ({} bytes, {}s limit)", spec.name, source_code.size(), timeout);
    auto start = std::chrono::steady_clock::now();
    auto elapsed = [&start]() {
        return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
    };

    try {
        ScratchDir scratch("code_agent_exec");
        scratch.write_file(spec.source_file, source_code);

        ContainerSpec container;
        container.name = IContainerRuntime::unique_container_name("exec");
        container.image = image_for(settings_, language);
        container.command = spec.run_command;
        container.mount_dir = scratch.path();
        container.read_only_mount = true;
        container.memory_limit = settings_.memory_limit;
        container.cpu_limit = settings_.cpu_limit;
        container.pids_limit = settings_.pids_limit;
        container.timeout_seconds = timeout;
        container.output_limit = settings_.max_output_bytes;

        ContainerRunResult run;
        {
            ContainerLease lease(*runtime_, container.name);
            run = runtime_->run(container);
        }

        if (!run.launched) {
            if (!runtime_->is_available()) {
                throw SandboxUnavailableError("Container runtime went away: " + trim_copy(run.std_err));
            }
            return ExecutionResult::failure("Sandbox launch failed: " + trim_copy(run.std_err), elapsed());
        }
        if (run.timed_out) {
            auto r = ExecutionResult::failure("Execution timeout after " + std::to_string(timeout) + " seconds",
                                              run.elapsed_ms);
            r.output = trim_copy(run.std_out);
            r.timed_out = true;
            return r;
        }

        ExecutionResult result;
        result.exit_code = run.exit_code;
        result.success = run.exit_code == 0;
        result.output = trim_copy(run.std_out);
        result.error = trim_copy(run.std_err);
        result.elapsed_ms = run.elapsed_ms;

        spdlog::info("🐳 Execution finished: exit={} success={} ({:.0f} ms)",
                     result.exit_code, result.success, result.elapsed_ms);
        return result;
    } catch (const SandboxUnavailableError& e) {
        spdlog::critical("🚨 {}", e.what());
        throw;
    } catch (const std::exception& e) {
        spdlog::error("💥 Sandbox execution failed: {}", e.what());
        return ExecutionResult::failure(std::string("Execution error: ") + e.what(), elapsed());
    }
}

} // namespace code_agent
