#pragma once
#include <memory>
#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>
#include "AppConfig.hpp"
#include "LanguageRegistry.hpp"
#include "sandbox/ContainerRuntime.hpp"

namespace code_agent {

// Raised at construction when no container runtime can be reached. Callers
// treat it as an infrastructure failure, never as a per-job error.
class SandboxUnavailableError : public std::runtime_error {
public:
    explicit SandboxUnavailableError(const std::string& msg) : std::runtime_error(msg) {}
};

// Outcome of one sandboxed run. Built once by SandboxExecutor, then only read.
struct ExecutionResult {
    bool success = false;       // exit code is exactly 0
    std::string output;         // trimmed stdout
    std::string error;          // trimmed stderr, or a synthetic message
    int exit_code = -1;
    double elapsed_ms = 0.0;
    bool timed_out = false;

    static ExecutionResult failure(std::string error, double elapsed_ms = 0.0);
    nlohmann::json to_json() const;
};

class SandboxExecutor {
public:
    // Throws SandboxUnavailableError when runtime->is_available() is false.
    SandboxExecutor(std::shared_ptr<IContainerRuntime> runtime, SandboxSettings settings);

    // timeout_seconds <= 0 uses the configured default. Failures come back as
    // data, except a launch failure with the runtime gone, which throws
    // SandboxUnavailableError.
    ExecutionResult execute(const std::string& source_code,
                            const std::string& language,
                            int timeout_seconds = 0);

    ExecutionResult execute(const std::string& source_code,
                            Language language,
                            int timeout_seconds = 0);

    const SandboxSettings& settings() const { return settings_; }

private:
    std::shared_ptr<IContainerRuntime> runtime_;
    SandboxSettings settings_;
};

std::string trim_copy(const std::string& s);

} // namespace code_agent
