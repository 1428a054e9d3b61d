#pragma once
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "AppConfig.hpp"
#include "cache_manager.hpp"
#include "sandbox/ContainerRuntime.hpp"
#include "sandbox/SandboxExecutor.hpp"
#include "sandbox/ScratchDir.hpp"
#include "validation/EscalationPolicy.hpp"

namespace code_agent {

// pass == diagnostics.empty(); only from() builds one, so the two cannot drift.
struct ValidationVerdict {
    bool passed = false;
    std::vector<std::string> diagnostics;               // one per failing tool
    std::map<std::string, std::string> raw_outputs;     // tool name -> raw text

    static ValidationVerdict from(std::vector<std::string> diagnostics,
                                  std::map<std::string, std::string> raw_outputs = {});

    // Diagnostic digest fed back into the next synthesis prompt.
    std::string digest() const;
    nlohmann::json to_json() const;
};

class ValidationAggregator {
public:
    ValidationAggregator(std::shared_ptr<IContainerRuntime> runtime,
                         SandboxSettings sandbox,
                         ValidationSettings settings);

    // Tool failures become diagnostics. Throws SandboxUnavailableError when a
    // container cannot launch because the runtime itself is gone. Verdicts
    // touched by a tool timeout or engine error are not cached.
    ValidationVerdict validate(const std::string& source_code, const std::string& language);
    ValidationVerdict validate(const std::string& source_code, Language language);

    // validate() plus an "execution" diagnostic when the run failed.
    ValidationVerdict judge(const std::string& source_code, Language language,
                            const ExecutionResult& execution);

    // Replaces the escalation policy used for every tool with this name.
    void set_policy(const std::string& tool_name, std::shared_ptr<IEscalationPolicy> policy);

    std::string escalated_message(const std::string& tool_name, const std::string& output) const;

private:
    struct ToolOutcome {
        std::string output;
        bool timed_out = false;
    };

    ToolOutcome run_tool(const ToolSpec& tool, Language language, const fs::path& mount_dir);
    std::shared_ptr<IEscalationPolicy> policy_for(const ToolSpec& tool) const;
    bool is_disabled(const std::string& tool_name) const;

    std::shared_ptr<IContainerRuntime> runtime_;
    SandboxSettings sandbox_;
    ValidationSettings settings_;
    LRUCache<std::string, ValidationVerdict> cache_;

    mutable std::mutex policy_mtx_;
    std::map<std::string, std::shared_ptr<IEscalationPolicy>> policy_overrides_;
};

} // namespace code_agent
