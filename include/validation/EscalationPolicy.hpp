#pragma once
#include <memory>
#include <string>
#include <vector>
#include "LanguageRegistry.hpp"

namespace code_agent {

// Decides whether a validation tool's raw output counts as a finding.
class IEscalationPolicy {
public:
    virtual ~IEscalationPolicy() = default;
    virtual bool should_escalate(const std::string& tool_output) const = 0;
    virtual std::string describe() const = 0;
};

// Case-insensitive substring match against a keyword list.
class KeywordEscalation : public IEscalationPolicy {
public:
    explicit KeywordEscalation(std::vector<std::string> keywords);
    bool should_escalate(const std::string& tool_output) const override;
    std::string describe() const override;

private:
    std::vector<std::string> keywords_;   // stored lowercase
};

// Any non-whitespace output is a finding (tools that stay silent on success).
class AnyOutputEscalation : public IEscalationPolicy {
public:
    bool should_escalate(const std::string& tool_output) const override;
    std::string describe() const override { return "any output"; }
};

std::shared_ptr<IEscalationPolicy> make_policy(const ToolSpec& tool);

} // namespace code_agent
