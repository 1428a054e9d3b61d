#pragma once
#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <vector>
#include "AppConfig.hpp"
#include "agent/AgentTypes.hpp"
#include "agent/Collaborators.hpp"
#include "sandbox/SandboxExecutor.hpp"
#include "validation/ValidationAggregator.hpp"

namespace code_agent {

// Drives one session through generate -> [review] -> execute -> validate
// until the verdict passes or the iteration ceiling is hit.
class RetryOrchestrator {
public:
    static constexpr int kMaxCeiling = 10;

    // Called on every state transition; used for tracing and job progress.
    using TransitionObserver = std::function<void(const Session&)>;

    // critic may be null, in which case review is skipped.
    RetryOrchestrator(std::shared_ptr<ISynthesizer> synthesizer,
                      std::shared_ptr<ICritic> critic,
                      std::shared_ptr<SandboxExecutor> executor,
                      std::shared_ptr<ValidationAggregator> validator,
                      AgentSettings settings);

    // ceiling <= 0 uses agent.max_iterations. Never throws for collaborator
    // failures; always returns the best candidate it has.
    SessionOutcome run(const std::string& problem,
                       Language language,
                       const std::vector<std::string>& requirements,
                       int ceiling = 0);

    void set_observer(TransitionObserver observer) { observer_ = std::move(observer); }

    const AgentSettings& settings() const { return settings_; }

private:
    void transition(Session& session, SessionState next);
    SynthesisResult call_synthesizer(Session& session);
    CritiqueResult call_critic(Session& session);
    SessionOutcome finish(Session& session);

    std::shared_ptr<ISynthesizer> synthesizer_;
    std::shared_ptr<ICritic> critic_;
    std::shared_ptr<SandboxExecutor> executor_;
    std::shared_ptr<ValidationAggregator> validator_;
    AgentSettings settings_;
    TransitionObserver observer_;
    std::atomic<long> session_counter_{0};
};

} // namespace code_agent
