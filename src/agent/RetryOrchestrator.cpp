#include "agent/RetryOrchestrator.hpp"
#include <algorithm>
#include <chrono>
#include <stdexcept>
#include <spdlog/spdlog.h>
#include "LogManager.hpp"
#include "SystemMonitor.hpp"

namespace code_agent {

RetryOrchestrator::RetryOrchestrator(std::shared_ptr<ISynthesizer> synthesizer,
                                     std::shared_ptr<ICritic> critic,
                                     std::shared_ptr<SandboxExecutor> executor,
                                     std::shared_ptr<ValidationAggregator> validator,
                                     AgentSettings settings)
    : synthesizer_(std::move(synthesizer)),
      critic_(std::move(critic)),
      executor_(std::move(executor)),
      validator_(std::move(validator)),
      settings_(settings) {
    if (!synthesizer_ || !executor_ || !validator_) {
        throw std::invalid_argument("RetryOrchestrator needs a synthesizer, an executor and a validator");
    }
}

void RetryOrchestrator::transition(Session& session, SessionState next) {
    spdlog::debug("🔁 [{}] {} -> {} (iteration {}/{})", session.id, to_string(session.state),
                  to_string(next), session.iteration, session.ceiling);
    session.state = next;
    LogManager::instance().add_trace({"AGENT", session.id, to_string(next),
                                      "iteration " + std::to_string(session.iteration), 0.0});
    if (observer_) observer_(session);
}

SynthesisResult RetryOrchestrator::call_synthesizer(Session& session) {
    SynthesisRequest request;
    request.language = session.language;
    request.problem = session.problem;
    request.requirements = session.requirements;
    if (session.iteration > 0 && !session.feedback_history.empty()) {
        request.prior_feedback = session.feedback_history.back();
    }

    // Counted before the call so a failing synthesizer still uses an iteration.
    ++session.iteration;
    ++session.llm_calls;
    spdlog::info("🧠 [{}] Iteration {}/{}: generating {} code", session.id, session.iteration,
                 session.ceiling, to_string(session.language));

    SynthesisResult result;
    try {
        result = synthesizer_->synthesize(request);
    } catch (const std::exception& e) {
        result = SynthesisResult{};
        result.error = std::string("Code generation failed: ") + e.what();
    }
    session.tokens_used += result.tokens_used;
    if (result.ok && trim_copy(result.code).empty()) {
        result.ok = false;
        result.error = "Code generation failed: empty candidate";
    }
    return result;
}

CritiqueResult RetryOrchestrator::call_critic(Session& session) {
    ++session.llm_calls;
    std::optional<std::string> prior_output;
    if (session.last_execution) {
        const auto& exec = *session.last_execution;
        prior_output = exec.output.empty() ? exec.error : exec.output;
    }
    try {
        return critic_->critique(session.problem, session.requirements, session.candidate, prior_output);
    } catch (const std::exception& e) {
        CritiqueResult failed;
        failed.error = std::string("Code review failed: ") + e.what();
        return failed;
    }
}

SessionOutcome RetryOrchestrator::run(const std::string& problem,
                                      Language language,
                                      const std::vector<std::string>& requirements,
                                      int ceiling) {
    Session s;
    s.id = "session-" + std::to_string(++session_counter_);
    s.problem = problem;
    s.language = language;
    s.requirements = requirements;
    s.ceiling = std::clamp(ceiling > 0 ? ceiling : settings_.max_iterations, 1, kMaxCeiling);

    const bool review_enabled = settings_.enable_review && critic_ != nullptr;
    spdlog::info("🚀 [{}] Session start: {} problem, ceiling {}, review {}", s.id, to_string(language),
                 s.ceiling, review_enabled ? "on" : "off");

    auto retry_or_exhaust = [this, &s]() {
        transition(s, s.iteration >= s.ceiling ? SessionState::ExhaustedRetry : SessionState::Retrying);
    };

    while (s.state != SessionState::Complete && s.state != SessionState::ExhaustedRetry) {
        switch (s.state) {
            case SessionState::Generating: {
                SynthesisResult res = call_synthesizer(s);
                if (!res.ok) {
                    spdlog::warn("⚠️ [{}] {}", s.id, res.error);
                    s.feedback_history.push_back(res.error);
                    retry_or_exhaust();
                    break;
                }
                s.candidate = res.code;
                transition(s, review_enabled ? SessionState::Reviewing : SessionState::Executing);
                break;
            }
            case SessionState::Reviewing: {
                CritiqueResult review = call_critic(s);
                if (review.ok && review_passed(review.feedback)) {
                    spdlog::info("✅ [{}] Review passed", s.id);
                    transition(s, SessionState::Executing);
                } else if (s.iteration >= s.ceiling) {
                    spdlog::warn("⚠️ [{}] Review rejected at the iteration ceiling, executing anyway", s.id);
                    transition(s, SessionState::Executing);
                } else {
                    std::string feedback = review.ok ? "Code review feedback:\n" + review.feedback : review.error;
                    spdlog::info("📝 [{}] Review rejected the candidate", s.id);
                    s.feedback_history.push_back(std::move(feedback));
                    transition(s, SessionState::Retrying);
                }
                break;
            }
            case SessionState::Executing: {
                s.last_execution = executor_->execute(s.candidate, s.language);
                s.executed_code = s.candidate;
                s.last_verdict.reset();
                transition(s, SessionState::Validating);
                break;
            }
            case SessionState::Validating: {
                s.last_verdict = validator_->judge(s.candidate, s.language, *s.last_execution);
                if (s.last_verdict->passed) {
                    transition(s, SessionState::Complete);
                } else {
                    s.feedback_history.push_back(s.last_verdict->digest());
                    retry_or_exhaust();
                }
                break;
            }
            case SessionState::Retrying:
                transition(s, SessionState::Generating);
                break;
            case SessionState::Complete:
            case SessionState::ExhaustedRetry:
                break;
        }
    }
    return finish(s);
}

SessionOutcome RetryOrchestrator::finish(Session& s) {
    if (s.state == SessionState::Complete) {
        s.status = SessionStatus::Succeeded;
        SystemMonitor::global_sessions_succeeded.fetch_add(1);
    } else if (s.candidate.empty()) {
        s.status = SessionStatus::Fatal;
        SystemMonitor::global_sessions_fatal.fetch_add(1);
    } else {
        s.status = SessionStatus::Exhausted;
        SystemMonitor::global_sessions_exhausted.fetch_add(1);
    }

    SessionOutcome out;
    out.final_code = s.candidate;
    out.status = s.status;
    out.state = s.state;
    out.iterations = s.iteration;
    out.feedback_history = s.feedback_history;
    out.tokens_used = s.tokens_used;
    out.llm_calls = s.llm_calls;

    const bool current = !s.candidate.empty() && s.executed_code == s.candidate;
    if (current && s.last_execution) {
        out.last_execution = s.last_execution;
        const auto& exec = *s.last_execution;
        out.final_output = (exec.output.empty() && !exec.success) ? exec.error : exec.output;
    }
    if (current && s.last_verdict) {
        out.verdict = *s.last_verdict;
    } else {
        std::string reason = s.feedback_history.empty() ? "no candidate was produced"
                                                        : s.feedback_history.back();
        out.verdict = ValidationVerdict::from({reason});
    }

    spdlog::info("🏁 [{}] Session {} after {} iteration(s), {} tokens", s.id, to_string(s.status),
                 s.iteration, s.tokens_used);
    return out;
}

} // namespace code_agent
