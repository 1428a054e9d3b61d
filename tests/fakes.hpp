#pragma once
#include <atomic>
#include <deque>
#include <filesystem>
#include <fstream>
#include <functional>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>
#include "agent/Collaborators.hpp"
#include "sandbox/ContainerRuntime.hpp"

namespace code_agent::testing {

inline ContainerRunResult container_ok(std::string out = "", std::string err = "", int exit_code = 0) {
    ContainerRunResult r;
    r.launched = true;
    r.exit_code = exit_code;
    r.std_out = std::move(out);
    r.std_err = std::move(err);
    r.elapsed_ms = 5.0;
    return r;
}

inline ContainerRunResult container_timeout(int seconds) {
    ContainerRunResult r;
    r.launched = true;
    r.timed_out = true;
    r.elapsed_ms = seconds * 1000.0;
    return r;
}

inline std::string read_text(const std::filesystem::path& p) {
    std::ifstream in(p, std::ios::binary);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

// In-memory container runtime. Records every run and removal; the handler
// decides what each container "prints".
class FakeRuntime : public IContainerRuntime {
public:
    using Handler = std::function<ContainerRunResult(const ContainerSpec&)>;

    explicit FakeRuntime(bool available = true, int max_live = 4)
        : IContainerRuntime(max_live), available_(available) {}

    bool is_available() override { return available_; }
    void set_available(bool available) { available_ = available; }

    ContainerRunResult run(const ContainerSpec& spec) override {
        Handler h;
        {
            std::lock_guard<std::mutex> lock(mtx_);
            runs_.push_back(spec);
            h = handler_;
        }
        return h ? h(spec) : container_ok();
    }

    void remove(const std::string& name) noexcept override {
        std::lock_guard<std::mutex> lock(mtx_);
        removed_.push_back(name);
    }

    std::string name() const override { return "fake"; }

    void set_handler(Handler h) {
        std::lock_guard<std::mutex> lock(mtx_);
        handler_ = std::move(h);
    }

    std::vector<ContainerSpec> runs() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return runs_;
    }

    std::vector<std::string> removed() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return removed_;
    }

    size_t run_count() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return runs_.size();
    }

private:
    std::atomic<bool> available_;
    Handler handler_;
    mutable std::mutex mtx_;
    std::vector<ContainerSpec> runs_;
    std::vector<std::string> removed_;
};

// Replays scripted results; the last one repeats once the script runs out.
class FakeSynthesizer : public ISynthesizer {
public:
    explicit FakeSynthesizer(std::vector<SynthesisResult> script) : script_(script.begin(), script.end()) {}

    static SynthesisResult code(const std::string& source, int tokens = 10) {
        SynthesisResult r;
        r.ok = true;
        r.code = source;
        r.raw_text = source;
        r.tokens_used = tokens;
        return r;
    }

    static SynthesisResult failure(const std::string& error) {
        SynthesisResult r;
        r.error = error;
        return r;
    }

    SynthesisResult synthesize(const SynthesisRequest& request) override {
        std::lock_guard<std::mutex> lock(mtx_);
        requests_.push_back(request);
        if (script_.size() > 1) {
            auto next = script_.front();
            script_.pop_front();
            return next;
        }
        return script_.empty() ? failure("no script") : script_.front();
    }

    std::vector<SynthesisRequest> requests() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return requests_;
    }

private:
    std::deque<SynthesisResult> script_;
    std::vector<SynthesisRequest> requests_;
    mutable std::mutex mtx_;
};

class FakeCritic : public ICritic {
public:
    explicit FakeCritic(std::vector<std::string> replies) : replies_(replies.begin(), replies.end()) {}

    CritiqueResult critique(const std::string&, const std::vector<std::string>&, const std::string& code,
                            const std::optional<std::string>& execution_output) override {
        std::lock_guard<std::mutex> lock(mtx_);
        reviewed_.push_back(code);
        saw_output_.push_back(execution_output.has_value());
        CritiqueResult r;
        r.ok = true;
        if (replies_.size() > 1) {
            r.feedback = replies_.front();
            replies_.pop_front();
        } else {
            r.feedback = replies_.empty() ? "PASS" : replies_.front();
        }
        return r;
    }

    std::vector<std::string> reviewed() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return reviewed_;
    }

    std::vector<bool> saw_output() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return saw_output_;
    }

private:
    std::deque<std::string> replies_;
    std::vector<std::string> reviewed_;
    std::vector<bool> saw_output_;
    mutable std::mutex mtx_;
};

} // namespace code_agent::testing
