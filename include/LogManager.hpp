#pragma once
#include <chrono>
#include <deque>
#include <mutex>
#include <vector>
#include <string>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace code_agent {

struct InteractionLog {
    long long timestamp;
    std::string purpose;        // "synthesis" or "critique"
    std::string model;
    std::string full_prompt;    // the raw prompt sent to the model
    std::string ai_response;
    int tokens_used;
    double duration_ms;
    bool ok;
};

struct TraceEvent {
    std::string component;      // SANDBOX, VALIDATION, AGENT
    std::string subject;        // container name, tool name, session id
    std::string event;
    std::string detail;
    double duration_ms;
};

class LogManager {
public:
    static LogManager& instance() {
        static LogManager instance;
        return instance;
    }

    void add_log(InteractionLog log) {
        if (log.timestamp == 0) log.timestamp = now_ms();
        std::lock_guard<std::mutex> lock(mtx_);
        logs_.push_back(std::move(log));
        if (logs_.size() > kMaxLogs) logs_.pop_front();
    }

    void add_trace(TraceEvent ev) {
        std::lock_guard<std::mutex> lock(mtx_);
        traces_.push_back({now_ms(), std::move(ev)});
        if (traces_.size() > kMaxTraces) traces_.pop_front();
    }

    // Newest first.
    json get_logs_json() const {
        std::lock_guard<std::mutex> lock(mtx_);
        json j_list = json::array();
        for (auto it = logs_.rbegin(); it != logs_.rend(); ++it) {
            j_list.push_back({
                {"timestamp", it->timestamp},
                {"purpose", it->purpose},
                {"model", it->model},
                {"full_prompt", it->full_prompt},
                {"ai_response", it->ai_response},
                {"tokens_used", it->tokens_used},
                {"duration_ms", it->duration_ms},
                {"ok", it->ok}
            });
        }
        return j_list;
    }

    json get_traces_json() const {
        std::lock_guard<std::mutex> lock(mtx_);
        json j_list = json::array();
        for (auto it = traces_.rbegin(); it != traces_.rend(); ++it) {
            j_list.push_back({
                {"timestamp", it->first},
                {"component", it->second.component},
                {"subject", it->second.subject},
                {"event", it->second.event},
                {"detail", it->second.detail},
                {"duration_ms", it->second.duration_ms}
            });
        }
        return j_list;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mtx_);
        logs_.clear();
        traces_.clear();
    }

private:
    static constexpr size_t kMaxLogs = 50;
    static constexpr size_t kMaxTraces = 500;

    LogManager() {}

    static long long now_ms() {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
    }

    std::deque<InteractionLog> logs_;
    std::deque<std::pair<long long, TraceEvent>> traces_;
    mutable std::mutex mtx_;
};

} // namespace code_agent
