#pragma once
#include <atomic>
#include <nlohmann/json.hpp>

namespace code_agent {

struct TelemetryData {
    // Sandbox
    long containers_launched = 0;
    long live_containers = 0;

    // Sessions
    long sessions_succeeded = 0;
    long sessions_exhausted = 0;
    long sessions_fatal = 0;

    // AI throughput
    double llm_generation_ms = 0.0;     // latency of the most recent call
    long output_tokens = 0;             // cumulative
};

class SystemMonitor {
public:
    inline static std::atomic<long> global_containers_launched{0};
    inline static std::atomic<long> global_live_containers{0};
    inline static std::atomic<long> global_sessions_succeeded{0};
    inline static std::atomic<long> global_sessions_exhausted{0};
    inline static std::atomic<long> global_sessions_fatal{0};
    inline static std::atomic<double> global_llm_generation_ms{0.0};
    inline static std::atomic<long> global_output_tokens{0};

    static TelemetryData snapshot() {
        TelemetryData d;
        d.containers_launched = global_containers_launched.load();
        d.live_containers = global_live_containers.load();
        d.sessions_succeeded = global_sessions_succeeded.load();
        d.sessions_exhausted = global_sessions_exhausted.load();
        d.sessions_fatal = global_sessions_fatal.load();
        d.llm_generation_ms = global_llm_generation_ms.load();
        d.output_tokens = global_output_tokens.load();
        return d;
    }

    static nlohmann::json snapshot_json() {
        auto d = snapshot();
        return {
            {"containers_launched", d.containers_launched},
            {"live_containers", d.live_containers},
            {"sessions_succeeded", d.sessions_succeeded},
            {"sessions_exhausted", d.sessions_exhausted},
            {"sessions_fatal", d.sessions_fatal},
            {"llm_latency_ms", d.llm_generation_ms},
            {"output_tokens", d.output_tokens}
        };
    }
};

} // namespace code_agent
