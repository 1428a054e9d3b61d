#pragma once
#include <chrono>
#include <string>
#include <vector>

namespace code_agent {

struct ProcessResult {
    bool spawned = false;      // false when fork/exec failed
    bool timed_out = false;
    int exit_code = -1;        // -1 when killed by a signal or never spawned
    std::string std_out;
    std::string std_err;
    double elapsed_ms = 0.0;
};

class SubProcess {
public:
    // Runs argv[0] with argv (PATH lookup, no shell). Both streams are captured
    // through their own pipe and cut at output_limit bytes each. When the
    // deadline passes the whole process group is SIGKILLed.
    static ProcessResult run(const std::vector<std::string>& argv,
                             std::chrono::milliseconds timeout,
                             size_t output_limit = 1024 * 1024);
};

} // namespace code_agent
