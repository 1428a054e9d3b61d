#include "sandbox/DockerRuntime.hpp"
#include <chrono>
#include <sstream>
#include <spdlog/spdlog.h>
#include "SystemMonitor.hpp"
#include "LogManager.hpp"
#include "utils/SubProcess.hpp"

namespace code_agent {

namespace {

std::string format_cpus(double cpus) {
    std::ostringstream ss;
    ss << cpus;
    return ss.str();
}

} // namespace

// --- DockerRuntime ---

DockerRuntime::DockerRuntime(std::string docker_binary, int max_live_containers)
    : IContainerRuntime(max_live_containers), docker_(std::move(docker_binary)) {}

bool DockerRuntime::is_available() {
    auto res = SubProcess::run({docker_, "info", "--format", "{{.ServerVersion}}"},
                               std::chrono::seconds(15), 4096);
    if (!res.spawned) {
        spdlog::error("🐳 Docker CLI not found: {}", res.std_err);
        return false;
    }
    if (res.exit_code != 0) {
        spdlog::error("🐳 Docker daemon unreachable: {}", res.std_err);
        return false;
    }
    spdlog::info("🐳 Docker daemon ready (server {})", res.std_out.substr(0, res.std_out.find('\n')));
    return true;
}

std::vector<std::string> DockerRuntime::build_run_command(const ContainerSpec& spec) const {
    std::vector<std::string> argv = {
        docker_, "run",
        "--name", spec.name,
        "--network", "none",
        "--memory", spec.memory_limit,
        "--memory-swap", spec.memory_limit,
        "--cpus", format_cpus(spec.cpu_limit),
        "--pids-limit", std::to_string(spec.pids_limit),
        "--security-opt", "no-new-privileges",
        "-v", spec.mount_dir.string() + ":/code:" + (spec.read_only_mount ? "ro" : "rw"),
        "-w", "/code",
        spec.image,
    };
    argv.insert(argv.end(), spec.command.begin(), spec.command.end());
    return argv;
}

ContainerRunResult DockerRuntime::run(const ContainerSpec& spec) {
    auto argv = build_run_command(spec);
    spdlog::debug("🐳 {} -> {} ({}s limit)", spec.name, spec.image, spec.timeout_seconds);
    SystemMonitor::global_containers_launched.fetch_add(1);

    auto proc = SubProcess::run(argv, std::chrono::seconds(spec.timeout_seconds), spec.output_limit);

    ContainerRunResult result;
    // 125 plus a "docker:" complaint means the CLI never got a container started.
    const bool cli_failed = proc.exit_code == 125 && proc.std_err.find("docker: ") != std::string::npos;
    result.launched = proc.spawned && !cli_failed;
    result.timed_out = proc.timed_out;
    result.exit_code = proc.exit_code;
    result.std_out = std::move(proc.std_out);
    result.std_err = std::move(proc.std_err);
    result.elapsed_ms = proc.elapsed_ms;

    LogManager::instance().add_trace({"SANDBOX", spec.name, "CONTAINER_RUN", spec.image, result.elapsed_ms});
    if (result.timed_out) {
        spdlog::warn("⏱️ Container {} exceeded {}s, reclaiming", spec.name, spec.timeout_seconds);
    }
    return result;
}

void DockerRuntime::remove(const std::string& name) noexcept {
    try {
        auto res = SubProcess::run({docker_, "rm", "-f", name}, std::chrono::seconds(30), 4096);
        // "No such container" is expected when the run never got that far.
        if (res.exit_code != 0 && res.std_err.find("No such container") == std::string::npos) {
            spdlog::warn("🐳 docker rm -f {} failed: {}", name, res.std_err);
        }
    } catch (const std::exception& e) {
        spdlog::error("🐳 docker rm -f {} threw: {}", name, e.what());
    }
}

} // namespace code_agent
