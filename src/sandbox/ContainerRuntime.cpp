#include "sandbox/ContainerRuntime.hpp"
#include <atomic>
#include <chrono>
#include <unistd.h>
#include "SystemMonitor.hpp"

namespace code_agent {

namespace {
std::atomic<unsigned long> g_container_counter{0};
}

std::string IContainerRuntime::unique_container_name(const std::string& purpose) {
    auto stamp = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    return "code_agent_" + purpose + "_" + std::to_string(::getpid()) + "_" +
           std::to_string(g_container_counter.fetch_add(1)) + "_" + std::to_string(stamp);
}

ContainerLease::ContainerLease(IContainerRuntime& runtime, std::string name)
    : runtime_(runtime), name_(std::move(name)) {
    runtime_.gate().acquire();
    SystemMonitor::global_live_containers.fetch_add(1);
}

ContainerLease::~ContainerLease() {
    runtime_.remove(name_);
    SystemMonitor::global_live_containers.fetch_sub(1);
    runtime_.gate().release();
}

} // namespace code_agent
