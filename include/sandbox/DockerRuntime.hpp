#pragma once
#include <string>
#include <vector>
#include "sandbox/ContainerRuntime.hpp"

namespace code_agent {

// Container runtime driven through the docker CLI.
class DockerRuntime : public IContainerRuntime {
public:
    explicit DockerRuntime(std::string docker_binary = "docker", int max_live_containers = 4);

    bool is_available() override;
    ContainerRunResult run(const ContainerSpec& spec) override;
    void remove(const std::string& name) noexcept override;
    std::string name() const override { return "docker"; }

    // Exposed for tests: the argv handed to SubProcess for a spec.
    std::vector<std::string> build_run_command(const ContainerSpec& spec) const;

private:
    std::string docker_;
};

} // namespace code_agent
