#pragma once
#include <condition_variable>
#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

namespace code_agent {

// Everything needed to launch one single-use container.
struct ContainerSpec {
    std::string name;
    std::string image;
    std::vector<std::string> command;
    std::filesystem::path mount_dir;   // bound at /code
    bool read_only_mount = true;
    std::string memory_limit = "512m";
    double cpu_limit = 1.0;
    int pids_limit = 128;
    int timeout_seconds = 30;
    size_t output_limit = 1024 * 1024;
};

struct ContainerRunResult {
    bool launched = false;
    bool timed_out = false;
    int exit_code = -1;
    std::string std_out;
    std::string std_err;
    double elapsed_ms = 0.0;
};

// Counting gate bounding the number of live containers across all callers.
class ContainerGate {
public:
    explicit ContainerGate(int capacity) : free_(capacity < 1 ? 1 : capacity) {}

    void acquire() {
        std::unique_lock<std::mutex> lock(mtx_);
        cv_.wait(lock, [this] { return free_ > 0; });
        --free_;
    }

    void release() {
        {
            std::lock_guard<std::mutex> lock(mtx_);
            ++free_;
        }
        cv_.notify_one();
    }

    int available() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return free_;
    }

private:
    mutable std::mutex mtx_;
    std::condition_variable cv_;
    int free_;
};

class IContainerRuntime {
public:
    explicit IContainerRuntime(int max_live_containers) : gate_(max_live_containers) {}
    virtual ~IContainerRuntime() = default;

    virtual bool is_available() = 0;

    // Runs the container attached and returns once it exits or the container's
    // timeout passes. Does not remove the container.
    virtual ContainerRunResult run(const ContainerSpec& spec) = 0;

    // Force-removes a container (running or not). Must not throw.
    virtual void remove(const std::string& name) noexcept = 0;

    virtual std::string name() const = 0;

    ContainerGate& gate() { return gate_; }

    static std::string unique_container_name(const std::string& purpose);

private:
    ContainerGate gate_;
};

// Scoped ownership of one container name: holds an admission slot for its
// lifetime and force-removes the container on every exit path.
class ContainerLease {
public:
    ContainerLease(IContainerRuntime& runtime, std::string name);
    ~ContainerLease();

    ContainerLease(const ContainerLease&) = delete;
    ContainerLease& operator=(const ContainerLease&) = delete;

    const std::string& name() const { return name_; }

private:
    IContainerRuntime& runtime_;
    std::string name_;
};

} // namespace code_agent
