#include <gtest/gtest.h>
#include <algorithm>
#include <atomic>
#include <thread>
#include "fakes.hpp"
#include "sandbox/DockerRuntime.hpp"
#include "sandbox/SandboxExecutor.hpp"
#include "sandbox/ScratchDir.hpp"

using namespace code_agent;
using namespace code_agent::testing;

namespace {

SandboxSettings test_settings() {
    SandboxSettings s;
    s.timeout_seconds = 5;
    return s;
}

} // namespace

TEST(SandboxExecutorTest, ConstructionFailsWithoutARuntime) {
    auto runtime = std::make_shared<FakeRuntime>(false);
    EXPECT_THROW((SandboxExecutor{runtime, test_settings()}), SandboxUnavailableError);
}

TEST(SandboxExecutorTest, UnsupportedLanguageNeverTouchesTheRuntime) {
    auto runtime = std::make_shared<FakeRuntime>();
    SandboxExecutor executor(runtime, test_settings());

    auto r = executor.execute("fn main() {}", "rust");
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.exit_code, -1);
    EXPECT_EQ(r.error, "Unsupported language: rust");
    EXPECT_EQ(runtime->run_count(), 0u);
    EXPECT_TRUE(runtime->removed().empty());
}

TEST(SandboxExecutorTest, RunsTheSourceInAReadOnlyContainer) {
    auto runtime = std::make_shared<FakeRuntime>();
    const std::string source = "for i in range(1, 4):\n    print(i)\n";
    std::string seen_source;
    runtime->set_handler([&](const ContainerSpec& spec) {
        seen_source = read_text(spec.mount_dir / "code.py");
        return container_ok("1\n2\n3\n");
    });
    SandboxExecutor executor(runtime, test_settings());

    auto r = executor.execute(source, "python");
    EXPECT_TRUE(r.success);
    EXPECT_EQ(r.exit_code, 0);
    EXPECT_EQ(r.output, "1\n2\n3");
    EXPECT_EQ(seen_source, source);

    auto runs = runtime->runs();
    ASSERT_EQ(runs.size(), 1u);
    EXPECT_TRUE(runs[0].read_only_mount);
    EXPECT_EQ(runs[0].image, "ai-agent-python:latest");
    EXPECT_EQ(runs[0].command, language_spec(Language::Python).run_command);
    EXPECT_EQ(runs[0].timeout_seconds, 5);
    EXPECT_EQ(runtime->removed(), std::vector<std::string>{runs[0].name});
}

TEST(SandboxExecutorTest, NonZeroExitIsAFailedRunWithTrimmedStderr) {
    auto runtime = std::make_shared<FakeRuntime>();
    runtime->set_handler([](const ContainerSpec&) {
        return container_ok("", "  /code/code.c:1:1: error: expected ';'\n", 1);
    });
    SandboxExecutor executor(runtime, test_settings());

    auto r = executor.execute("int main() { return 0 }", Language::C);
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.exit_code, 1);
    EXPECT_EQ(r.error, "/code/code.c:1:1: error: expected ';'");
}

TEST(SandboxExecutorTest, TimeoutYieldsSyntheticErrorAndTeardown) {
    auto runtime = std::make_shared<FakeRuntime>();
    runtime->set_handler([](const ContainerSpec& spec) { return container_timeout(spec.timeout_seconds); });
    SandboxExecutor executor(runtime, test_settings());

    auto r = executor.execute("while True: pass", "python", 5);
    EXPECT_FALSE(r.success);
    EXPECT_TRUE(r.timed_out);
    EXPECT_EQ(r.exit_code, -1);
    EXPECT_EQ(r.error, "Execution timeout after 5 seconds");
    EXPECT_NEAR(r.elapsed_ms, 5000.0, 500.0);
    EXPECT_EQ(runtime->removed().size(), 1u);
}

TEST(SandboxExecutorTest, RuntimeExceptionIsCapturedAndContainerStillRemoved) {
    auto runtime = std::make_shared<FakeRuntime>();
    runtime->set_handler([](const ContainerSpec&) -> ContainerRunResult {
        throw std::runtime_error("daemon hiccup");
    });
    SandboxExecutor executor(runtime, test_settings());

    auto r = executor.execute("print(1)", "python");
    EXPECT_FALSE(r.success);
    EXPECT_NE(r.error.find("daemon hiccup"), std::string::npos);
    EXPECT_EQ(runtime->removed().size(), 1u);
    EXPECT_EQ(runtime->gate().available(), 4);
}

TEST(SandboxExecutorTest, LaunchFailureIsAFailedRun) {
    auto runtime = std::make_shared<FakeRuntime>();
    runtime->set_handler([](const ContainerSpec&) {
        ContainerRunResult r;
        r.std_err = "failed to execute docker: No such file or directory";
        return r;
    });
    SandboxExecutor executor(runtime, test_settings());

    auto r = executor.execute("console.log(1)", "js");
    EXPECT_FALSE(r.success);
    EXPECT_NE(r.error.find("Sandbox launch failed"), std::string::npos);
}

TEST(SandboxExecutorTest, LaunchFailureWithTheRuntimeGoneThrows) {
    auto runtime = std::make_shared<FakeRuntime>();
    SandboxExecutor executor(runtime, test_settings());
    runtime->set_available(false);
    runtime->set_handler([](const ContainerSpec&) {
        ContainerRunResult r;
        r.std_err = "docker: Cannot connect to the Docker daemon at unix:///var/run/docker.sock.";
        return r;
    });

    EXPECT_THROW(executor.execute("console.log(1)", "js"), SandboxUnavailableError);
    EXPECT_EQ(runtime->removed().size(), 1u);
    EXPECT_EQ(runtime->gate().available(), 4);
}

TEST(SandboxExecutorTest, OversizedSourceIsRefused) {
    auto runtime = std::make_shared<FakeRuntime>();
    auto settings = test_settings();
    settings.max_source_bytes = 16;
    SandboxExecutor executor(runtime, settings);

    auto r = executor.execute(std::string(64, 'x'), "python");
    EXPECT_FALSE(r.success);
    EXPECT_EQ(runtime->run_count(), 0u);
}

TEST(SandboxExecutorTest, ScratchDirectoryIsGoneAfterTheRun) {
    auto runtime = std::make_shared<FakeRuntime>();
    fs::path mount;
    runtime->set_handler([&](const ContainerSpec& spec) {
        mount = spec.mount_dir;
        EXPECT_TRUE(fs::exists(spec.mount_dir / "Main.java"));
        return container_ok("hi\n");
    });
    SandboxExecutor executor(runtime, test_settings());

    executor.execute("public class Main {}", Language::Java);
    ASSERT_FALSE(mount.empty());
    EXPECT_FALSE(fs::exists(mount));
}

TEST(SandboxExecutorTest, GateBoundsConcurrentContainers) {
    auto runtime = std::make_shared<FakeRuntime>(true, 2);
    std::atomic<int> live{0};
    std::atomic<int> peak{0};
    runtime->set_handler([&](const ContainerSpec&) {
        int now = ++live;
        int prev = peak.load();
        while (now > prev && !peak.compare_exchange_weak(prev, now)) {}
        std::this_thread::sleep_for(std::chrono::milliseconds(40));
        --live;
        return container_ok("ok");
    });
    SandboxExecutor executor(runtime, test_settings());

    std::vector<std::thread> threads;
    for (int i = 0; i < 6; ++i) {
        threads.emplace_back([&executor] { executor.execute("print('ok')", "python"); });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(runtime->run_count(), 6u);
    EXPECT_LE(peak.load(), 2);
    EXPECT_EQ(runtime->removed().size(), 6u);
}

TEST(DockerRuntimeTest, RunCommandCarriesTheIsolationFlags) {
    DockerRuntime docker("docker");
    ContainerSpec spec;
    spec.name = "code_agent_exec_test";
    spec.image = "ai-agent-python:latest";
    spec.command = {"python", "/code/code.py"};
    spec.mount_dir = "/tmp/scratch";
    spec.read_only_mount = true;
    spec.memory_limit = "256m";
    spec.cpu_limit = 0.5;
    spec.pids_limit = 64;

    auto argv = docker.build_run_command(spec);
    auto has_pair = [&argv](const std::string& flag, const std::string& value) {
        for (size_t i = 0; i + 1 < argv.size(); ++i) {
            if (argv[i] == flag && argv[i + 1] == value) return true;
        }
        return false;
    };
    EXPECT_EQ(argv[0], "docker");
    EXPECT_EQ(argv[1], "run");
    EXPECT_TRUE(has_pair("--name", "code_agent_exec_test"));
    EXPECT_TRUE(has_pair("--network", "none"));
    EXPECT_TRUE(has_pair("--memory", "256m"));
    EXPECT_TRUE(has_pair("--memory-swap", "256m"));
    EXPECT_TRUE(has_pair("--cpus", "0.5"));
    EXPECT_TRUE(has_pair("--pids-limit", "64"));
    EXPECT_TRUE(has_pair("-v", "/tmp/scratch:/code:ro"));
    EXPECT_EQ(std::vector<std::string>(argv.end() - 3, argv.end()),
              (std::vector<std::string>{"ai-agent-python:latest", "python", "/code/code.py"}));

    spec.read_only_mount = false;
    EXPECT_TRUE([&] {
        auto rw = docker.build_run_command(spec);
        return std::find(rw.begin(), rw.end(), "/tmp/scratch:/code:rw") != rw.end();
    }());
}

TEST(DockerRuntimeTest, CliErrorExit125IsNotALaunch) {
    // Stands in for the docker CLI: "run ... fail" reports a daemon error,
    // anything else behaves like a program that itself exits 125.
    ScratchDir bin("code_agent_fake_docker");
    auto script = bin.write_file("docker",
                                 "#!/bin/sh\n"
                                 "for last; do :; done\n"
                                 "if [ \"$last\" = fail ]; then\n"
                                 "  echo 'docker: Cannot connect to the Docker daemon at unix:///var/run/docker.sock.' >&2\n"
                                 "fi\n"
                                 "exit 125\n");
    fs::permissions(script, fs::perms::owner_all);
    DockerRuntime docker(script.string());

    ContainerSpec spec;
    spec.name = "code_agent_exec_test";
    spec.image = "ai-agent-python:latest";
    spec.mount_dir = bin.path();
    spec.timeout_seconds = 5;

    spec.command = {"fail"};
    auto lost = docker.run(spec);
    EXPECT_FALSE(lost.launched);
    EXPECT_NE(lost.std_err.find("Cannot connect"), std::string::npos);

    spec.command = {"python", "/code/code.py"};
    auto own_exit = docker.run(spec);
    EXPECT_TRUE(own_exit.launched);
    EXPECT_EQ(own_exit.exit_code, 125);
}

TEST(ScratchDirTest, RemovesEverythingOnDestruction) {
    fs::path kept;
    {
        ScratchDir dir("code_agent_test");
        kept = dir.path();
        auto file = dir.write_file("code.py", "print(1)\n");
        EXPECT_EQ(read_text(file), "print(1)\n");
        fs::create_directories(dir.path() / "nested");
    }
    EXPECT_FALSE(fs::exists(kept));
}
