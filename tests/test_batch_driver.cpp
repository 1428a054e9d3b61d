#include <gtest/gtest.h>
#include "batch_driver.hpp"
#include "fakes.hpp"
#include "sandbox/ScratchDir.hpp"

using namespace code_agent;
using namespace code_agent::testing;

namespace {

// Answers by language so results do not depend on worker scheduling.
class PerLanguageSynthesizer : public ISynthesizer {
public:
    SynthesisResult synthesize(const SynthesisRequest& request) override {
        switch (request.language) {
            case Language::Python: return FakeSynthesizer::code("print('py')\n");
            case Language::C: return FakeSynthesizer::code("int main(void) { return 0; }\n");
            default: return FakeSynthesizer::failure("Code generation failed: no model for this language");
        }
    }
};

struct BatchHarness {
    std::shared_ptr<FakeRuntime> runtime = std::make_shared<FakeRuntime>();
    std::unique_ptr<BatchDriver> driver;
    ScratchDir out{"code_agent_batch_test"};

    BatchHarness() {
        // Execution prints a per-image marker; cppcheck always complains about C.
        runtime->set_handler([](const ContainerSpec& spec) {
            if (spec.read_only_mount) return container_ok(spec.image == "ai-agent-python:latest" ? "py\n" : "c\n");
            if (spec.command.front() == "cppcheck") return container_ok("", "code.c:1: error: something odd");
            return container_ok();
        });
        AgentSettings agent;
        agent.max_iterations = 2;
        auto executor = std::make_shared<SandboxExecutor>(runtime, SandboxSettings{});
        auto validator = std::make_shared<ValidationAggregator>(runtime, SandboxSettings{}, ValidationSettings{});
        auto orchestrator = std::make_shared<RetryOrchestrator>(std::make_shared<PerLanguageSynthesizer>(), nullptr,
                                                                executor, validator, agent);
        BatchSettings batch;
        batch.max_parallel_sessions = 3;
        batch.output_dir = out.path().string();
        driver = std::make_unique<BatchDriver>(orchestrator, batch);
    }
};

const char* kAssignment =
    "Subject: Data Structures\n"
    "Assignment No: 4\n"
    "\n"
    "Question 1: Print py.\nLanguage: Python\n"
    "Question 2: Print c.\nLanguage: C\n"
    "Question 3: Print go.\nLanguage: Go\n"
    "Question 4: Print py again.\nLanguage: Python\n";

} // namespace

TEST(BatchDriverTest, ResultsKeepQuestionOrderAndStatus) {
    BatchHarness h;
    auto report = h.driver->run_contents(kAssignment);

    ASSERT_EQ(report.results.size(), 4u);
    for (size_t i = 0; i < report.results.size(); ++i) {
        EXPECT_EQ(report.results[i].number, static_cast<int>(i) + 1);
    }
    EXPECT_EQ(report.results[0].status(), "done");
    EXPECT_EQ(report.results[0].output, "py");
    EXPECT_EQ(report.results[1].status(), "needs attention");
    EXPECT_EQ(report.results[1].output, "c");
    EXPECT_EQ(report.results[1].iterations, 2);
    EXPECT_EQ(report.results[2].status(), "needs attention");
    EXPECT_TRUE(report.results[2].code.empty());
    EXPECT_EQ(report.results[3].status(), "done");
    EXPECT_FALSE(report.all_done());
}

TEST(BatchDriverTest, ManifestIsWrittenUnderTheSubjectName) {
    BatchHarness h;
    auto report = h.driver->run_contents(kAssignment);

    auto expected = h.out.path() / "Data_Structures_Assignment_4.json";
    EXPECT_EQ(report.manifest_path, expected.string());
    ASSERT_TRUE(fs::exists(expected));

    auto manifest = nlohmann::json::parse(read_text(expected));
    EXPECT_EQ(manifest["meta"]["subject"], "Data Structures");
    EXPECT_EQ(manifest["meta"]["assignment_number"], 4);
    ASSERT_EQ(manifest["questions"].size(), 4u);
    EXPECT_EQ(manifest["questions"][0]["language"], "python");
    EXPECT_EQ(manifest["questions"][0]["code"], "print('py')\n");
    EXPECT_EQ(manifest["questions"][1]["status"], "needs attention");
    EXPECT_EQ(manifest["questions"][3]["question"], "Print py again.");
}

TEST(BatchDriverTest, ExplicitOutputDirectoryWins) {
    BatchHarness h;
    auto nested = h.out.path() / "nested" / "deeper";
    auto report = h.driver->run_contents("Python\nPrint py.\n", nested.string());
    EXPECT_TRUE(fs::exists(nested / "Assignment_Assignment_1.json"));
    EXPECT_TRUE(report.all_done());
}

TEST(BatchDriverTest, ManifestNameSanitisesTheSubject) {
    AssignmentMeta meta;
    meta.subject = "OS / Networks Lab";
    meta.assignment_number = 7;
    EXPECT_EQ(BatchDriver::manifest_file_name(meta), "OS___Networks_Lab_Assignment_7.json");
    meta.subject.clear();
    EXPECT_EQ(BatchDriver::manifest_file_name(meta), "Assignment_Assignment_7.json");
}

TEST(BatchDriverTest, BadInputPropagatesAsParseError) {
    BatchHarness h;
    EXPECT_THROW(h.driver->run_contents("Question 1: Do it.\nLanguage: Rust\n"), ParseError);
    EXPECT_EQ(h.runtime->run_count(), 0u);
}

TEST(BatchDriverTest, LostSandboxStopsTheRemainingQuestions) {
    auto runtime = std::make_shared<FakeRuntime>();
    auto synth = std::make_shared<FakeSynthesizer>(std::vector<SynthesisResult>{FakeSynthesizer::code("print('py')\n")});
    SandboxSettings sandbox;
    auto executor = std::make_shared<SandboxExecutor>(runtime, sandbox);
    auto validator = std::make_shared<ValidationAggregator>(runtime, sandbox, ValidationSettings{});
    AgentSettings agent;
    agent.max_iterations = 3;
    auto orchestrator = std::make_shared<RetryOrchestrator>(synth, nullptr, executor, validator, agent);
    ScratchDir out("code_agent_batch_abort");
    BatchSettings batch;
    batch.max_parallel_sessions = 1;
    batch.output_dir = out.path().string();
    BatchDriver driver(orchestrator, batch);

    // The daemon dies after startup checks passed.
    runtime->set_available(false);
    runtime->set_handler([](const ContainerSpec&) {
        ContainerRunResult r;
        r.std_err = "docker: Cannot connect to the Docker daemon";
        return r;
    });

    EXPECT_THROW(driver.run_contents("Question 1: A.\nLanguage: Python\n"
                                     "Question 2: B.\nLanguage: Python\n"
                                     "Question 3: C.\nLanguage: Python\n"),
                 SandboxUnavailableError);
    EXPECT_EQ(synth->requests().size(), 1u);
    EXPECT_EQ(runtime->run_count(), 1u);
    EXPECT_TRUE(fs::is_empty(out.path()));
}
