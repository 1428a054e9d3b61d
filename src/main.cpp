#include <httplib.h>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <atomic>
#include <cstdlib>
#include <iostream>
#include <memory>

#include "AppConfig.hpp"
#include "KeyManager.hpp"
#include "LogManager.hpp"
#include "SystemMonitor.hpp"
#include "ThreadPool.hpp"
#include "agent/RetryOrchestrator.hpp"
#include "batch_driver.hpp"
#include "input_parser.hpp"
#include "job_table.hpp"
#include "llm_client.hpp"
#include "sandbox/DockerRuntime.hpp"
#include "sandbox/SandboxExecutor.hpp"
#include "validation/ValidationAggregator.hpp"

using json = nlohmann::json;
using namespace code_agent;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitUsage = 1;
constexpr int kExitInput = 2;
constexpr int kExitSandbox = 3;

// Everything a request or a batch needs, wired once from the configuration.
struct Services {
    AppConfig config;
    std::shared_ptr<DockerRuntime> runtime;
    std::shared_ptr<SandboxExecutor> executor;
    std::shared_ptr<ValidationAggregator> validator;
    std::shared_ptr<RetryOrchestrator> orchestrator;
    std::shared_ptr<BatchDriver> batch;

    // Throws SandboxUnavailableError when docker cannot be reached.
    explicit Services(AppConfig cfg) : config(std::move(cfg)) {
        runtime = std::make_shared<DockerRuntime>(config.sandbox.docker_binary,
                                                  config.sandbox.max_concurrent_containers);
        executor = std::make_shared<SandboxExecutor>(runtime, config.sandbox);
        validator = std::make_shared<ValidationAggregator>(runtime, config.sandbox, config.validation);

        auto key_manager = std::make_shared<KeyManager>(config.llm.api_keys, config.llm.model);
        auto llm = std::make_shared<LlmClient>(key_manager, config.llm);
        orchestrator = std::make_shared<RetryOrchestrator>(
            std::make_shared<LlmCodeSynthesizer>(llm),
            std::make_shared<LlmCodeReviewer>(llm),
            executor, validator, config.agent);
        batch = std::make_shared<BatchDriver>(orchestrator, config.batch);
    }
};

class CodeAgentServer {
public:
    explicit CodeAgentServer(std::shared_ptr<Services> services)
        : services_(std::move(services)),
          jobs_(static_cast<size_t>(services_->config.server.max_finished_jobs)),
          job_pool_(static_cast<size_t>(services_->config.batch.max_parallel_sessions)) {
        setup_routes();
    }

    void run() {
        const auto& s = services_->config.server;
        spdlog::info("🚀 Starting code agent backend on {}:{}", s.host, s.port);
        if (!server_.listen(s.host, s.port)) {
            throw std::runtime_error("Cannot listen on " + s.host + ":" + std::to_string(s.port));
        }
    }

private:
    std::shared_ptr<Services> services_;
    httplib::Server server_;

    JobTable jobs_;
    std::atomic<long> job_counter_{0};

    // Last member: drained and joined before the job table goes away.
    ThreadPool job_pool_;

    static void reply(httplib::Response& res, int status, const json& body) {
        res.status = status;
        res.set_content(body.dump(), "application/json");
    }

    static json parse_body(const httplib::Request& req) {
        auto body = json::parse(req.body, nullptr, false);
        if (body.is_discarded() || !body.is_object()) {
            throw std::invalid_argument("request body must be a JSON object");
        }
        return body;
    }

    static std::string required_string(const json& body, const char* key) {
        if (!body.contains(key) || !body[key].is_string() || body[key].get<std::string>().empty()) {
            throw std::invalid_argument(std::string("missing field: ") + key);
        }
        return body[key].get<std::string>();
    }

    void setup_routes() {
        server_.Options("/(.*)", [](const httplib::Request&, httplib::Response& res) {
            res.set_header("Access-Control-Allow-Origin", "*");
            res.set_header("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
            res.set_header("Access-Control-Allow-Headers", "Content-Type");
            res.status = 204;
        });

        server_.set_pre_routing_handler([](const httplib::Request&, httplib::Response& res) {
            res.set_header("Access-Control-Allow-Origin", "*");
            return httplib::Server::HandlerResponse::Unhandled;
        });

        server_.Get("/api/health", [this](const httplib::Request&, httplib::Response& res) {
            json languages = json::array();
            for (auto lang : all_languages()) languages.push_back(to_string(lang));
            bool available = services_->runtime->is_available();
            reply(res, available ? 200 : 503, {
                {"status", available ? "ok" : "degraded"},
                {"runtime", services_->runtime->name()},
                {"runtime_available", available},
                {"live_containers", SystemMonitor::global_live_containers.load()},
                {"languages", languages}
            });
        });

        server_.Get("/api/admin/telemetry", [](const httplib::Request&, httplib::Response& res) {
            reply(res, 200, {
                {"metrics", SystemMonitor::snapshot_json()},
                {"logs", LogManager::instance().get_logs_json()},
                {"traces", LogManager::instance().get_traces_json()}
            });
        });

        server_.Post("/api/execute", [this](const httplib::Request& req, httplib::Response& res) {
            handle_execute(req, res);
        });

        server_.Post("/api/validate", [this](const httplib::Request& req, httplib::Response& res) {
            handle_validate(req, res);
        });

        server_.Post("/api/solve", [this](const httplib::Request& req, httplib::Response& res) {
            handle_solve(req, res);
        });

        server_.Post("/api/jobs", [this](const httplib::Request& req, httplib::Response& res) {
            handle_submit_job(req, res);
        });

        server_.Get("/api/jobs/:job_id", [this](const httplib::Request& req, httplib::Response& res) {
            std::string id = req.path_params.at("job_id");
            auto state = jobs_.get(id);
            if (!state) {
                reply(res, 404, {{"error", "unknown job " + id}});
                return;
            }
            reply(res, 200, *state);
        });
    }

    void handle_execute(const httplib::Request& req, httplib::Response& res) {
        try {
            auto body = parse_body(req);
            std::string code = required_string(body, "code");
            std::string language = required_string(body, "language");
            int timeout = body.value("timeout", 0);
            auto result = services_->executor->execute(code, language, timeout);
            reply(res, 200, result.to_json());
        } catch (const std::invalid_argument& e) {
            reply(res, 400, {{"error", e.what()}});
        } catch (const SandboxUnavailableError& e) {
            reply(res, 503, {{"error", e.what()}});
        } catch (const std::exception& e) {
            spdlog::error("❌ /api/execute failed: {}", e.what());
            reply(res, 500, {{"error", e.what()}});
        }
    }

    void handle_validate(const httplib::Request& req, httplib::Response& res) {
        try {
            auto body = parse_body(req);
            std::string code = required_string(body, "code");
            std::string language = required_string(body, "language");
            reply(res, 200, services_->validator->validate(code, language).to_json());
        } catch (const std::invalid_argument& e) {
            reply(res, 400, {{"error", e.what()}});
        } catch (const SandboxUnavailableError& e) {
            reply(res, 503, {{"error", e.what()}});
        } catch (const std::exception& e) {
            spdlog::error("❌ /api/validate failed: {}", e.what());
            reply(res, 500, {{"error", e.what()}});
        }
    }

    void handle_solve(const httplib::Request& req, httplib::Response& res) {
        try {
            auto body = parse_body(req);
            std::string problem = required_string(body, "problem");
            std::string language = required_string(body, "language");
            auto lang = language_from_string(language);
            if (!lang) {
                reply(res, 400, {{"error", "Unsupported language: " + language},
                                 {"supported", supported_languages_list()}});
                return;
            }
            auto requirements = body.value("requirements", std::vector<std::string>{});
            int ceiling = body.value("max_iterations", 0);
            auto outcome = services_->orchestrator->run(problem, *lang, requirements, ceiling);
            reply(res, 200, outcome.to_json());
        } catch (const std::invalid_argument& e) {
            reply(res, 400, {{"error", e.what()}});
        } catch (const json::exception& e) {
            reply(res, 400, {{"error", e.what()}});
        } catch (const SandboxUnavailableError& e) {
            reply(res, 503, {{"error", e.what()}});
        } catch (const std::exception& e) {
            spdlog::error("❌ /api/solve failed: {}", e.what());
            reply(res, 500, {{"error", e.what()}});
        }
    }

    void handle_submit_job(const httplib::Request& req, httplib::Response& res) {
        ParsedAssignment assignment;
        std::string output_dir;
        try {
            auto body = parse_body(req);
            output_dir = body.value("output_dir", services_->config.batch.output_dir);
            if (body.contains("contents")) {
                assignment = InputParser::parse(body.at("contents").get<std::string>());
            } else if (body.contains("path")) {
                assignment = InputParser::parse_file(body.at("path").get<std::string>());
            } else {
                throw std::invalid_argument("either contents or path is required");
            }
        } catch (const ParseError& e) {
            reply(res, 400, {{"error", e.what()}});
            return;
        } catch (const std::invalid_argument& e) {
            reply(res, 400, {{"error", e.what()}});
            return;
        } catch (const json::exception& e) {
            reply(res, 400, {{"error", e.what()}});
            return;
        }

        std::string id = "job-" + std::to_string(++job_counter_);
        jobs_.set(id, {{"job_id", id}, {"status", "queued"}, {"questions", assignment.questions.size()}});

        job_pool_.enqueue([this, id, assignment, output_dir]() {
            jobs_.set(id, {{"job_id", id}, {"status", "running"}, {"questions", assignment.questions.size()}});
            try {
                auto report = services_->batch->run(assignment, output_dir);
                json state = report.to_json();
                state["job_id"] = id;
                state["status"] = report.all_done() ? "completed" : "needs attention";
                state["manifest"] = report.manifest_path;
                jobs_.set(id, std::move(state));
            } catch (const std::exception& e) {
                spdlog::error("💥 Job {} failed: {}", id, e.what());
                jobs_.set(id, {{"job_id", id}, {"status", "failed"}, {"error", e.what()}});
            }
        });

        reply(res, 202, {{"job_id", id}, {"status", "queued"}});
    }
};

void print_usage() {
    std::cerr << "usage:\n"
              << "  code_agent serve [--port N] [--config FILE]\n"
              << "  code_agent run <input.txt> [output_dir] [--config FILE]\n";
}

} // namespace

int main(int argc, char* argv[]) {
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");
    spdlog::set_level(spdlog::level::info);

    std::vector<std::string> args(argv + 1, argv + argc);
    std::string config_path;
    int port_override = 0;
    std::vector<std::string> positional;
    for (size_t i = 0; i < args.size(); ++i) {
        if (args[i] == "--config" && i + 1 < args.size()) {
            config_path = args[++i];
        } else if (args[i] == "--port" && i + 1 < args.size()) {
            try {
                port_override = std::stoi(args[++i]);
            } catch (const std::exception&) {
                std::cerr << "invalid port: " << args[i] << "\n";
                return kExitUsage;
            }
        } else if (args[i] == "-h" || args[i] == "--help") {
            print_usage();
            return kExitOk;
        } else {
            positional.push_back(args[i]);
        }
    }

    std::string mode = positional.empty() ? "serve" : positional[0];
    if (mode != "serve" && mode != "run") {
        print_usage();
        return kExitUsage;
    }
    if (mode == "run" && positional.size() < 2) {
        print_usage();
        return kExitUsage;
    }

    AppConfig config;
    try {
        config = AppConfig::load(config_path);
    } catch (const ConfigError& e) {
        spdlog::error("⚙️  {}", e.what());
        return kExitUsage;
    }
    spdlog::set_level(spdlog::level::from_str(config.log_level));
    if (port_override > 0) config.server.port = port_override;

    std::shared_ptr<Services> services;
    try {
        services = std::make_shared<Services>(config);
    } catch (const SandboxUnavailableError& e) {
        spdlog::critical("🚨 {}", e.what());
        return kExitSandbox;
    }

    if (mode == "serve") {
        try {
            CodeAgentServer server(services);
            server.run();
        } catch (const std::exception& e) {
            spdlog::critical("🚨 {}", e.what());
            return kExitUsage;
        }
        return kExitOk;
    }

    const std::string input = positional[1];
    const std::string output_dir = positional.size() > 2 ? positional[2] : config.batch.output_dir;
    try {
        auto report = services->batch->run_file(input, output_dir);
        for (const auto& r : report.results) {
            spdlog::info("Question {}: {} ({} iteration(s))", r.number, r.status(), r.iterations);
        }
        spdlog::info("📄 Manifest written to {}", report.manifest_path);
        return kExitOk;
    } catch (const ParseError& e) {
        spdlog::error("📄 {}", e.what());
        return kExitInput;
    } catch (const SandboxUnavailableError& e) {
        spdlog::critical("🚨 {}", e.what());
        return kExitSandbox;
    } catch (const std::exception& e) {
        spdlog::error("💥 Batch failed: {}", e.what());
        return kExitUsage;
    }
}
