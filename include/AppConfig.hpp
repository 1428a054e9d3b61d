#pragma once
#include <map>
#include <stdexcept>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "LanguageRegistry.hpp"

namespace code_agent {

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {}
};

struct LlmSettings {
    std::string endpoint = "https://api.groq.com/openai/v1/chat/completions";
    std::string model = "llama-3.1-70b-versatile";
    std::vector<std::string> api_keys;
    double temperature = 0.2;
    int max_tokens = 4096;
    int timeout_seconds = 60;
    int max_retries = 4;
};

struct AgentSettings {
    int max_iterations = 5;
    bool enable_review = true;
};

struct SandboxSettings {
    std::string docker_binary = "docker";
    int timeout_seconds = 30;
    std::string memory_limit = "512m";
    double cpu_limit = 1.0;
    int pids_limit = 128;
    int max_concurrent_containers = 4;
    size_t max_source_bytes = 100 * 1024;
    size_t max_output_bytes = 1024 * 1024;
    std::map<std::string, std::string> images;   // language name -> image override
};

// Image for a language, honoring sandbox.images overrides.
std::string image_for(const SandboxSettings& sandbox, Language lang);

struct ValidationSettings {
    int tool_timeout_seconds = 60;
    size_t max_diagnostic_chars = 500;
    std::vector<std::string> disabled_tools;
    size_t cache_entries = 256;
    int cache_ttl_seconds = 600;
};

struct BatchSettings {
    int max_parallel_sessions = 2;
    std::string output_dir = "data/output";
};

struct ServerSettings {
    std::string host = "127.0.0.1";
    int port = 5002;
    int max_finished_jobs = 100;    // finished job states kept for GET /api/jobs/:id
};

struct AppConfig {
    LlmSettings llm;
    AgentSettings agent;
    SandboxSettings sandbox;
    ValidationSettings validation;
    BatchSettings batch;
    ServerSettings server;
    std::string log_level = "info";

    std::string image_for(Language lang) const { return code_agent::image_for(sandbox, lang); }

    // Throws ConfigError when a value is out of range.
    void validate() const;

    static AppConfig from_json(const nlohmann::json& j);

    // Explicit path if given, otherwise the first code_agent.json found in
    // ".", "..", "config/". Environment overrides are applied last.
    static AppConfig load(const std::string& explicit_path = "");

    void apply_env_overrides();
};

} // namespace code_agent
