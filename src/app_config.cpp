#include "AppConfig.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <spdlog/spdlog.h>

namespace code_agent {

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

const char* env_or_null(const char* name) {
    const char* v = std::getenv(name);
    return (v && *v) ? v : nullptr;
}

int parse_int_env(const char* name, const char* value) {
    try {
        size_t used = 0;
        int n = std::stoi(value, &used);
        if (used != std::string(value).size()) throw std::invalid_argument(value);
        return n;
    } catch (const std::exception&) {
        throw ConfigError(std::string("Environment variable ") + name + " is not an integer: " + value);
    }
}

double parse_double_env(const char* name, const char* value) {
    try {
        size_t used = 0;
        double d = std::stod(value, &used);
        if (used != std::string(value).size()) throw std::invalid_argument(value);
        return d;
    } catch (const std::exception&) {
        throw ConfigError(std::string("Environment variable ") + name + " is not a number: " + value);
    }
}

std::vector<std::string> split_keys(const std::string& raw) {
    std::vector<std::string> keys;
    std::stringstream ss(raw);
    std::string item;
    while (std::getline(ss, item, ',')) {
        size_t a = item.find_first_not_of(" \t");
        if (a == std::string::npos) continue;
        size_t b = item.find_last_not_of(" \t");
        keys.push_back(item.substr(a, b - a + 1));
    }
    return keys;
}

} // namespace

std::string image_for(const SandboxSettings& sandbox, Language lang) {
    for (const auto& [name, image] : sandbox.images) {
        if (language_from_string(name) == lang && !image.empty()) return image;
    }
    return language_spec(lang).default_image;
}

void AppConfig::validate() const {
    if (agent.max_iterations < 1 || agent.max_iterations > 10)
        throw ConfigError("agent.max_iterations must be within 1..10, got " + std::to_string(agent.max_iterations));
    if (sandbox.timeout_seconds < 1 || sandbox.timeout_seconds > 300)
        throw ConfigError("sandbox.timeout_seconds must be within 1..300, got " + std::to_string(sandbox.timeout_seconds));
    if (sandbox.cpu_limit <= 0.0)
        throw ConfigError("sandbox.cpu_limit must be positive");
    if (sandbox.memory_limit.empty())
        throw ConfigError("sandbox.memory_limit must not be empty");
    if (sandbox.max_concurrent_containers < 1)
        throw ConfigError("sandbox.max_concurrent_containers must be at least 1");
    if (validation.tool_timeout_seconds < 1)
        throw ConfigError("validation.tool_timeout_seconds must be at least 1");
    if (batch.max_parallel_sessions < 1)
        throw ConfigError("batch.max_parallel_sessions must be at least 1");
    if (server.max_finished_jobs < 1)
        throw ConfigError("server.max_finished_jobs must be at least 1");
    if (llm.timeout_seconds < 1)
        throw ConfigError("llm.timeout_seconds must be at least 1");
    for (const auto& [name, image] : sandbox.images) {
        if (!language_from_string(name))
            throw ConfigError("sandbox.images has an unsupported language: " + name);
    }
}

AppConfig AppConfig::from_json(const json& j) {
    AppConfig cfg;
    try {
        if (j.contains("llm")) {
            const auto& l = j["llm"];
            cfg.llm.endpoint = l.value("endpoint", cfg.llm.endpoint);
            cfg.llm.model = l.value("model", cfg.llm.model);
            cfg.llm.api_keys = l.value("api_keys", cfg.llm.api_keys);
            cfg.llm.temperature = l.value("temperature", cfg.llm.temperature);
            cfg.llm.max_tokens = l.value("max_tokens", cfg.llm.max_tokens);
            cfg.llm.timeout_seconds = l.value("timeout_seconds", cfg.llm.timeout_seconds);
            cfg.llm.max_retries = l.value("max_retries", cfg.llm.max_retries);
        }
        if (j.contains("agent")) {
            const auto& a = j["agent"];
            cfg.agent.max_iterations = a.value("max_iterations", cfg.agent.max_iterations);
            cfg.agent.enable_review = a.value("enable_review", cfg.agent.enable_review);
        }
        if (j.contains("sandbox")) {
            const auto& s = j["sandbox"];
            cfg.sandbox.docker_binary = s.value("docker_binary", cfg.sandbox.docker_binary);
            cfg.sandbox.timeout_seconds = s.value("timeout_seconds", cfg.sandbox.timeout_seconds);
            cfg.sandbox.memory_limit = s.value("memory_limit", cfg.sandbox.memory_limit);
            cfg.sandbox.cpu_limit = s.value("cpu_limit", cfg.sandbox.cpu_limit);
            cfg.sandbox.pids_limit = s.value("pids_limit", cfg.sandbox.pids_limit);
            cfg.sandbox.max_concurrent_containers =
                s.value("max_concurrent_containers", cfg.sandbox.max_concurrent_containers);
            cfg.sandbox.max_source_bytes = s.value("max_source_bytes", cfg.sandbox.max_source_bytes);
            cfg.sandbox.max_output_bytes = s.value("max_output_bytes", cfg.sandbox.max_output_bytes);
            cfg.sandbox.images = s.value("images", cfg.sandbox.images);
        }
        if (j.contains("validation")) {
            const auto& v = j["validation"];
            cfg.validation.tool_timeout_seconds = v.value("tool_timeout_seconds", cfg.validation.tool_timeout_seconds);
            cfg.validation.max_diagnostic_chars = v.value("max_diagnostic_chars", cfg.validation.max_diagnostic_chars);
            cfg.validation.disabled_tools = v.value("disabled_tools", cfg.validation.disabled_tools);
            cfg.validation.cache_entries = v.value("cache_entries", cfg.validation.cache_entries);
            cfg.validation.cache_ttl_seconds = v.value("cache_ttl_seconds", cfg.validation.cache_ttl_seconds);
        }
        if (j.contains("batch")) {
            const auto& b = j["batch"];
            cfg.batch.max_parallel_sessions = b.value("max_parallel_sessions", cfg.batch.max_parallel_sessions);
            cfg.batch.output_dir = b.value("output_dir", cfg.batch.output_dir);
        }
        if (j.contains("server")) {
            const auto& s = j["server"];
            cfg.server.host = s.value("host", cfg.server.host);
            cfg.server.port = s.value("port", cfg.server.port);
            cfg.server.max_finished_jobs = s.value("max_finished_jobs", cfg.server.max_finished_jobs);
        }
        cfg.log_level = j.value("log_level", cfg.log_level);
    } catch (const json::exception& e) {
        throw ConfigError(std::string("Malformed configuration: ") + e.what());
    }
    return cfg;
}

void AppConfig::apply_env_overrides() {
    if (const char* v = env_or_null("GROQ_API_KEY")) llm.api_keys = split_keys(v);
    if (const char* v = env_or_null("GROQ_MODEL")) llm.model = v;
    if (const char* v = env_or_null("MAX_ITERATIONS")) agent.max_iterations = parse_int_env("MAX_ITERATIONS", v);
    if (const char* v = env_or_null("CODE_TIMEOUT_SECONDS"))
        sandbox.timeout_seconds = parse_int_env("CODE_TIMEOUT_SECONDS", v);
    if (const char* v = env_or_null("DOCKER_MEMORY_LIMIT")) sandbox.memory_limit = v;
    if (const char* v = env_or_null("DOCKER_CPU_LIMIT")) sandbox.cpu_limit = parse_double_env("DOCKER_CPU_LIMIT", v);
    if (const char* v = env_or_null("LOG_LEVEL")) log_level = v;
}

AppConfig AppConfig::load(const std::string& explicit_path) {
    std::vector<std::string> search_paths;
    if (!explicit_path.empty()) {
        if (!fs::exists(explicit_path)) throw ConfigError("Config file not found: " + explicit_path);
        search_paths.push_back(explicit_path);
    } else {
        search_paths = {"code_agent.json", "../code_agent.json", "config/code_agent.json"};
    }

    AppConfig cfg;
    for (const auto& path : search_paths) {
        std::ifstream f(path);
        if (!f.is_open()) continue;
        try {
            cfg = from_json(json::parse(f));
        } catch (const json::parse_error& e) {
            throw ConfigError("Cannot parse " + path + ": " + e.what());
        }
        spdlog::info("⚙️  Configuration loaded from {}", path);
        break;
    }

    cfg.apply_env_overrides();
    cfg.validate();
    return cfg;
}

} // namespace code_agent
