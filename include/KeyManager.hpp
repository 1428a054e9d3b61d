#pragma once
#include <vector>
#include <string>
#include <shared_mutex>
#include <spdlog/spdlog.h>

namespace code_agent {

// Pool of API keys for the completion endpoint. A key that keeps getting
// rate limited is decommissioned; rotation skips decommissioned keys.
class KeyManager {
private:
    struct ApiKey {
        std::string key;
        bool is_active = true;
        int fail_count = 0;
    };

    std::vector<ApiKey> key_pool;
    mutable std::shared_mutex pool_mutex;
    size_t current_index = 0;
    std::string model;

    static constexpr int kMaxFailures = 2;

    // First active slot at or after current_index; key_pool.size() when none.
    size_t active_index_locked() const {
        for (size_t i = 0; i < key_pool.size(); ++i) {
            size_t idx = (current_index + i) % key_pool.size();
            if (key_pool[idx].is_active) return idx;
        }
        return key_pool.size();
    }

public:
    KeyManager(const std::vector<std::string>& keys, std::string model_name)
        : model(std::move(model_name)) {
        for (const auto& k : keys) {
            if (!k.empty()) key_pool.push_back({k, true, 0});
        }
        if (key_pool.empty()) {
            spdlog::warn("⚠️ No API keys configured (set GROQ_API_KEY or llm.api_keys)");
        } else {
            spdlog::info("🔑 Key pool ready: {} key(s), model {}", key_pool.size(), model);
        }
    }

    size_t get_active_key_count() const {
        std::shared_lock lock(pool_mutex);
        size_t count = 0;
        for (const auto& k : key_pool) {
            if (k.is_active) count++;
        }
        return count;
    }

    // Empty when the pool is empty or every key has been decommissioned.
    std::string get_current_key() const {
        std::shared_lock lock(pool_mutex);
        size_t idx = active_index_locked();
        return idx < key_pool.size() ? key_pool[idx].key : "";
    }

    std::string get_current_model() const {
        return model;
    }

    void report_rate_limit() {
        std::unique_lock lock(pool_mutex);
        size_t idx = active_index_locked();
        if (idx >= key_pool.size()) return;

        auto& current = key_pool[idx];
        current.fail_count++;
        if (current.fail_count > kMaxFailures) {
            current.is_active = false;
            spdlog::warn("⚠️ Key #{} decommissioned after {} rate limits", idx, current.fail_count);
        }
        current_index = (idx + 1) % key_pool.size();
    }

    void report_success() {
        std::unique_lock lock(pool_mutex);
        size_t idx = active_index_locked();
        if (idx < key_pool.size()) key_pool[idx].fail_count = 0;
    }
};

} // namespace code_agent
