#pragma once
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <nlohmann/json.hpp>

namespace code_agent {

// Status of every batch job submitted over HTTP. Queued and running jobs are
// always kept; only the newest max_finished finished jobs stay queryable.
class JobTable {
public:
    explicit JobTable(size_t max_finished = 100);

    void set(const std::string& id, nlohmann::json state);
    std::optional<nlohmann::json> get(const std::string& id) const;
    size_t size() const;

    static bool is_finished(const nlohmann::json& state);

private:
    size_t max_finished_;
    mutable std::mutex mtx_;
    std::unordered_map<std::string, nlohmann::json> jobs_;
    std::deque<std::string> finished_;  // oldest first
};

} // namespace code_agent
