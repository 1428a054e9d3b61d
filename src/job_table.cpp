#include "job_table.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>

namespace code_agent {

JobTable::JobTable(size_t max_finished) : max_finished_(std::max<size_t>(1, max_finished)) {}

bool JobTable::is_finished(const nlohmann::json& state) {
    std::string status = state.value("status", "");
    return status != "queued" && status != "running";
}

void JobTable::set(const std::string& id, nlohmann::json state) {
    const bool finished = is_finished(state);
    std::lock_guard<std::mutex> lock(mtx_);
    jobs_[id] = std::move(state);
    finished_.erase(std::remove(finished_.begin(), finished_.end(), id), finished_.end());
    if (!finished) return;

    finished_.push_back(id);
    while (finished_.size() > max_finished_) {
        spdlog::debug("🗑️ Forgetting job {}", finished_.front());
        jobs_.erase(finished_.front());
        finished_.pop_front();
    }
}

std::optional<nlohmann::json> JobTable::get(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = jobs_.find(id);
    if (it == jobs_.end()) return std::nullopt;
    return it->second;
}

size_t JobTable::size() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return jobs_.size();
}

} // namespace code_agent
