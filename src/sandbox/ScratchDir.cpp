#include "sandbox/ScratchDir.hpp"
#include <atomic>
#include <chrono>
#include <fstream>
#include <stdexcept>
#include <unistd.h>
#include <spdlog/spdlog.h>

namespace code_agent {

namespace {
std::atomic<unsigned long> g_scratch_counter{0};
}

ScratchDir::ScratchDir(const std::string& prefix) {
    auto stamp = std::chrono::system_clock::now().time_since_epoch().count();
    std::string name = prefix + "_" + std::to_string(::getpid()) + "_" +
                       std::to_string(g_scratch_counter.fetch_add(1)) + "_" + std::to_string(stamp);
    path_ = fs::temp_directory_path() / name;

    std::error_code ec;
    if (!fs::create_directories(path_, ec) || ec) {
        throw std::runtime_error("Cannot create scratch directory " + path_.string() + ": " + ec.message());
    }
    // Containers may run as a different uid than ours.
    fs::permissions(path_, fs::perms::owner_all | fs::perms::group_all | fs::perms::others_all,
                    fs::perm_options::replace, ec);
}

ScratchDir::~ScratchDir() {
    std::error_code ec;
    fs::remove_all(path_, ec);
    if (ec) {
        spdlog::warn("🧹 Scratch cleanup failed for {}: {}", path_.string(), ec.message());
    }
}

fs::path ScratchDir::write_file(const std::string& file_name, const std::string& content) {
    fs::path target = path_ / file_name;
    std::ofstream out(target, std::ios::out | std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        throw std::runtime_error("Cannot open " + target.string() + " for writing");
    }
    out << content;
    out.close();
    if (!out) {
        throw std::runtime_error("Failed writing " + target.string());
    }
    std::error_code ec;
    fs::permissions(target, fs::perms::owner_read | fs::perms::owner_write |
                            fs::perms::group_read | fs::perms::others_read,
                    fs::perm_options::replace, ec);
    return target;
}

} // namespace code_agent
