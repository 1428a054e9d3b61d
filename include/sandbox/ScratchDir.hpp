#pragma once
#include <filesystem>
#include <string>

namespace code_agent {

namespace fs = std::filesystem;

// Fresh single-use directory under the system temp dir, removed with
// everything in it when the object goes away.
class ScratchDir {
public:
    explicit ScratchDir(const std::string& prefix = "code_agent");
    ~ScratchDir();

    ScratchDir(const ScratchDir&) = delete;
    ScratchDir& operator=(const ScratchDir&) = delete;

    const fs::path& path() const { return path_; }

    // Writes content to path()/file_name, throws std::runtime_error on I/O failure.
    fs::path write_file(const std::string& file_name, const std::string& content);

private:
    fs::path path_;
};

} // namespace code_agent
