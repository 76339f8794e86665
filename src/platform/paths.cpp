#include "platform/paths.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <print>
#include <unistd.h>
#include <vector>

namespace fs = std::filesystem;

namespace platform {

std::string config_dir() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg) return std::string(xdg) + "/chunkscribe";
    const char* home = std::getenv("HOME");
    if (!home) return {};
    return std::string(home) + "/.config/chunkscribe";
}

std::string data_dir() {
    const char* xdg = std::getenv("XDG_DATA_HOME");
    if (xdg) return std::string(xdg) + "/chunkscribe";
    const char* home = std::getenv("HOME");
    if (!home) return {};
    return std::string(home) + "/.local/share/chunkscribe";
}

std::string make_job_dir(const std::string& parent) {
    std::error_code ec;
    fs::path base = parent.empty() ? fs::temp_directory_path(ec) : fs::path(parent);
    if (ec) {
        std::println(stderr, "paths: no temp directory: {}", ec.message());
        return {};
    }
    fs::create_directories(base, ec);

    // mkdtemp needs a mutable char*
    std::string pattern = (base / "chunkscribe-XXXXXX").string();
    std::vector<char> tmpl(pattern.begin(), pattern.end());
    tmpl.push_back('\0');
    if (!::mkdtemp(tmpl.data())) {
        std::println(stderr, "paths: mkdtemp({}) failed: {}", pattern, std::strerror(errno));
        return {};
    }
    return std::string(tmpl.data());
}

} // namespace platform
