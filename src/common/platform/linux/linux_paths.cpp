#include "platform/platform_paths.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <print>
#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace platform {

std::string config_dir() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg) return std::string(xdg) + "/arandu";
    const char* home = std::getenv("HOME");
    if (!home) return {};
    return std::string(home) + "/.config/arandu";
}

std::string data_dir() {
    const char* xdg = std::getenv("XDG_DATA_HOME");
    if (xdg) return std::string(xdg) + "/arandu";
    const char* home = std::getenv("HOME");
    if (!home) return {};
    return std::string(home) + "/.local/share/arandu";
}

std::string runtime_dir() {
    const char* xdg = std::getenv("XDG_RUNTIME_DIR");
    if (xdg) return std::string(xdg) + "/arandu";
    const char* home = std::getenv("HOME");
    if (home) return std::string(home) + "/.arandu";
    return "/tmp/arandu-" + std::to_string(::getuid());
}

bool ensure_private_dir(const std::string& dir) {
    std::error_code ec;
    if (fs::is_directory(dir, ec)) return true;

    fs::create_directories(fs::path(dir).parent_path(), ec);
    if (::mkdir(dir.c_str(), 0700) < 0 && errno != EEXIST) {
        std::println(stderr, "paths: cannot create {}: {}", dir, std::strerror(errno));
        return false;
    }
    // mkdir honours the umask; make sure the result is exactly 0700.
    if (::chmod(dir.c_str(), 0700) < 0) {
        std::println(stderr, "paths: chmod {} failed: {}", dir, std::strerror(errno));
        return false;
    }
    return true;
}

std::string ipc_endpoint() {
    return runtime_dir() + "/arandu.sock";
}

} // namespace platform
