#include "platform/platform_paths.hpp"

#include <cstdlib>
#include <filesystem>

namespace platform {

std::string config_dir() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg) return std::string(xdg) + "/echo-engine";
    const char* home = std::getenv("HOME");
    if (!home) return {};
    return std::string(home) + "/.config/echo-engine";
}

std::string data_dir() {
    const char* xdg = std::getenv("XDG_DATA_HOME");
    if (xdg) return std::string(xdg) + "/echo-engine";
    const char* home = std::getenv("HOME");
    if (!home) return {};
    return std::string(home) + "/.local/share/echo-engine";
}

std::string executable_dir() {
    std::error_code ec;
    auto exe = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (ec) return {};
    return exe.parent_path().string();
}

} // namespace platform
