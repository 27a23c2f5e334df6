#include "platform/platform_paths.hpp"

#include <cstdlib>

namespace platform {

namespace {

std::string xdg_dir(const char* var, const char* home_suffix) {
    const char* xdg = std::getenv(var);
    if (xdg && *xdg) return std::string(xdg) + "/whisperdesk";
    const char* home = std::getenv("HOME");
    if (!home) return {};
    return std::string(home) + home_suffix + "/whisperdesk";
}

} // namespace

std::string config_dir() {
    return xdg_dir("XDG_CONFIG_HOME", "/.config");
}

std::string data_dir() {
    return xdg_dir("XDG_DATA_HOME", "/.local/share");
}

std::string cache_dir() {
    return xdg_dir("XDG_CACHE_HOME", "/.cache");
}

} // namespace platform
