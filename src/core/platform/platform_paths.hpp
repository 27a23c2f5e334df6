#pragma once

#include <string>

namespace platform {

// Per-user directories. Empty when neither the XDG variable nor HOME is set.
std::string config_dir();
std::string data_dir();
std::string cache_dir();

} // namespace platform
