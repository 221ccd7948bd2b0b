#pragma once

#include <string>

namespace platform {

// Per-user directories; empty string when neither XDG nor HOME is set.
std::string config_dir();
std::string data_dir();

// Directory holding the running executable, used to locate bundled resources.
std::string executable_dir();

} // namespace platform
