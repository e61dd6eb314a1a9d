#pragma once

#include <string>

namespace platform {

// Directory holding config.json, empty if neither XDG_CONFIG_HOME nor HOME is set.
std::string config_dir();

} // namespace platform
