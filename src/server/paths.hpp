#pragma once

#include <string>

namespace platform {

// $XDG_CONFIG_HOME/transcribe-service or ~/.config/transcribe-service.
// Empty if neither variable is set.
std::string config_dir();

// $TMPDIR, falling back to /tmp.
std::string temp_dir();

} // namespace platform
