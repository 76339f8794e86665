#pragma once

#include <string>

namespace platform {

// $XDG_CONFIG_HOME/chunkscribe or ~/.config/chunkscribe; empty if neither is known.
std::string config_dir();

// $XDG_DATA_HOME/chunkscribe or ~/.local/share/chunkscribe; empty if neither is known.
std::string data_dir();

// Creates a fresh, private directory for one job's chunk files under `parent`
// (system temp directory when empty). Returns empty on failure.
std::string make_job_dir(const std::string& parent);

} // namespace platform
