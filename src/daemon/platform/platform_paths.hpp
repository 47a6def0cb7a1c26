#pragma once

#include <string>

namespace platform {

// $XDG_CONFIG_HOME/pushscribe, empty if neither XDG_CONFIG_HOME nor HOME is set.
std::string config_dir();

// $XDG_DATA_HOME/pushscribe, empty if neither XDG_DATA_HOME nor HOME is set.
std::string data_dir();

// Unix socket path the daemon listens on and the client connects to.
std::string ipc_endpoint();

// Log file for the supervised whisper-server's stdout/stderr.
std::string server_log_path();

} // namespace platform
