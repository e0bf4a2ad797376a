#pragma once

#include <string>

namespace platform {

std::string config_dir();
std::string data_dir();

// Per-user directory holding the IPC socket and the instance lock.
std::string runtime_dir();

// Create dir with mode 0700 if it does not exist yet. Existing directories
// are left as they are.
bool ensure_private_dir(const std::string& dir);

std::string ipc_endpoint();

} // namespace platform
