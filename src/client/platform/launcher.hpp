#pragma once

#include <string>
#include <vector>

namespace platform {

// Start program as a detached process (new session, stdio on /dev/null)
// without waiting for it. Returns false if it could not be started.
bool spawn_detached(const std::string& program, const std::vector<std::string>& args);

// Path of the app executable installed next to the running binary, or the
// bare name for a PATH lookup.
std::string sibling_executable(const std::string& name);

} // namespace platform
