#pragma once

#include <string>

namespace platform {

// Detach from the controlling terminal. stdout/stderr are appended to
// log_path, or discarded when it is empty.
void daemonize(const std::string& log_path = {});

} // namespace platform
