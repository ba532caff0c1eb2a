#pragma once

namespace platform {

// Detaches from the controlling terminal. Exits the process on failure.
void daemonize();

} // namespace platform
