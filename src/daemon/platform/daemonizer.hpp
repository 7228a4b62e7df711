#pragma once

namespace platform {

// Detaches from the terminal. Returns only in the final child; false when a
// fork fails, in which case the caller is still attached.
bool daemonize();

} // namespace platform
