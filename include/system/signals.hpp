#pragma once

#include <atomic>

namespace ovaup {

// Set by the first SIGINT/SIGTERM; a second one exits at once. Observed by
// CancelToken waits, archive reads and the HTTP body callback.
extern std::atomic_bool g_cancel;

void InstallSignalHandlers();

} // namespace ovaup
