#pragma once

namespace dockpipe {

// Installs SIGINT/SIGTERM handlers that record the signal instead of terminating,
// so the run can stop at the next boundary and close its log. Restores the
// previous handlers on destruction.
class InterruptGuard {
public:
  InterruptGuard();
  ~InterruptGuard();

  InterruptGuard(const InterruptGuard&) = delete;
  InterruptGuard& operator=(const InterruptGuard&) = delete;
};

bool interruptRequested();
// Signal number of the pending interrupt, 0 when none.
int pendingInterrupt();
void requestInterrupt(int signalNumber);
void clearInterrupt();

} // namespace dockpipe
