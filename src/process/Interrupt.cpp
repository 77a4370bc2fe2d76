#include "dockpipe/process/Interrupt.hpp"

#include <csignal>

#include <signal.h>

namespace dockpipe {

namespace {

volatile std::sig_atomic_t gPendingSignal = 0;
struct sigaction gPreviousInt {};
struct sigaction gPreviousTerm {};

void onInterruptSignal(int signalNumber) {
  gPendingSignal = signalNumber;
}

} // namespace

InterruptGuard::InterruptGuard() {
  struct sigaction action {};
  action.sa_handler = onInterruptSignal;
  sigemptyset(&action.sa_mask);
  // No SA_RESTART: blocking reads return EINTR so the runner can react.
  action.sa_flags = 0;
  ::sigaction(SIGINT, &action, &gPreviousInt);
  ::sigaction(SIGTERM, &action, &gPreviousTerm);
}

InterruptGuard::~InterruptGuard() {
  ::sigaction(SIGINT, &gPreviousInt, nullptr);
  ::sigaction(SIGTERM, &gPreviousTerm, nullptr);
}

bool interruptRequested() {
  return gPendingSignal != 0;
}

int pendingInterrupt() {
  return static_cast<int>(gPendingSignal);
}

void requestInterrupt(int signalNumber) {
  gPendingSignal = signalNumber;
}

void clearInterrupt() {
  gPendingSignal = 0;
}

} // namespace dockpipe
