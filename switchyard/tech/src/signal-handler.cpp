#include "switchyard/signal-handler.hpp"

#include <csignal>

namespace {

volatile std::sig_atomic_t g_signalStatus{};

}  // namespace

// Only async-signal-safe work here: the stop is logged by the listener noticing it.
extern "C" void SwitchyardSignalHandler(int sigNum) { g_signalStatus = sigNum; }

namespace switchyard {

void SignalHandler::Enable() {
  std::signal(SIGINT, ::SwitchyardSignalHandler);
  std::signal(SIGTERM, ::SwitchyardSignalHandler);
}

void SignalHandler::Disable() {
  std::signal(SIGINT, SIG_DFL);
  std::signal(SIGTERM, SIG_DFL);
}

bool SignalHandler::IsStopRequested() noexcept { return g_signalStatus != 0; }

void SignalHandler::ResetStopRequest() noexcept { g_signalStatus = 0; }

}  // namespace switchyard
