#pragma once

namespace switchyard {

// Process wide SIGINT / SIGTERM handling. Running servers poll IsStopRequested() on each event loop tick
// and stop gracefully once a signal was received.
class SignalHandler {
 public:
  SignalHandler() noexcept = delete;

  static void Enable();

  // Restores the default signal dispositions.
  static void Disable();

  [[nodiscard]] static bool IsStopRequested() noexcept;

  // Clears a previously received signal so that a server can be started again in the same process.
  static void ResetStopRequest() noexcept;
};

}  // namespace switchyard
