#include "common/testing.h"

#include "absl/debugging/failure_signal_handler.h"
#include "absl/log/initialize.h"

namespace {

// Makes check failures in death tests and crashes in regular tests print a readable report.
class FailureSignalHandlerInstaller {
 public:
  explicit FailureSignalHandlerInstaller() {
    absl::InitializeLog();
    absl::InstallFailureSignalHandler(absl::FailureSignalHandlerOptions());
  }
};

FailureSignalHandlerInstaller failure_signal_handler_installer;

}  // namespace
