#pragma once
#include <string>

namespace netsnap::app {

struct CommandResult {
  bool ok{false};
  std::string output;  // stdout+stderr, UTF-8 sanitized
  int exit_code{-1};   // -1 when the process could not be started or was signalled
  std::string error;   // set when !ok
};

// Runs a command line through the platform shell. Implementations never throw;
// failures come back in CommandResult.
class ICommandRunner {
public:
  virtual ~ICommandRunner() = default;
  [[nodiscard]] virtual CommandResult run(const std::string& command) = 0;
};

// popen(3)/_popen based runner. Blocks until the child exits.
class ShellCommandRunner : public ICommandRunner {
public:
  [[nodiscard]] CommandResult run(const std::string& command) override;
};

} // namespace netsnap::app
