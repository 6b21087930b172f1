#pragma once

#include <memory>
#include <string>
#include <vector>

namespace kuberoll::exec {

/*
  One external program invocation. argv[0] is resolved against PATH; no
  shell is involved, so arguments never need quoting.
*/
struct Command {
  std::vector<std::string> argv;
  std::string              stdin_data;

  std::string ToString() const;
};

struct CommandResult {
  int         exit_code{0};
  std::string stdout_text;
  std::string stderr_text;

  // kubectl reports some failures with exit code 0 and a message on stderr,
  // so stderr output counts as a failed attempt. The one exception is the
  // "No resources found ..." notice kubectl prints for an empty listing.
  bool Failed() const;
};

class CommandRunner {
 public:
  virtual ~CommandRunner() = default;

  virtual CommandResult Run(const Command& command) = 0;
};

using CommandRunnerPtr = std::shared_ptr<CommandRunner>;

/*
  fork/exec runner. Feeds stdin_data and drains stdout/stderr concurrently
  through poll(2) so a large manifest can't deadlock the pipes.

  Failure to spawn is reported as exit code 127 with the errno text on stderr,
  which the gateway treats like any other failed attempt.
*/
class ProcessCommandRunner final : public CommandRunner {
 public:
  // Ignores SIGPIPE process-wide; a child that exits before reading its
  // stdin must surface as a failed attempt, not kill the caller.
  ProcessCommandRunner();

  CommandResult Run(const Command& command) override;
};

} // namespace kuberoll::exec
