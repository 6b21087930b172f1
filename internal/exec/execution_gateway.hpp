#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include "command_runner.hpp"
#include "config/config.pb.h"
#include "internal/runtime/event_loop.hpp"

namespace kuberoll::exec {

/*
  Why a command (or composed operation) was given up on.
*/
struct QueryFailure {
  std::string   label;
  std::uint32_t attempts{0};
  CommandResult last_result;

  std::string Describe() const;
};

/*
  ExecutionGateway

  The only place cluster errors are absorbed. Each attempt runs on the event
  loop; a failed attempt is re-posted after the fixed delay until max_attempts
  is reached. Then exactly one handler fires: the caller's error handler when
  given, otherwise the fatal handler the gateway was built with.

  Callers never see a transient failure.
*/
class ExecutionGateway {
 public:
  using SuccessHandler = std::function<void(const std::string& output)>;
  using ErrorHandler   = std::function<void(const QueryFailure& failure)>;

  // Several commands that must succeed together, e.g. fetch and re-apply of a
  // manifest. A failed attempt restarts the operation from its first step.
  using Operation = std::function<CommandResult(CommandRunner& runner)>;

  ExecutionGateway(runtime::EventLoop& loop, CommandRunnerPtr runner, const kuberoll::runtime::config::RetryConfig& retry,
                   ErrorHandler fatal_handler);

  void Run(std::string label, Command command, SuccessHandler on_success, ErrorHandler on_error = {});
  void RunOperation(std::string label, Operation operation, SuccessHandler on_success, ErrorHandler on_error = {});

  std::uint32_t MaxAttempts() const {
    return max_attempts_;
  }

  util::Duration RetryDelay() const {
    return delay_;
  }

 private:
  struct Request {
    std::string    label;
    Operation      operation;
    SuccessHandler on_success;
    ErrorHandler   on_error;
    std::uint32_t  attempts{0};
  };

  void Attempt(std::shared_ptr<Request> request);

  runtime::EventLoop& loop_;
  CommandRunnerPtr    runner_;
  std::uint32_t       max_attempts_;
  util::Duration      delay_;
  ErrorHandler        fatal_handler_;
};

} // namespace kuberoll::exec
