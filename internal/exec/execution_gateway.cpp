#include "execution_gateway.hpp"

#include <algorithm>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace kuberoll::exec {

using kuberoll::observability::IntField;
using kuberoll::observability::StringField;

namespace {

std::string FirstLine(const std::string& text) {
  const auto end = text.find('\n');
  return end == std::string::npos ? text : text.substr(0, end);
}

} // namespace

std::string QueryFailure::Describe() const {
  std::string description = label + " failed after " + std::to_string(attempts) + " attempt(s)";
  if (!last_result.stderr_text.empty()) {
    description += ": " + FirstLine(last_result.stderr_text);
  } else {
    description += ": exit code " + std::to_string(last_result.exit_code);
  }
  return description;
}

ExecutionGateway::ExecutionGateway(runtime::EventLoop& loop, CommandRunnerPtr runner, const kuberoll::runtime::config::RetryConfig& retry,
                                   ErrorHandler fatal_handler)
    : loop_(loop),
      runner_(std::move(runner)),
      max_attempts_(std::max<std::uint32_t>(retry.max_attempts(), 1)),
      delay_(retry.delay_ms()),
      fatal_handler_(std::move(fatal_handler)) {
}

void ExecutionGateway::Run(std::string label, Command command, SuccessHandler on_success, ErrorHandler on_error) {
  RunOperation(
      std::move(label), [command = std::move(command)](CommandRunner& runner) { return runner.Run(command); }, std::move(on_success),
      std::move(on_error));
}

void ExecutionGateway::RunOperation(std::string label, Operation operation, SuccessHandler on_success, ErrorHandler on_error) {
  auto request        = std::make_shared<Request>();
  request->label      = std::move(label);
  request->operation  = std::move(operation);
  request->on_success = std::move(on_success);
  request->on_error   = std::move(on_error);

  loop_.Post([this, request] { Attempt(request); });
}

void ExecutionGateway::Attempt(std::shared_ptr<Request> request) {
  ++request->attempts;

  CommandResult result;
  {
    observability::SpanScope span("kuberoll.exec");
    span.SetAttribute("label", request->label);
    span.SetAttribute("attempt", static_cast<std::int64_t>(request->attempts));

    result = request->operation(*runner_);
    if (result.Failed()) {
      span.RecordError(FirstLine(result.stderr_text));
    }
  }

  if (!result.Failed()) {
    request->on_success(result.stdout_text);
    return;
  }

  if (request->attempts < max_attempts_) {
    KUBEROLL_LOG_DEBUG("Command failed, retrying", {StringField("label", request->label), IntField("attempt", request->attempts),
                                                     IntField("exit_code", result.exit_code)});
    loop_.PostDelayed(delay_, [this, request] { Attempt(request); });
    return;
  }

  QueryFailure failure{request->label, request->attempts, std::move(result)};
  KUBEROLL_LOG_ERROR("Network error", {StringField("label", failure.label), IntField("attempts", failure.attempts),
                                       StringField("stderr", FirstLine(failure.last_result.stderr_text))});

  if (request->on_error) {
    request->on_error(failure);
  } else if (fatal_handler_) {
    fatal_handler_(failure);
  }
}

} // namespace kuberoll::exec
