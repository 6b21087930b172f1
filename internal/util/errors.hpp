#pragma once

#include <stdexcept>
#include <string>

namespace kuberoll::util {

/*
  Central error types.

  Synchronous lookups throw these; the orchestrator turns them into
  per-target outcomes so one bad input never stops the other targets.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AmbiguousMatch : public std::runtime_error {
 public:
  explicit AmbiguousMatch(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace kuberoll::util
