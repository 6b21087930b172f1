#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace kuberoll::runtime::config {
class RuntimeConfig;
}

namespace kuberoll::observability {

/*
  Tracing is compiled in only with ENABLE_OTEL. Without it every call below
  is an inline no-op so callers never need their own #ifdefs.
*/
bool InitializeTracing(const kuberoll::runtime::config::RuntimeConfig& config);
void ShutdownTracing();

class SpanScope {
 public:
  explicit SpanScope(std::string_view name);
  ~SpanScope();

  SpanScope(const SpanScope&)            = delete;
  SpanScope& operator=(const SpanScope&) = delete;

  void SetAttribute(std::string_view key, std::string_view value);
  void SetAttribute(std::string_view key, std::int64_t value);
  void RecordError(std::string_view description);

 private:
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const kuberoll::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownTracing() {
}

inline SpanScope::SpanScope(std::string_view) {
}

inline SpanScope::~SpanScope() {
}

inline void SpanScope::SetAttribute(std::string_view, std::string_view) {
}

inline void SpanScope::SetAttribute(std::string_view, std::int64_t) {
}

inline void SpanScope::RecordError(std::string_view) {
}
#endif

} // namespace kuberoll::observability
