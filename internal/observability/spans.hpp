#pragma once

#include <cstdint>
#include <memory>
#include <string_view>

namespace rollback::runtime::config {
class RuntimeConfig;
}

namespace rollback::observability {

// Installs an OTLP tracer when observability.tracing_enabled is set.
bool InitializeTracing(const rollback::runtime::config::RuntimeConfig& config);
void ShutdownTracing();

/*
  RAII span around one engine call (transaction, migration step).
  Compiles to nothing unless built with ENABLE_OTEL.
*/
class SpanScope {
 public:
  explicit SpanScope(std::string_view name);
  ~SpanScope();

  SpanScope(const SpanScope&)            = delete;
  SpanScope& operator=(const SpanScope&) = delete;

  void SetAttribute(std::string_view key, std::string_view value);
  void SetAttribute(std::string_view key, std::int64_t value);
  void RecordException(std::string_view description);

 private:
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const rollback::runtime::config::RuntimeConfig&) {
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

inline void SpanScope::RecordException(std::string_view) {
}
#endif

} // namespace rollback::observability
