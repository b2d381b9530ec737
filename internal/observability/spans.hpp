#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace jobguard::runtime::config {
class RuntimeConfig;
}

namespace jobguard::observability {

bool InitializeTracing(const jobguard::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const jobguard::runtime::config::RuntimeConfig& config);
void ShutdownTracing();
void ShutdownMetrics();

class SpanScope {
 public:
  explicit SpanScope(std::string_view name);
  ~SpanScope();

  SpanScope(const SpanScope&)            = delete;
  SpanScope& operator=(const SpanScope&) = delete;

  SpanScope(SpanScope&&) noexcept;
  SpanScope& operator=(SpanScope&&) noexcept;

  void SetAttribute(std::string_view key, std::string_view value);
  void SetAttribute(std::string_view key, std::int64_t value);
  void SetAttribute(std::string_view key, double value);
  void RecordException(std::string_view description);

 private:
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

/*
  Process-wide instruments. Every call is a no-op until metrics are
  initialized (or when built without ENABLE_OTEL).
*/
class Metrics {
 public:
  static Metrics& Instance();

  void RecordRequest(std::string_view route, bool success);
  void ObserveRequestLatencyMs(std::string_view route, double latency_ms);

  void RecordClaimOutcome(std::string_view outcome);
  void RecordJobOutcome(std::string_view outcome);
  void ObserveCheckpointBytes(std::string_view kind, std::uint64_t bytes);
  void RecordRecovery(std::string_view status, bool success);
  void RecordStepAttempt(std::string_view result_status, double duration_ms);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const jobguard::runtime::config::RuntimeConfig&) {
  return false;
}

inline bool InitializeMetrics(const jobguard::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownTracing() {
}

inline void ShutdownMetrics() {
}

inline SpanScope::SpanScope(std::string_view) {
}

inline SpanScope::~SpanScope() {
}

inline SpanScope::SpanScope(SpanScope&&) noexcept = default;

inline SpanScope& SpanScope::operator=(SpanScope&&) noexcept = default;

inline void SpanScope::SetAttribute(std::string_view, std::string_view) {
}

inline void SpanScope::SetAttribute(std::string_view, std::int64_t) {
}

inline void SpanScope::SetAttribute(std::string_view, double) {
}

inline void SpanScope::RecordException(std::string_view) {
}

inline Metrics::Metrics() {
}

inline Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

inline void Metrics::RecordRequest(std::string_view, bool) {
}

inline void Metrics::ObserveRequestLatencyMs(std::string_view, double) {
}

inline void Metrics::RecordClaimOutcome(std::string_view) {
}

inline void Metrics::RecordJobOutcome(std::string_view) {
}

inline void Metrics::ObserveCheckpointBytes(std::string_view, std::uint64_t) {
}

inline void Metrics::RecordRecovery(std::string_view, bool) {
}

inline void Metrics::RecordStepAttempt(std::string_view, double) {
}
#endif

} // namespace jobguard::observability
