#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace edgestore::runtime::config {
class RuntimeConfig;
}

namespace edgestore::observability {

enum class OtlpTransport {
  kGrpc,
  kHttpProtobuf,
};

struct OtlpConfig {
  std::string   service_name{"edge-store"};
  std::string   endpoint{};
  OtlpTransport transport{OtlpTransport::kGrpc};
  bool          insecure{true};
  bool          simple_span_processor{false};
  std::uint32_t metrics_interval_ms{1000};
};

bool InitializeTracing(const OtlpConfig& config = {});
bool InitializeMetrics(const OtlpConfig& config = {});
bool InitializeTracing(const edgestore::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const edgestore::runtime::config::RuntimeConfig& config);
void ShutdownTracing();
void ShutdownMetrics();

/*
  RAII span. Without ENABLE_OTEL every member is an inline no-op.
*/
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
  void AddEvent(std::string_view name);
  void RecordException(std::string_view description);

 private:
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

class Metrics {
 public:
  static Metrics& Instance();

  void RecordRequest(std::string_view operation, bool success);
  void ObserveRequestLatencyMs(std::string_view operation, double latency_ms);

  void AddMirroredRows(std::string_view dataset_id, std::uint64_t rows);
  void AddViewRows(std::string_view dataset_id, std::uint64_t rows);
  void RecordStaleWrite();

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const OtlpConfig&) {
  return false;
}

inline bool InitializeMetrics(const OtlpConfig&) {
  return false;
}

inline bool InitializeTracing(const edgestore::runtime::config::RuntimeConfig&) {
  return false;
}

inline bool InitializeMetrics(const edgestore::runtime::config::RuntimeConfig&) {
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

inline void SpanScope::AddEvent(std::string_view) {
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

inline void Metrics::AddMirroredRows(std::string_view, std::uint64_t) {
}

inline void Metrics::AddViewRows(std::string_view, std::uint64_t) {
}

inline void Metrics::RecordStaleWrite() {
}
#endif

} // namespace edgestore::observability
