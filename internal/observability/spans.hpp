#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace recon::runtime::config {
class RuntimeConfig;
}

namespace recon::observability {

enum class OtlpTransport {
  kGrpc,
  kHttpProtobuf,
};

struct OtlpConfig {
  std::string   service_name{"recon"};
  std::string   endpoint{};
  OtlpTransport transport{OtlpTransport::kGrpc};
  bool          insecure{true};
  std::uint32_t export_interval_ms{5000};
};

bool InitializeTracing(const recon::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const recon::runtime::config::RuntimeConfig& config);
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

  // kind: no_match | single_match | ambiguous | reversal_pair
  void RecordMatchOutcome(std::string_view kind);

  // status: imported | duplicate | quarantined
  void RecordImportLines(std::string_view status, std::uint64_t count);

  // mode: preview | apply
  void ObserveRunDurationMs(std::string_view mode, double duration_ms);

  void RecordApplyAbort();

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const recon::runtime::config::RuntimeConfig&) {
  return false;
}

inline bool InitializeMetrics(const recon::runtime::config::RuntimeConfig&) {
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

inline void Metrics::RecordMatchOutcome(std::string_view) {
}

inline void Metrics::RecordImportLines(std::string_view, std::uint64_t) {
}

inline void Metrics::ObserveRunDurationMs(std::string_view, double) {
}

inline void Metrics::RecordApplyAbort() {
}
#endif

} // namespace recon::observability
