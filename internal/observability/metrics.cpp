#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/common/attribute_value.h>
#include <opentelemetry/context/context.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_options.h>
#include <opentelemetry/metrics/provider.h>
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>
#include <opentelemetry/sdk/metrics/meter_provider_factory.h>

#include <chrono>
#include <memory>
#include <utility>

#include "internal/observability/otlp_settings.hpp"

namespace jobguard::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;

namespace {
using AttributePair = std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>;
std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

std::unique_ptr<sdkmetrics::PushMetricExporter> MakeMetricExporter(const OtlpSettings& settings) {
  if (settings.http) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = settings.endpoint;
    return otlp::OtlpHttpMetricExporterFactory::Create(options);
  }
  otlp::OtlpGrpcMetricExporterOptions options;
  options.endpoint            = settings.endpoint;
  options.use_ssl_credentials = false;
  return otlp::OtlpGrpcMetricExporterFactory::Create(options);
}

} // namespace

struct Metrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Meter> meter;

  opentelemetry::nostd::unique_ptr<metrics_api::Counter<std::uint64_t>> request_count;
  opentelemetry::nostd::unique_ptr<metrics_api::Histogram<double>>      request_latency_ms;
  opentelemetry::nostd::unique_ptr<metrics_api::Counter<std::uint64_t>> claim_outcomes;
  opentelemetry::nostd::unique_ptr<metrics_api::Counter<std::uint64_t>> job_outcomes;
  opentelemetry::nostd::unique_ptr<metrics_api::Histogram<double>>      checkpoint_bytes;
  opentelemetry::nostd::unique_ptr<metrics_api::Counter<std::uint64_t>> recoveries;
  opentelemetry::nostd::unique_ptr<metrics_api::Histogram<double>>      step_duration_ms;
};

bool InitializeMetrics(const jobguard::runtime::config::RuntimeConfig& config) {
  ShutdownMetrics();
  const auto& observability = config.observability();
  if (!observability.metrics_enabled()) return false;

  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  reader_options.export_interval_millis =
      std::chrono::milliseconds(observability.metrics_export_interval_ms() > 0 ? observability.metrics_export_interval_ms() : 1000);
  auto reader = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(MakeMetricExporter(ResolveOtlp(observability, "metrics")), reader_options);

  g_provider = std::shared_ptr<sdkmetrics::MeterProvider>(
      sdkmetrics::MeterProviderFactory::Create(std::make_unique<sdkmetrics::ViewRegistry>(), ServiceResource()));
  g_provider->AddMetricReader(std::move(reader));

  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(g_provider));
  return true;
}

void ShutdownMetrics() {
  if (!g_provider) return;
  g_provider->ForceFlush();
  g_provider->Shutdown();
  g_provider.reset();
}

Metrics::Metrics() : impl_(std::make_unique<Impl>()) {
  auto provider = metrics_api::Provider::GetMeterProvider();
  impl_->meter  = provider->GetMeter(std::string(kServiceName), std::string(kServiceVersion));

  impl_->request_count      = impl_->meter->CreateUInt64Counter("jobguard.request.count", "Admin requests", "1");
  impl_->request_latency_ms = impl_->meter->CreateDoubleHistogram("jobguard.request.latency_ms", "Admin request latency", "ms");
  impl_->claim_outcomes     = impl_->meter->CreateUInt64Counter("jobguard.claim.outcomes", "Claim attempts by outcome", "1");
  impl_->job_outcomes       = impl_->meter->CreateUInt64Counter("jobguard.job.outcomes", "Submitted jobs by outcome", "1");
  impl_->checkpoint_bytes   = impl_->meter->CreateDoubleHistogram("jobguard.checkpoint.bytes", "Compressed checkpoint size", "By");
  impl_->recoveries         = impl_->meter->CreateUInt64Counter("jobguard.recovery.count", "Recovery attempts", "1");
  impl_->step_duration_ms   = impl_->meter->CreateDoubleHistogram("jobguard.step.duration_ms", "Automation step attempt duration", "ms");
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordRequest(std::string_view route, bool success) {
  const std::string route_value(route);
  const std::initializer_list<AttributePair> attributes = {{"route", route_value}, {"success", success}};
  impl_->request_count->Add(1, attributes);
}

void Metrics::ObserveRequestLatencyMs(std::string_view route, double latency_ms) {
  const std::string route_value(route);
  const std::initializer_list<AttributePair> attributes = {{"route", route_value}};
  impl_->request_latency_ms->Record(latency_ms, attributes, opentelemetry::context::Context{});
}

void Metrics::RecordClaimOutcome(std::string_view outcome) {
  const std::string outcome_value(outcome);
  const std::initializer_list<AttributePair> attributes = {{"outcome", outcome_value}};
  impl_->claim_outcomes->Add(1, attributes);
}

void Metrics::RecordJobOutcome(std::string_view outcome) {
  const std::string outcome_value(outcome);
  const std::initializer_list<AttributePair> attributes = {{"outcome", outcome_value}};
  impl_->job_outcomes->Add(1, attributes);
}

void Metrics::ObserveCheckpointBytes(std::string_view kind, std::uint64_t bytes) {
  const std::string kind_value(kind);
  const std::initializer_list<AttributePair> attributes = {{"kind", kind_value}};
  impl_->checkpoint_bytes->Record(static_cast<double>(bytes), attributes, opentelemetry::context::Context{});
}

void Metrics::RecordRecovery(std::string_view status, bool success) {
  const std::string status_value(status);
  const std::initializer_list<AttributePair> attributes = {{"status", status_value}, {"success", success}};
  impl_->recoveries->Add(1, attributes);
}

void Metrics::RecordStepAttempt(std::string_view result_status, double duration_ms) {
  const std::string result_status_value(result_status);
  const std::initializer_list<AttributePair> attributes = {{"result", result_status_value}};
  impl_->step_duration_ms->Record(duration_ms, attributes, opentelemetry::context::Context{});
}

} // namespace jobguard::observability

#endif
