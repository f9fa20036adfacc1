#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/common/attribute_value.h>
#include <opentelemetry/context/context.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_options.h>
#include <opentelemetry/metrics/provider.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>

#include <chrono>
#include <cstdlib>
#include <memory>
#include <utility>
#if __has_include(<opentelemetry/sdk/metrics/periodic_exporting_metric_reader_factory.h>)
#define EDGESTORE_OTEL_METRIC_READER_FACTORY 1
#include <opentelemetry/sdk/metrics/periodic_exporting_metric_reader_factory.h>
#elif __has_include(<opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>)
#define EDGESTORE_OTEL_METRIC_READER_FACTORY 1
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#elif __has_include(<opentelemetry/sdk/metrics/periodic_exporting_metric_reader.h>)
#include <opentelemetry/sdk/metrics/periodic_exporting_metric_reader.h>
#else
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader.h>
#endif
#include <opentelemetry/sdk/resource/resource.h>

#include "config/config.pb.h"

namespace edgestore::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;
namespace resource    = opentelemetry::sdk::resource;

namespace {
using AttributePair = std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>;
std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

std::string ResolveEndpoint(const OtlpConfig& config) {
  if (!config.endpoint.empty()) {
    return config.endpoint;
  }

  if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_METRICS_ENDPOINT")) {
    return endpoint;
  }
  if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_ENDPOINT")) {
    return endpoint;
  }

  return config.transport == OtlpTransport::kHttpProtobuf ? "http://localhost:4318/v1/metrics" : "localhost:4317";
}

template <typename Provider>
void ConfigureResource(Provider& provider, const resource::Resource& res) {
  if constexpr (requires { provider.SetResource(res); }) {
    provider.SetResource(res);
  }
}

template <typename Provider>
void AddMetricReaderCompat(const std::shared_ptr<Provider>& provider, std::unique_ptr<sdkmetrics::MetricReader> reader) {
  if constexpr (requires { provider->AddMetricReader(std::move(reader)); }) {
    provider->AddMetricReader(std::move(reader));
  } else {
    provider->AddMetricReader(std::shared_ptr<sdkmetrics::MetricReader>(std::move(reader)));
  }
}

template <typename Instrument, typename Value, typename Attributes>
void AddWithAttributes(const opentelemetry::nostd::shared_ptr<Instrument>& instrument, Value value, Attributes&& attributes) {
  if constexpr (requires { instrument->Add(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{}); }) {
    instrument->Add(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{});
  } else {
    instrument->Add(value, std::forward<Attributes>(attributes));
  }
}

template <typename Instrument, typename Value, typename Attributes>
void RecordWithAttributes(const opentelemetry::nostd::shared_ptr<Instrument>& instrument, Value value, Attributes&& attributes) {
  if constexpr (requires { instrument->Record(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{}); }) {
    instrument->Record(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{});
  } else {
    instrument->Record(value, std::forward<Attributes>(attributes));
  }
}

} // namespace

struct Metrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Meter> meter;

  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> request_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      request_latency_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> mirrored_rows;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> view_rows;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> stale_writes;
};

bool InitializeMetrics(const OtlpConfig& config) {
  auto endpoint = ResolveEndpoint(config);

  std::unique_ptr<sdkmetrics::PushMetricExporter> exporter;
  if (config.transport == OtlpTransport::kHttpProtobuf) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = endpoint;
    exporter    = otlp::OtlpHttpMetricExporterFactory::Create(options);
  } else {
    otlp::OtlpGrpcMetricExporterOptions options;
    options.endpoint            = endpoint;
    options.use_ssl_credentials = !config.insecure;
    exporter                    = otlp::OtlpGrpcMetricExporterFactory::Create(options);
  }

  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  reader_options.export_interval_millis = std::chrono::milliseconds(config.metrics_interval_ms > 0 ? config.metrics_interval_ms : 1000);
#ifdef EDGESTORE_OTEL_METRIC_READER_FACTORY
  auto reader = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(std::move(exporter), reader_options);
#else
  auto reader = std::make_unique<sdkmetrics::PeriodicExportingMetricReader>(std::move(exporter), reader_options);
#endif

  resource::ResourceAttributes attrs = {{"service.name", config.service_name}};
  auto                         res   = resource::Resource::Create(attrs);
  g_provider = std::make_shared<sdkmetrics::MeterProvider>(std::unique_ptr<sdkmetrics::ViewRegistry>(new sdkmetrics::ViewRegistry()), res);
  ConfigureResource(*g_provider, res);
  AddMetricReaderCompat(g_provider, std::move(reader));

  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(g_provider));
  return true;
}

bool InitializeMetrics(const edgestore::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();
  if (!observability.metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }

  OtlpConfig otlp_config;
  otlp_config.endpoint = observability.otlp_endpoint();
  otlp_config.transport =
      observability.transport() == edgestore::runtime::config::OTLP_TRANSPORT_HTTP ? OtlpTransport::kHttpProtobuf : OtlpTransport::kGrpc;
  otlp_config.metrics_interval_ms = observability.metrics_collection_interval_ms();
  return InitializeMetrics(otlp_config);
}

void ShutdownMetrics() {
  if (g_provider) {
    g_provider->ForceFlush();
    g_provider->Shutdown();
  }
  g_provider.reset();
}

Metrics::Metrics() : impl_(std::make_unique<Impl>()) {
  auto provider = metrics_api::Provider::GetMeterProvider();
  impl_->meter  = provider->GetMeter("edge-store", "0.1.0");

  impl_->request_count      = impl_->meter->CreateUInt64Counter("edgestore.request.count", "Total number of engine operations", "1");
  impl_->request_latency_ms = impl_->meter->CreateDoubleHistogram("edgestore.request.latency_ms", "Engine operation latency in milliseconds", "ms");
  impl_->mirrored_rows      = impl_->meter->CreateUInt64Counter("edgestore.mirror.rows", "Global rows stored by PublishVersion", "1");
  impl_->view_rows          = impl_->meter->CreateUInt64Counter("edgestore.view.rows", "User view rows appended by MaterializeView", "1");
  impl_->stale_writes       = impl_->meter->CreateUInt64Counter("edgestore.userdb.stale_writes", "Upserts rejected as stale", "1");
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordRequest(std::string_view operation, bool success) {
  if (!impl_ || !impl_->request_count) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"operation", std::string(operation)}, {"success", success}};
  AddWithAttributes(impl_->request_count, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::ObserveRequestLatencyMs(std::string_view operation, double latency_ms) {
  if (!impl_ || !impl_->request_latency_ms) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"operation", std::string(operation)}};
  RecordWithAttributes(impl_->request_latency_ms, latency_ms, attributes);
}

void Metrics::AddMirroredRows(std::string_view dataset_id, std::uint64_t rows) {
  if (!impl_ || !impl_->mirrored_rows) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"dataset", std::string(dataset_id)}};
  AddWithAttributes(impl_->mirrored_rows, rows, attributes);
}

void Metrics::AddViewRows(std::string_view dataset_id, std::uint64_t rows) {
  if (!impl_ || !impl_->view_rows) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"dataset", std::string(dataset_id)}};
  AddWithAttributes(impl_->view_rows, rows, attributes);
}

void Metrics::RecordStaleWrite() {
  if (!impl_ || !impl_->stale_writes) {
    return;
  }

  AddWithAttributes(impl_->stale_writes, static_cast<std::uint64_t>(1), std::initializer_list<AttributePair>{});
}

} // namespace edgestore::observability

#endif
