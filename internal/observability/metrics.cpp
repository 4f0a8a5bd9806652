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
#define ARENA_OTEL_METRIC_READER_FACTORY 1
#include <opentelemetry/sdk/metrics/periodic_exporting_metric_reader_factory.h>
#elif __has_include(<opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>)
#define ARENA_OTEL_METRIC_READER_FACTORY 1
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#elif __has_include(<opentelemetry/sdk/metrics/periodic_exporting_metric_reader.h>)
#include <opentelemetry/sdk/metrics/periodic_exporting_metric_reader.h>
#else
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader.h>
#endif
#include <opentelemetry/sdk/resource/resource.h>

#include "config/config.pb.h"

namespace arena::observability {
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

void CountOne(const opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>>& counter, std::string_view key, std::string_view label) {
  if (!counter) {
    return;
  }
  const std::initializer_list<AttributePair> attributes = {{key, std::string(label)}};
  AddWithAttributes(counter, static_cast<std::uint64_t>(1), attributes);
}

} // namespace

struct Metrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Meter> meter;

  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> request_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      request_latency_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> invocation_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      invocation_latency_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> auction_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> worker_restart_count;
};

bool InitializeMetrics(const arena::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();
  if (!observability.metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }

  OtlpConfig otlp_config;
  otlp_config.endpoint = observability.otlp_endpoint();
  otlp_config.transport =
      observability.transport() == arena::runtime::config::OTLP_TRANSPORT_HTTP ? OtlpTransport::kHttpProtobuf : OtlpTransport::kGrpc;
  if (observability.metrics_export_interval_ms() > 0) {
    otlp_config.export_interval_ms = observability.metrics_export_interval_ms();
  }

  auto endpoint = ResolveEndpoint(otlp_config);

  std::unique_ptr<sdkmetrics::PushMetricExporter> exporter;
  if (otlp_config.transport == OtlpTransport::kHttpProtobuf) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = endpoint;
    exporter    = otlp::OtlpHttpMetricExporterFactory::Create(options);
  } else {
    otlp::OtlpGrpcMetricExporterOptions options;
    options.endpoint            = endpoint;
    options.use_ssl_credentials = !otlp_config.insecure;
    exporter                    = otlp::OtlpGrpcMetricExporterFactory::Create(options);
  }

  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  reader_options.export_interval_millis = std::chrono::milliseconds(otlp_config.export_interval_ms);

#ifdef ARENA_OTEL_METRIC_READER_FACTORY
  auto reader = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(std::move(exporter), reader_options);
#else
  auto reader = std::make_unique<sdkmetrics::PeriodicExportingMetricReader>(std::move(exporter), reader_options);
#endif

  resource::ResourceAttributes attrs = {{"service.name", otlp_config.service_name}};
  g_provider = std::make_shared<sdkmetrics::MeterProvider>(std::unique_ptr<sdkmetrics::ViewRegistry>(new sdkmetrics::ViewRegistry()),
                                                           resource::Resource::Create(attrs));
  AddMetricReaderCompat(g_provider, std::move(reader));

  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(g_provider));
  return true;
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
  impl_->meter  = provider->GetMeter("bid-arena", "0.1.0");

  impl_->request_count      = impl_->meter->CreateUInt64Counter("arena.request.count", "1", "Total number of service requests");
  impl_->request_latency_ms = impl_->meter->CreateDoubleHistogram("arena.request.latency_ms", "ms", "End-to-end request latency in milliseconds");
  impl_->invocation_count   = impl_->meter->CreateUInt64Counter("arena.invocation.count", "1", "Strategy invocations by outcome");
  impl_->invocation_latency_ms =
      impl_->meter->CreateDoubleHistogram("arena.invocation.latency_ms", "ms", "Wall-clock latency of one strategy invocation");
  impl_->auction_count        = impl_->meter->CreateUInt64Counter("arena.auction.count", "1", "Resolved auctions by outcome");
  impl_->worker_restart_count = impl_->meter->CreateUInt64Counter("arena.sandbox.worker_restarts", "1", "Sandbox workers killed or lost");
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordRequest(std::string_view route, bool success) {
  if (!impl_ || !impl_->request_count) {
    return;
  }
  const std::initializer_list<AttributePair> attributes = {{"route", std::string(route)}, {"success", success}};
  AddWithAttributes(impl_->request_count, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::ObserveRequestLatencyMs(std::string_view route, double latency_ms) {
  if (!impl_ || !impl_->request_latency_ms) {
    return;
  }
  const std::initializer_list<AttributePair> attributes = {{"route", std::string(route)}};
  RecordWithAttributes(impl_->request_latency_ms, latency_ms, attributes);
}

void Metrics::RecordInvocation(std::string_view outcome) {
  if (impl_) {
    CountOne(impl_->invocation_count, "outcome", outcome);
  }
}

void Metrics::ObserveInvocationLatencyMs(double latency_ms) {
  if (!impl_ || !impl_->invocation_latency_ms) {
    return;
  }
  RecordWithAttributes(impl_->invocation_latency_ms, latency_ms, std::initializer_list<AttributePair>{});
}

void Metrics::RecordAuction(std::string_view outcome) {
  if (impl_) {
    CountOne(impl_->auction_count, "outcome", outcome);
  }
}

void Metrics::RecordWorkerRestart(std::string_view reason) {
  if (impl_) {
    CountOne(impl_->worker_restart_count, "reason", reason);
  }
}

} // namespace arena::observability

#endif
