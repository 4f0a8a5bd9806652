#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_options.h>
#include <opentelemetry/sdk/resource/resource.h>
#include <opentelemetry/sdk/trace/batch_span_processor_factory.h>
#include <opentelemetry/sdk/trace/batch_span_processor_options.h>
#include <opentelemetry/sdk/trace/tracer_provider_factory.h>
#include <opentelemetry/trace/provider.h>

#include <cstdlib>
#include <utility>

#include "config/config.pb.h"

namespace arena::observability {
namespace otlp      = opentelemetry::exporter::otlp;
namespace trace_api = opentelemetry::trace;
namespace sdktrace  = opentelemetry::sdk::trace;
namespace resource  = opentelemetry::sdk::resource;

namespace {
constexpr const char* kInstrumentationName    = "bid-arena";
constexpr const char* kInstrumentationVersion = "0.1.0";

std::shared_ptr<sdktrace::TracerProvider>           g_sdk_provider;
opentelemetry::nostd::shared_ptr<trace_api::Tracer> g_tracer;

std::string ResolveEndpoint(const OtlpConfig& config) {
  if (!config.endpoint.empty()) {
    return config.endpoint;
  }

  if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_TRACES_ENDPOINT")) {
    return endpoint;
  }
  if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_ENDPOINT")) {
    return endpoint;
  }

  return config.transport == OtlpTransport::kHttpProtobuf ? "http://localhost:4318/v1/traces" : "localhost:4317";
}

std::unique_ptr<sdktrace::SpanExporter> MakeExporter(const OtlpConfig& config) {
  auto endpoint = ResolveEndpoint(config);
  if (config.transport == OtlpTransport::kHttpProtobuf) {
    otlp::OtlpHttpExporterOptions options;
    options.url = endpoint;
    return otlp::OtlpHttpExporterFactory::Create(options);
  }
  otlp::OtlpGrpcExporterOptions options;
  options.endpoint            = endpoint;
  options.use_ssl_credentials = !config.insecure;
  return otlp::OtlpGrpcExporterFactory::Create(options);
}

} // namespace

bool InitializeTracing(const arena::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();
  if (!observability.tracing_enabled()) {
    ShutdownTracing();
    return false;
  }

  OtlpConfig otlp_config;
  otlp_config.endpoint = observability.otlp_endpoint();
  otlp_config.transport =
      observability.transport() == arena::runtime::config::OTLP_TRANSPORT_HTTP ? OtlpTransport::kHttpProtobuf : OtlpTransport::kGrpc;

  auto span_processor = sdktrace::BatchSpanProcessorFactory::Create(MakeExporter(otlp_config), sdktrace::BatchSpanProcessorOptions{});
  resource::ResourceAttributes attrs = {{"service.name", otlp_config.service_name}};
  auto provider = sdktrace::TracerProviderFactory::Create(std::move(span_processor), resource::Resource::Create(attrs));

  g_sdk_provider = std::shared_ptr<sdktrace::TracerProvider>(std::move(provider));
  trace_api::Provider::SetTracerProvider(opentelemetry::nostd::shared_ptr<trace_api::TracerProvider>(g_sdk_provider));
  g_tracer = g_sdk_provider->GetTracer(kInstrumentationName, kInstrumentationVersion);
  return static_cast<bool>(g_tracer);
}

void ShutdownTracing() {
  if (g_sdk_provider) {
    g_sdk_provider->ForceFlush();
    g_sdk_provider->Shutdown();
  }
  g_sdk_provider.reset();
  g_tracer = nullptr;
}

struct SpanScope::Impl {
  opentelemetry::nostd::shared_ptr<trace_api::Span> span;
  std::unique_ptr<trace_api::Scope>                 scope;
};

SpanScope::SpanScope(std::string_view name) : impl_(std::make_unique<Impl>()) {
  if (!g_tracer) {
    return;
  }

  impl_->span  = g_tracer->StartSpan(std::string(name));
  impl_->scope = std::make_unique<trace_api::Scope>(g_tracer->WithActiveSpan(impl_->span));
}

SpanScope::~SpanScope() {
  if (impl_ && impl_->span) {
    impl_->span->End();
  }
}

SpanScope::SpanScope(SpanScope&&) noexcept            = default;
SpanScope& SpanScope::operator=(SpanScope&&) noexcept = default;

void SpanScope::SetAttribute(std::string_view key, std::string_view value) {
  if (impl_ && impl_->span) {
    impl_->span->SetAttribute(std::string(key), std::string(value));
  }
}

void SpanScope::SetAttribute(std::string_view key, std::int64_t value) {
  if (impl_ && impl_->span) {
    impl_->span->SetAttribute(std::string(key), value);
  }
}

void SpanScope::SetAttribute(std::string_view key, double value) {
  if (impl_ && impl_->span) {
    impl_->span->SetAttribute(std::string(key), value);
  }
}

void SpanScope::AddEvent(std::string_view name) {
  if (impl_ && impl_->span) {
    impl_->span->AddEvent(std::string(name));
  }
}

void SpanScope::RecordException(std::string_view description) {
  if (impl_ && impl_->span) {
    impl_->span->AddEvent("exception", {{"exception.message", std::string(description)}});
    impl_->span->SetStatus(trace_api::StatusCode::kError, std::string(description));
  }
}

} // namespace arena::observability

#endif
