#include "Tracing.hpp"

#include <iomanip>
#include <iostream>
#include <random>
#include <sstream>

#if BERTH_ENABLE_OTEL
#include <opentelemetry/exporters/otlp/otlp_http_exporter.h>
#include <opentelemetry/sdk/resource/resource.h>
#include <opentelemetry/sdk/trace/batch_span_processor.h>
#include <opentelemetry/trace/provider.h>
#include <opentelemetry/trace/span_context.h>
#include <opentelemetry/trace/status_code.h>
#endif

namespace {
std::string RandomHex(size_t bytes) {
    static thread_local std::mt19937_64 rng{std::random_device{}()};
    std::uniform_int_distribution<int> dist(0, 255);

    std::ostringstream out;
    out << std::hex << std::nouppercase;
    for (size_t i = 0; i < bytes; ++i) {
        out << std::setw(2) << std::setfill('0') << dist(rng);
    }
    return out.str();
}

// W3C traceparent: version-traceid-spanid-flags.
std::string FormatTraceParent(const std::string& traceId, const std::string& spanId, bool sampled) {
    return "00-" + traceId + "-" + spanId + "-" + (sampled ? "01" : "00");
}

#if BERTH_ENABLE_OTEL
std::string TraceParentOf(const opentelemetry::trace::SpanContext& context) {
    if (!context.IsValid()) {
        return FormatTraceParent(RandomHex(16), RandomHex(8), true);
    }

    char traceId[32];
    char spanId[16];
    context.trace_id().ToLowerBase16(traceId);
    context.span_id().ToLowerBase16(spanId);
    return FormatTraceParent(
        std::string(traceId, sizeof(traceId)),
        std::string(spanId, sizeof(spanId)),
        context.trace_flags().IsSampled());
}
#endif
} // namespace

Tracer& Tracer::Instance() {
    static Tracer instance;
    return instance;
}

void Tracer::Configure(const TraceConfig& config) {
    if (!config.enabled) {
        enabled_ = false;
        return;
    }

#if BERTH_ENABLE_OTEL
    opentelemetry::exporter::otlp::OtlpHttpExporterOptions options;
    if (!config.endpoint.empty()) {
        options.url = config.endpoint;
    }

    auto exporter = std::make_unique<opentelemetry::exporter::otlp::OtlpHttpExporter>(options);
    auto processor = std::make_unique<opentelemetry::sdk::trace::BatchSpanProcessor>(
        std::move(exporter),
        opentelemetry::sdk::trace::BatchSpanProcessorOptions{});
    auto resource = opentelemetry::sdk::resource::Resource::Create({{"service.name", config.serviceName}});
    provider_ = std::make_shared<opentelemetry::sdk::trace::TracerProvider>(std::move(processor), resource);

    std::shared_ptr<opentelemetry::trace::TracerProvider> apiProvider = provider_;
    opentelemetry::trace::Provider::SetTracerProvider(apiProvider);
    tracer_ = provider_->GetTracer(config.serviceName);
    enabled_ = true;
#else
    std::cerr << "[WARN] Tracing requested but berth was built without BERTH_ENABLE_OTEL." << std::endl;
    enabled_ = false;
#endif
}

bool Tracer::Enabled() const {
    return enabled_;
}

SpanHandle Tracer::StartSpan(const std::string& name) {
    SpanHandle handle;
#if BERTH_ENABLE_OTEL
    if (enabled_ && tracer_) {
        handle.span = tracer_->StartSpan(name);
        handle.traceparent = TraceParentOf(handle.span->GetContext());
        handle.valid = true;
        return handle;
    }
#else
    (void)name;
#endif

    handle.traceparent = FormatTraceParent(RandomHex(16), RandomHex(8), false);
    handle.valid = true;
    return handle;
}

void Tracer::SetAttribute(SpanHandle& handle, const std::string& key, const std::string& value) {
#if BERTH_ENABLE_OTEL
    if (enabled_ && handle.span) {
        handle.span->SetAttribute(key, value);
    }
#else
    (void)handle;
    (void)key;
    (void)value;
#endif
}

void Tracer::SetAttribute(SpanHandle& handle, const std::string& key, int64_t value) {
#if BERTH_ENABLE_OTEL
    if (enabled_ && handle.span) {
        handle.span->SetAttribute(key, value);
    }
#else
    (void)handle;
    (void)key;
    (void)value;
#endif
}

void Tracer::EndSpan(SpanHandle& handle, bool success) {
#if BERTH_ENABLE_OTEL
    if (enabled_ && handle.span) {
        handle.span->SetStatus(
            success ? opentelemetry::trace::StatusCode::kOk : opentelemetry::trace::StatusCode::kError);
        handle.span->End();
    }
#else
    (void)success;
#endif
    handle.valid = false;
}

void Tracer::Shutdown() {
#if BERTH_ENABLE_OTEL
    if (provider_) {
        provider_->ForceFlush();
        provider_->Shutdown();
    }
#endif
    enabled_ = false;
}
