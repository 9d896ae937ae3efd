#pragma once

#include <cstdint>
#include <memory>
#include <string>

#if BERTH_ENABLE_OTEL
#include <opentelemetry/nostd/shared_ptr.h>
#include <opentelemetry/sdk/trace/tracer_provider.h>
#include <opentelemetry/trace/tracer.h>
#endif

struct TraceConfig {
    bool enabled = false;
    std::string endpoint;
    std::string serviceName = "berth";
};

struct SpanHandle {
    std::string traceparent;
    bool valid = false;
#if BERTH_ENABLE_OTEL
    opentelemetry::nostd::shared_ptr<opentelemetry::trace::Span> span;
#endif
};

// Process-wide tracer. Spans are no-ops unless built with BERTH_ENABLE_OTEL
// and configured with enabled=true.
class Tracer {
public:
    static Tracer& Instance();

    void Configure(const TraceConfig& config);
    bool Enabled() const;

    SpanHandle StartSpan(const std::string& name);
    void SetAttribute(SpanHandle& handle, const std::string& key, const std::string& value);
    void SetAttribute(SpanHandle& handle, const std::string& key, int64_t value);
    void EndSpan(SpanHandle& handle, bool success);
    void Shutdown();

private:
    Tracer() = default;

    bool enabled_ = false;
#if BERTH_ENABLE_OTEL
    std::shared_ptr<opentelemetry::sdk::trace::TracerProvider> provider_;
    opentelemetry::nostd::shared_ptr<opentelemetry::trace::Tracer> tracer_;
#endif
};
