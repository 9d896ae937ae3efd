#include "HealthMonitor.hpp"

#include "Tracing.hpp"

#include <cpr/cpr.h>

#include <algorithm>
#include <iostream>
#include <utility>

namespace {
constexpr auto kConnectTimeout = std::chrono::seconds(3);
} // namespace

HealthMonitor::HealthMonitor(std::string healthUrl, Clock clock, ProbeFn probe)
    : healthUrl_(std::move(healthUrl)),
      clock_(std::move(clock)),
      probe_(std::move(probe)) {
    if (!probe_) {
        const std::string url = healthUrl_;
        probe_ = [url] { return Probe(url); };
    }
}

HealthCheckResult HealthMonitor::CheckOnce(int attempt) const {
    return Attempt(probe_, attempt);
}

HealthCheckResult HealthMonitor::WaitHealthy(const RetryPolicy& policy) const {
    return WaitHealthy(probe_, policy);
}

HealthCheckResult HealthMonitor::WaitHealthy(const ProbeFn& probe, const RetryPolicy& policy) const {
    const int maxRetries = std::max(1, policy.maxRetries);

    std::cout << "[Health] Waiting " << std::chrono::duration_cast<std::chrono::seconds>(policy.settleDelay).count()
              << "s for the service to settle..." << std::endl;
    clock_.SleepFor(policy.settleDelay);

    HealthCheckResult result;
    for (int attempt = 1; attempt <= maxRetries; ++attempt) {
        result = Attempt(probe, attempt);
        if (result.success) {
            std::cout << "[Health] Service healthy after " << attempt << " attempt(s)." << std::endl;
            return result;
        }

        std::cerr << "[Health] Health check failed (" << attempt << "/" << maxRetries << ")." << std::endl;
        if (attempt < maxRetries) {
            clock_.SleepFor(policy.interval);
        }
    }

    return result;
}

ProbeResult HealthMonitor::Probe(const std::string& url, std::chrono::milliseconds timeout) {
    ProbeResult result;
    if (url.empty()) {
        return result;
    }

    auto span = Tracer::Instance().StartSpan("berth.health.probe");
    Tracer::Instance().SetAttribute(span, "http.method", "GET");
    Tracer::Instance().SetAttribute(span, "http.url", url);

    cpr::Response response = cpr::Get(
        cpr::Url{url},
        cpr::Header{{"traceparent", span.traceparent}},
        cpr::ConnectTimeout{std::min<std::chrono::milliseconds>(kConnectTimeout, timeout)},
        cpr::Timeout{timeout});

    const bool requestOk = response.error.code == cpr::ErrorCode::OK;
    result.statusCode = static_cast<int>(response.status_code);
    result.success = requestOk && response.status_code == 200;
    result.latency = std::chrono::milliseconds(static_cast<long long>(response.elapsed * 1000.0));

    Tracer::Instance().SetAttribute(span, "http.status_code", static_cast<int64_t>(response.status_code));
    Tracer::Instance().EndSpan(span, result.success);
    return result;
}

HealthCheckResult HealthMonitor::Attempt(const ProbeFn& probe, int attempt) const {
    HealthCheckResult result;
    result.attempt = attempt;
    result.timestamp = clock_.Now();

    if (probe) {
        const ProbeResult outcome = probe();
        result.success = outcome.success;
        result.latency = outcome.latency;
    }
    return result;
}
