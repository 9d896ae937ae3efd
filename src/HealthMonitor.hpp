#pragma once

#include "Clock.hpp"

#include <chrono>
#include <functional>
#include <string>

struct ProbeResult {
    bool success = false;
    std::chrono::milliseconds latency{0};
    int statusCode = 0;
};

struct HealthCheckResult {
    Clock::TimePoint timestamp;
    bool success = false;
    std::chrono::milliseconds latency{0};
    int attempt = 0;
};

struct RetryPolicy {
    int maxRetries = 10;
    std::chrono::milliseconds interval = std::chrono::seconds(10);
    std::chrono::milliseconds settleDelay = std::chrono::seconds(45);
};

class HealthMonitor {
public:
    using ProbeFn = std::function<ProbeResult()>;

    static constexpr std::chrono::seconds kProbeTimeout{15};

    // An empty probe falls back to an HTTP GET of healthUrl.
    explicit HealthMonitor(std::string healthUrl, Clock clock = Clock::System(), ProbeFn probe = ProbeFn());

    // Single attempt, no retry.
    HealthCheckResult CheckOnce(int attempt = 1) const;

    // Waits settleDelay, then probes up to maxRetries times with a fixed
    // interval between failures. Returns the first success or the last failure.
    HealthCheckResult WaitHealthy(const RetryPolicy& policy = RetryPolicy()) const;
    HealthCheckResult WaitHealthy(const ProbeFn& probe, const RetryPolicy& policy) const;

    // Transport errors and non-200 responses both count as unhealthy.
    static ProbeResult Probe(const std::string& url, std::chrono::milliseconds timeout = kProbeTimeout);

    const std::string& HealthUrl() const { return healthUrl_; }

private:
    HealthCheckResult Attempt(const ProbeFn& probe, int attempt) const;

    std::string healthUrl_;
    Clock clock_;
    ProbeFn probe_;
};
