#pragma once

#include "Clock.hpp"
#include "ContainerRuntime.hpp"
#include "HealthMonitor.hpp"
#include "SysMonitor.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <string>
#include <vector>

struct StatusSnapshot {
    Clock::TimePoint timestamp;
    ResourceSnapshot resources;
    ContainerStatus container;
    HealthCheckResult health;
};

struct HealthReport {
    bool apiHealthy = false;
    bool containerRunning = false;
    bool systemHealthy = true;
    std::vector<std::string> warnings;

    bool Passed() const { return apiHealthy && containerRunning; }
};

class StatusReporter {
public:
    using SnapshotSource = std::function<ResourceSnapshot()>;
    // Return false to stop the stream.
    using Sink = std::function<bool(const StatusSnapshot&)>;

    static constexpr double kMemoryWarnPercent = 85.0;
    static constexpr double kLoadWarnThreshold = 2.0;
    static constexpr std::chrono::milliseconds kCancelSlice{250};

    StatusReporter(
        ContainerRuntime& runtime,
        const HealthMonitor& health,
        std::string containerName,
        Clock clock = Clock::System(),
        SnapshotSource resources = SnapshotSource());

    // One tick: fresh resources, container status and a single probe.
    StatusSnapshot Sample() const;

    // Emits a snapshot every interval until the sink declines or cancelled is set.
    // Returns the number of snapshots delivered.
    size_t Stream(
        const Sink& sink,
        const std::atomic<bool>& cancelled,
        std::chrono::milliseconds interval = std::chrono::seconds(5)) const;

    static HealthReport Evaluate(const StatusSnapshot& snapshot);
    static std::string Format(const StatusSnapshot& snapshot);

private:
    void SleepUnlessCancelled(std::chrono::milliseconds interval, const std::atomic<bool>& cancelled) const;

    ContainerRuntime& runtime_;
    const HealthMonitor& health_;
    std::string containerName_;
    Clock clock_;
    SnapshotSource resources_;
};
