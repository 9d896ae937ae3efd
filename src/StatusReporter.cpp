#include "StatusReporter.hpp"

#include "DeploymentConfig.hpp"

#include <algorithm>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <utility>

namespace {
std::string FormatBytes(std::uint64_t bytes) {
    std::ostringstream output;
    output << std::fixed << std::setprecision(1);
    const double gib = static_cast<double>(bytes) / (1024.0 * 1024.0 * 1024.0);
    if (gib >= 1.0) {
        output << gib << "G";
    } else {
        output << static_cast<double>(bytes) / (1024.0 * 1024.0) << "M";
    }
    return output.str();
}

std::string FormatTime(Clock::TimePoint time) {
    const auto timeT = std::chrono::system_clock::to_time_t(time);
    std::tm localTime = {};
#ifdef _WIN32
    localtime_s(&localTime, &timeT);
#else
    localtime_r(&timeT, &localTime);
#endif
    std::ostringstream output;
    output << std::put_time(&localTime, "%Y-%m-%d %H:%M:%S");
    return output.str();
}
} // namespace

StatusReporter::StatusReporter(
    ContainerRuntime& runtime,
    const HealthMonitor& health,
    std::string containerName,
    Clock clock,
    SnapshotSource resources)
    : runtime_(runtime),
      health_(health),
      containerName_(std::move(containerName)),
      clock_(std::move(clock)),
      resources_(std::move(resources)) {}

StatusSnapshot StatusReporter::Sample() const {
    StatusSnapshot snapshot;
    snapshot.timestamp = clock_.Now();
    snapshot.resources = resources_ ? resources_() : SysMonitor().Collect();
    snapshot.container = runtime_.QueryStatus(containerName_);
    snapshot.health = health_.CheckOnce();
    return snapshot;
}

size_t StatusReporter::Stream(
    const Sink& sink,
    const std::atomic<bool>& cancelled,
    std::chrono::milliseconds interval) const {
    size_t delivered = 0;
    while (!cancelled.load()) {
        const StatusSnapshot snapshot = Sample();
        if (cancelled.load()) {
            break;
        }

        ++delivered;
        if (!sink || !sink(snapshot)) {
            break;
        }

        SleepUnlessCancelled(interval, cancelled);
    }
    return delivered;
}

HealthReport StatusReporter::Evaluate(const StatusSnapshot& snapshot) {
    HealthReport report;
    report.apiHealthy = snapshot.health.success;
    report.containerRunning = snapshot.container.running;

    const double memoryPercent = snapshot.resources.MemoryUsagePercent();
    if (memoryPercent > kMemoryWarnPercent) {
        std::ostringstream warning;
        warning << "memory usage high: " << std::fixed << std::setprecision(0) << memoryPercent << "%";
        report.warnings.push_back(warning.str());
        report.systemHealthy = false;
    }

    if (!snapshot.resources.loadAverage1m) {
        report.warnings.push_back("CPU load average unknown");
    } else if (*snapshot.resources.loadAverage1m > kLoadWarnThreshold) {
        report.warnings.push_back("CPU load high: " + FormatDecimal(*snapshot.resources.loadAverage1m));
        report.systemHealthy = false;
    }

    return report;
}

std::string StatusReporter::Format(const StatusSnapshot& snapshot) {
    const ResourceSnapshot& resources = snapshot.resources;
    const std::uint64_t usedMemory = resources.totalMemoryBytes > resources.availableMemoryBytes
        ? resources.totalMemoryBytes - resources.availableMemoryBytes
        : 0;

    std::ostringstream output;
    output << "Time: " << FormatTime(snapshot.timestamp) << "\n";
    output << "System resources:\n";
    output << "  CPU load: "
           << (resources.loadAverage1m ? FormatDecimal(*resources.loadAverage1m) : std::string("unknown"))
           << " (" << resources.cpuCores << " cores)\n";
    output << std::fixed << std::setprecision(1);
    output << "  Memory: " << FormatBytes(usedMemory) << "/" << FormatBytes(resources.totalMemoryBytes)
           << " (" << resources.MemoryUsagePercent() << "%)\n";
    output << "  Disk: " << FormatBytes(resources.diskUsedBytes) << "/" << FormatBytes(resources.diskTotalBytes)
           << " (" << resources.DiskUsagePercent() << "%)\n";

    output << "Container:\n";
    const ContainerStatus& container = snapshot.container;
    if (!container.found) {
        output << "  not found\n";
    } else {
        output << "  " << (container.running ? "running" : "stopped");
        if (!container.status.empty()) {
            output << " (" << container.status << ")";
        }
        if (container.cpuPercent) {
            output << " cpu " << *container.cpuPercent << "%";
        }
        if (!container.memoryUsage.empty()) {
            output << " mem " << container.memoryUsage;
        }
        output << "\n";
    }

    output << "API:\n";
    if (snapshot.health.success) {
        output << "  healthy (response time " << std::setprecision(3)
               << static_cast<double>(snapshot.health.latency.count()) / 1000.0 << "s)\n";
    } else {
        output << "  unavailable\n";
    }
    return output.str();
}

void StatusReporter::SleepUnlessCancelled(
    std::chrono::milliseconds interval,
    const std::atomic<bool>& cancelled) const {
    auto remaining = interval;
    while (remaining.count() > 0 && !cancelled.load()) {
        const auto step = std::min(remaining, kCancelSlice);
        clock_.SleepFor(step);
        remaining -= step;
    }
}
