#pragma once

#include <cstdint>
#include <optional>
#include <string>

struct ResourceSnapshot {
    std::uint64_t totalMemoryBytes = 0;
    std::uint64_t availableMemoryBytes = 0;
    unsigned int cpuCores = 0;
    // Empty when /proc/loadavg is missing or unparsable.
    std::optional<double> loadAverage1m;
    std::uint64_t diskTotalBytes = 0;
    std::uint64_t diskUsedBytes = 0;

    double MemoryUsagePercent() const;
    double DiskUsagePercent() const;
};

class SysMonitor {
public:
    // procRoot and diskPath are overridable so tests can point at fixtures.
    explicit SysMonitor(std::string procRoot = "/proc", std::string diskPath = "/");

    // Never cached: every call re-reads the host.
    ResourceSnapshot Collect() const;

    static std::optional<double> ParseLoadAverage(const std::string& contents);

private:
    std::string procRoot_;
    std::string diskPath_;
};
