#include "SysMonitor.hpp"

#include "DeploymentConfig.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <system_error>
#include <thread>
#include <utility>

#ifndef _WIN32
#include <unistd.h>
#endif

namespace {
bool ReadMemInfo(const std::string& path, std::uint64_t& totalKb, std::uint64_t& availableKb) {
    std::ifstream memFile(path);
    if (!memFile.is_open()) {
        return false;
    }

    std::string line;
    while (std::getline(memFile, line)) {
        std::istringstream iss(line);
        std::string key;
        std::uint64_t value = 0;
        if (!(iss >> key >> value)) {
            continue;
        }

        if (key == "MemTotal:") {
            totalKb = value;
        } else if (key == "MemAvailable:") {
            availableKb = value;
        }

        if (totalKb > 0 && availableKb > 0) {
            return true;
        }
    }

    return totalKb > 0;
}

unsigned int DetectCpuCores() {
#ifndef _WIN32
    const long online = sysconf(_SC_NPROCESSORS_ONLN);
    if (online > 0) {
        return static_cast<unsigned int>(online);
    }
#endif
    return std::thread::hardware_concurrency();
}
} // namespace

double ResourceSnapshot::MemoryUsagePercent() const {
    if (totalMemoryBytes == 0) {
        return 0.0;
    }
    const std::uint64_t used = totalMemoryBytes > availableMemoryBytes ? totalMemoryBytes - availableMemoryBytes : 0;
    return static_cast<double>(used) * 100.0 / static_cast<double>(totalMemoryBytes);
}

double ResourceSnapshot::DiskUsagePercent() const {
    if (diskTotalBytes == 0) {
        return 0.0;
    }
    return static_cast<double>(diskUsedBytes) * 100.0 / static_cast<double>(diskTotalBytes);
}

SysMonitor::SysMonitor(std::string procRoot, std::string diskPath)
    : procRoot_(std::move(procRoot)),
      diskPath_(std::move(diskPath)) {}

ResourceSnapshot SysMonitor::Collect() const {
    ResourceSnapshot snapshot;

    std::uint64_t totalKb = 0;
    std::uint64_t availableKb = 0;
    if (ReadMemInfo(procRoot_ + "/meminfo", totalKb, availableKb)) {
        snapshot.totalMemoryBytes = totalKb * 1024;
        snapshot.availableMemoryBytes = availableKb * 1024;
    }

    snapshot.cpuCores = DetectCpuCores();

    std::ifstream loadFile(procRoot_ + "/loadavg");
    if (loadFile.is_open()) {
        std::string contents;
        std::getline(loadFile, contents);
        snapshot.loadAverage1m = ParseLoadAverage(contents);
    }

    std::error_code error;
    const auto space = std::filesystem::space(diskPath_, error);
    if (!error) {
        snapshot.diskTotalBytes = space.capacity;
        snapshot.diskUsedBytes = space.capacity > space.free ? space.capacity - space.free : 0;
    }

    return snapshot;
}

std::optional<double> SysMonitor::ParseLoadAverage(const std::string& contents) {
    std::istringstream iss(contents);
    std::string first;
    if (!(iss >> first)) {
        return std::nullopt;
    }

    // /proc/loadavg always uses '.', so parse in the classic locale.
    const auto parsed = ParseDecimal(first);
    if (!parsed || *parsed < 0.0) {
        return std::nullopt;
    }
    return parsed;
}
