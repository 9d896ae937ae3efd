#include "ResourceGate.hpp"

#include <algorithm>
#include <iostream>
#include <utility>
#include <vector>

#ifndef _WIN32
#include <grp.h>
#include <unistd.h>
#endif

namespace {
constexpr std::uint64_t kMiB = 1024ULL * 1024;

std::uint64_t ToMiB(std::uint64_t bytes) {
    return bytes / kMiB;
}
} // namespace

bool GateResult::HasWarning(GateWarning warning) const {
    return std::find(warnings.begin(), warnings.end(), warning) != warnings.end();
}

ResourceGate::ResourceGate(SnapshotSource source, GroupCheck inRuntimeGroup)
    : source_(std::move(source)),
      inRuntimeGroup_(std::move(inRuntimeGroup)) {}

GateResult ResourceGate::Check(
    std::uint64_t minTotalMemoryBytes,
    std::uint64_t minAvailableMemoryBytes,
    unsigned int minCpuCores) const {
    GateResult result;
    result.snapshot = source_ ? source_() : SysMonitor().Collect();
    const ResourceSnapshot& snapshot = result.snapshot;

    std::cout << "[Gate] CPU cores: " << snapshot.cpuCores
              << ", total memory: " << ToMiB(snapshot.totalMemoryBytes) << "MB"
              << ", available memory: " << ToMiB(snapshot.availableMemoryBytes) << "MB" << std::endl;

    if (snapshot.cpuCores < minCpuCores) {
        std::cerr << "[WARN] Fewer than " << minCpuCores << " CPU cores; performance may suffer." << std::endl;
        result.warnings.push_back(GateWarning::InsufficientCPU);
    }

    if (snapshot.totalMemoryBytes < minTotalMemoryBytes) {
        std::cerr << "[Gate] Total memory below " << ToMiB(minTotalMemoryBytes)
                  << "MB; the service cannot run safely." << std::endl;
        result.status = GateStatus::InsufficientMemory;
        return result;
    }

    if (snapshot.availableMemoryBytes < minAvailableMemoryBytes) {
        std::cerr << "[WARN] Less than " << ToMiB(minAvailableMemoryBytes)
                  << "MB available; free memory or add swap." << std::endl;
        result.warnings.push_back(GateWarning::LowAvailableMemory);
    }

    if (inRuntimeGroup_ && !inRuntimeGroup_()) {
        std::cerr << "[WARN] Current user is not in the docker group; run: sudo usermod -aG docker $USER" << std::endl;
        result.warnings.push_back(GateWarning::NotInRuntimeGroup);
    }

    std::cout << "[Gate] Resource check complete." << std::endl;
    return result;
}

GateResult ResourceGate::Check(const GateThresholds& thresholds) const {
    return Check(thresholds.minTotalMemoryBytes, thresholds.minAvailableMemoryBytes, thresholds.minCpuCores);
}

bool ResourceGate::CurrentUserInGroup(const std::string& group) {
#ifdef _WIN32
    (void)group;
    return true;
#else
    if (geteuid() == 0) {
        return true;
    }

    const struct group* entry = getgrnam(group.c_str());
    if (entry == nullptr) {
        return false;
    }

    if (getegid() == entry->gr_gid) {
        return true;
    }

    const int count = getgroups(0, nullptr);
    if (count <= 0) {
        return false;
    }

    std::vector<gid_t> groups(static_cast<size_t>(count));
    if (getgroups(count, groups.data()) < 0) {
        return false;
    }
    return std::find(groups.begin(), groups.end(), entry->gr_gid) != groups.end();
#endif
}

const char* ToString(GateWarning warning) {
    switch (warning) {
    case GateWarning::LowAvailableMemory:
        return "LowAvailableMemory";
    case GateWarning::InsufficientCPU:
        return "InsufficientCPU";
    case GateWarning::NotInRuntimeGroup:
        return "NotInRuntimeGroup";
    }
    return "Unknown";
}
