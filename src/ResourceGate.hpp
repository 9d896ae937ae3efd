#pragma once

#include "SysMonitor.hpp"

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

enum class GateStatus {
    Passed,
    InsufficientMemory
};

enum class GateWarning {
    LowAvailableMemory,
    InsufficientCPU,
    NotInRuntimeGroup
};

struct GateResult {
    GateStatus status = GateStatus::Passed;
    std::vector<GateWarning> warnings;
    ResourceSnapshot snapshot;

    bool Passed() const { return status == GateStatus::Passed; }
    bool HasWarning(GateWarning warning) const;
};

struct GateThresholds {
    std::uint64_t minTotalMemoryBytes = 1536ULL * 1024 * 1024;
    std::uint64_t minAvailableMemoryBytes = 1024ULL * 1024 * 1024;
    unsigned int minCpuCores = 2;
};

class ResourceGate {
public:
    using SnapshotSource = std::function<ResourceSnapshot()>;
    using GroupCheck = std::function<bool()>;

    explicit ResourceGate(SnapshotSource source, GroupCheck inRuntimeGroup = GroupCheck());

    GateResult Check(
        std::uint64_t minTotalMemoryBytes,
        std::uint64_t minAvailableMemoryBytes,
        unsigned int minCpuCores) const;
    GateResult Check(const GateThresholds& thresholds = {}) const;

    static bool CurrentUserInGroup(const std::string& group);

private:
    SnapshotSource source_;
    GroupCheck inRuntimeGroup_;
};

const char* ToString(GateWarning warning);
