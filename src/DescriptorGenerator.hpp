#pragma once

#include "ContainerRuntime.hpp"
#include "DeploymentConfig.hpp"

#include <chrono>
#include <cstdint>
#include <string>

struct HealthCheckPolicy {
    std::chrono::seconds interval{60};
    std::chrono::seconds timeout{15};
    int retries = 3;
    std::chrono::seconds startPeriod{45};
};

// Renders the compose document for the service. Output is a pure function of
// (config, artifact): identical inputs produce byte-identical documents.
class DescriptorGenerator {
public:
    static constexpr const char* kServiceName = "app";
    static constexpr double kReservedCpus = 0.5;
    static constexpr std::uint64_t kReservedMemoryBytes = 256ULL * 1024 * 1024;
    static constexpr std::chrono::seconds kShutdownGrace{30};

    static Descriptor Render(const DeploymentConfig& config, const ArtifactRef& artifact);
    static HealthCheckPolicy DefaultHealthCheck();
};
