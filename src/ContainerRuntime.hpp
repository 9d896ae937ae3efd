#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

struct ResourceCaps {
    double cpus = 0.0;
    std::uint64_t memoryBytes = 0;
};

struct BuildRequest {
    std::string imageReference;
    std::string contextDir;
    std::string buildDescriptorPath;
    std::vector<std::pair<std::string, std::string>> buildArgs;
    ResourceCaps caps;
};

struct ArtifactRef {
    std::string reference;
    std::string imageId;
    std::uint64_t sizeBytes = 0;
};

struct ImageBuildResult {
    bool ok = false;
    int exitCode = -1;
    ArtifactRef artifact;
    std::string error;
};

struct Descriptor {
    std::string serviceName;
    std::string containerName;
    std::string path;
    std::string document;
};

struct RuntimeHandle {
    std::string containerName;
    std::string serviceName;
    std::string descriptorPath;
};

struct ApplyResult {
    bool ok = false;
    RuntimeHandle handle;
    std::string error;
};

enum class StopOutcome {
    Stopped,
    AlreadyStopped,
    Failed
};

struct ContainerStatus {
    bool found = false;
    bool running = false;
    std::string status;
    std::optional<double> cpuPercent;
    std::optional<double> memoryPercent;
    std::string memoryUsage;
};

// Container engine seam. DockerRuntime drives docker/docker-compose;
// tests substitute an in-memory fake.
class ContainerRuntime {
public:
    virtual ~ContainerRuntime() = default;

    virtual ImageBuildResult BuildImage(const BuildRequest& request) = 0;
    virtual ApplyResult ApplyDescriptor(const Descriptor& descriptor) = 0;
    virtual StopOutcome Stop(const RuntimeHandle& handle) = 0;
    virtual ContainerStatus QueryStatus(const std::string& containerName) = 0;
    virtual bool Logs(const RuntimeHandle& handle, const std::string& service, int tail, bool follow) = 0;
    // Container, network and volume reclamation. Best-effort.
    virtual void PruneResources() = 0;
};

const char* ToString(StopOutcome outcome);
