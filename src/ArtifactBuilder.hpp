#pragma once

#include "ContainerRuntime.hpp"
#include "DeploymentConfig.hpp"

#include <string>

enum class BuildError {
    None,
    DescriptorMissing,
    BuildStepFailed
};

struct BuildOutcome {
    BuildError error = BuildError::None;
    ArtifactRef artifact;
    std::string message;

    bool Ok() const { return error == BuildError::None; }
};

class ArtifactBuilder {
public:
    // Ceiling applied while building, separate from the runtime ceiling.
    static constexpr double kBuildCpus = 1.5;
    static constexpr std::uint64_t kBuildMemoryBytes = 1024ULL * 1024 * 1024;

    explicit ArtifactBuilder(ContainerRuntime& runtime);

    BuildOutcome Build(const DeploymentConfig& config);

    static BuildRequest MakeRequest(const DeploymentConfig& config);

private:
    ContainerRuntime& runtime_;
};

const char* ToString(BuildError error);
