#pragma once

#include "CommandRunner.hpp"
#include "ContainerRuntime.hpp"

#include <optional>
#include <string>

class DockerRuntime : public ContainerRuntime {
public:
    explicit DockerRuntime(
        CommandRunner runner = CommandRunner(),
        std::string composeCommand = "docker-compose");

    ImageBuildResult BuildImage(const BuildRequest& request) override;
    ApplyResult ApplyDescriptor(const Descriptor& descriptor) override;
    StopOutcome Stop(const RuntimeHandle& handle) override;
    ContainerStatus QueryStatus(const std::string& containerName) override;
    bool Logs(const RuntimeHandle& handle, const std::string& service, int tail, bool follow) override;
    void PruneResources() override;

    static std::string BuildImageCommand(const BuildRequest& request);
    static std::string InspectImageCommand(const std::string& imageReference);
    static std::string ListContainerCommand(const std::string& containerName);
    static std::string StatsCommand(const std::string& containerName);
    static std::string RemoveContainerCommand(const std::string& containerName);
    std::string ComposeUpCommand(const std::string& descriptorPath) const;
    std::string ComposeDownCommand(const std::string& descriptorPath) const;
    std::string LogsCommand(const RuntimeHandle& handle, const std::string& service, int tail, bool follow) const;

    // "12.5%" -> 12.5; docker prints "--" for stopped containers.
    static std::optional<double> ParsePercent(const std::string& value);

private:
    CommandResult Run(const std::string& command) const;

    CommandRunner runner_;
    std::string composeCommand_;
};
