#include "DockerRuntime.hpp"

#include "DeploymentConfig.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <system_error>
#include <utility>

namespace {
std::string FirstLine(const std::string& text) {
    const auto end = text.find('\n');
    return end == std::string::npos ? text : text.substr(0, end);
}

bool WriteDocument(const std::string& path, const std::string& document, std::string& error) {
    const std::filesystem::path output(path);
    if (!output.parent_path().empty()) {
        std::error_code ec;
        std::filesystem::create_directories(output.parent_path(), ec);
        if (ec) {
            error = ec.message();
            return false;
        }
    }

    std::ofstream file(output, std::ios::binary | std::ios::trunc);
    if (!file) {
        error = "unable to write " + path;
        return false;
    }

    file.write(document.data(), static_cast<std::streamsize>(document.size()));
    if (!file.good()) {
        error = "short write to " + path;
        return false;
    }
    return true;
}
} // namespace

const char* ToString(StopOutcome outcome) {
    switch (outcome) {
    case StopOutcome::Stopped:
        return "stopped";
    case StopOutcome::AlreadyStopped:
        return "already stopped";
    case StopOutcome::Failed:
        return "failed";
    }
    return "unknown";
}

DockerRuntime::DockerRuntime(CommandRunner runner, std::string composeCommand)
    : runner_(std::move(runner)),
      composeCommand_(std::move(composeCommand)) {}

ImageBuildResult DockerRuntime::BuildImage(const BuildRequest& request) {
    ImageBuildResult result;
    result.artifact.reference = request.imageReference;

    const CommandResult build = Run(BuildImageCommand(request));
    result.exitCode = build.exitCode;
    if (!build.Ok()) {
        result.error = "docker build exited with code " + std::to_string(build.exitCode);
        return result;
    }

    const CommandResult inspect = Run(InspectImageCommand(request.imageReference));
    if (inspect.Ok()) {
        std::istringstream fields(FirstLine(inspect.output));
        std::uint64_t size = 0;
        fields >> result.artifact.imageId >> size;
        result.artifact.sizeBytes = size;
    } else {
        std::cerr << "[Runtime] Unable to inspect " << request.imageReference << std::endl;
    }

    result.ok = true;
    return result;
}

ApplyResult DockerRuntime::ApplyDescriptor(const Descriptor& descriptor) {
    ApplyResult result;
    result.handle.containerName = descriptor.containerName;
    result.handle.serviceName = descriptor.serviceName;
    result.handle.descriptorPath = descriptor.path;

    if (descriptor.path.empty() || descriptor.document.empty()) {
        result.error = "empty deployment descriptor";
        return result;
    }

    std::string error;
    if (!WriteDocument(descriptor.path, descriptor.document, error)) {
        result.error = error;
        return result;
    }

    const CommandResult up = Run(ComposeUpCommand(descriptor.path));
    if (!up.Ok()) {
        result.error = composeCommand_ + " up exited with code " + std::to_string(up.exitCode);
        return result;
    }

    result.ok = true;
    return result;
}

StopOutcome DockerRuntime::Stop(const RuntimeHandle& handle) {
    const ContainerStatus before = QueryStatus(handle.containerName);

    std::error_code ec;
    const bool haveDescriptor = !handle.descriptorPath.empty()
        && std::filesystem::exists(handle.descriptorPath, ec);

    CommandResult teardown{0, {}};
    if (haveDescriptor) {
        teardown = Run(ComposeDownCommand(handle.descriptorPath));
    } else if (before.found) {
        teardown = Run(RemoveContainerCommand(handle.containerName));
    }

    // Orphans left behind by earlier runs; failures here never matter.
    Run("docker container prune -f > /dev/null 2>&1");

    if (!before.found) {
        return StopOutcome::AlreadyStopped;
    }
    return teardown.Ok() ? StopOutcome::Stopped : StopOutcome::Failed;
}

ContainerStatus DockerRuntime::QueryStatus(const std::string& containerName) {
    ContainerStatus status;
    if (containerName.empty()) {
        return status;
    }

    const CommandResult list = Run(ListContainerCommand(containerName));
    const std::string line = FirstLine(list.output);
    if (!list.Ok() || line.empty()) {
        return status;
    }

    std::istringstream fields(line);
    std::string name;
    std::string state;
    std::getline(fields, name, '\t');
    std::getline(fields, state, '\t');
    std::getline(fields, status.status);
    status.found = !name.empty();
    status.running = state == "running";

    if (!status.running) {
        return status;
    }

    const CommandResult stats = Run(StatsCommand(containerName));
    if (!stats.Ok()) {
        return status;
    }

    const auto json = nlohmann::json::parse(FirstLine(stats.output), nullptr, false);
    if (json.is_discarded() || !json.is_object()) {
        return status;
    }

    status.cpuPercent = ParsePercent(json.value("CPUPerc", ""));
    status.memoryPercent = ParsePercent(json.value("MemPerc", ""));
    status.memoryUsage = json.value("MemUsage", "");
    return status;
}

bool DockerRuntime::Logs(const RuntimeHandle& handle, const std::string& service, int tail, bool follow) {
    const std::string command = LogsCommand(handle, service, tail, follow);
    if (runner_) {
        const CommandResult result = runner_(command);
        std::cout << result.output;
        return result.Ok();
    }

    return RunInteractiveCommand(command) == 0;
}

void DockerRuntime::PruneResources() {
    Run("docker system prune -f > /dev/null 2>&1");
    Run("docker network prune -f > /dev/null 2>&1");
    Run("docker volume prune -f > /dev/null 2>&1");
}

std::string DockerRuntime::BuildImageCommand(const BuildRequest& request) {
    if (request.imageReference.empty()) {
        return {};
    }

    std::ostringstream command;
    command << "docker build";
    for (const auto& arg : request.buildArgs) {
        command << " --build-arg " << ShellQuote(arg.first + "=" + arg.second);
    }
    command << " -t " << ShellQuote(request.imageReference);
    if (request.caps.memoryBytes > 0) {
        command << " --memory=" << FormatMemorySize(request.caps.memoryBytes);
    }
    if (request.caps.cpus > 0.0) {
        command << " --cpus=" << FormatDecimal(request.caps.cpus);
    }
    if (!request.buildDescriptorPath.empty()) {
        command << " -f " << ShellQuote(request.buildDescriptorPath);
    }
    command << " " << ShellQuote(request.contextDir.empty() ? "." : request.contextDir);
    return command.str();
}

std::string DockerRuntime::InspectImageCommand(const std::string& imageReference) {
    return "docker image inspect --format '{{.Id}} {{.Size}}' " + ShellQuote(imageReference);
}

std::string DockerRuntime::ListContainerCommand(const std::string& containerName) {
    return "docker ps -a --filter " + ShellQuote("name=^" + containerName + "$")
        + " --format '{{.Names}}\t{{.State}}\t{{.Status}}'";
}

std::string DockerRuntime::StatsCommand(const std::string& containerName) {
    return "docker stats --no-stream --format '{{json .}}' " + ShellQuote(containerName);
}

std::string DockerRuntime::RemoveContainerCommand(const std::string& containerName) {
    return "docker rm -f " + ShellQuote(containerName);
}

std::string DockerRuntime::ComposeUpCommand(const std::string& descriptorPath) const {
    return composeCommand_ + " -f " + ShellQuote(descriptorPath) + " up -d";
}

std::string DockerRuntime::ComposeDownCommand(const std::string& descriptorPath) const {
    return composeCommand_ + " -f " + ShellQuote(descriptorPath) + " down";
}

std::string DockerRuntime::LogsCommand(
    const RuntimeHandle& handle,
    const std::string& service,
    int tail,
    bool follow) const {
    std::ostringstream command;
    std::error_code ec;
    if (!handle.descriptorPath.empty() && std::filesystem::exists(handle.descriptorPath, ec)) {
        command << composeCommand_ << " -f " << ShellQuote(handle.descriptorPath) << " logs";
        if (follow) {
            command << " -f";
        }
        command << " --tail=" << tail;
        const std::string target = service.empty() ? handle.serviceName : service;
        if (!target.empty()) {
            command << " " << ShellQuote(target);
        }
        return command.str();
    }

    command << "docker logs";
    if (follow) {
        command << " -f";
    }
    command << " --tail=" << tail << " " << ShellQuote(service.empty() ? handle.containerName : service);
    return command.str();
}

std::optional<double> DockerRuntime::ParsePercent(const std::string& value) {
    std::string trimmed = value;
    while (!trimmed.empty() && (trimmed.back() == '%' || trimmed.back() == ' ')) {
        trimmed.pop_back();
    }
    return ParseDecimal(trimmed);
}

CommandResult DockerRuntime::Run(const std::string& command) const {
    if (command.empty()) {
        return {};
    }

    if (runner_) {
        return runner_(command);
    }

    return RunShellCommand(command);
}
