#include "ArtifactBuilder.hpp"

#include "Tracing.hpp"

#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <system_error>

namespace {
std::string HumanSize(std::uint64_t bytes) {
    const char* units[] = {"B", "KB", "MB", "GB"};
    double value = static_cast<double>(bytes);
    size_t unit = 0;
    while (value >= 1024.0 && unit + 1 < sizeof(units) / sizeof(units[0])) {
        value /= 1024.0;
        ++unit;
    }

    std::ostringstream output;
    output << std::fixed << std::setprecision(unit == 0 ? 0 : 1) << value << units[unit];
    return output.str();
}
} // namespace

ArtifactBuilder::ArtifactBuilder(ContainerRuntime& runtime)
    : runtime_(runtime) {}

BuildOutcome ArtifactBuilder::Build(const DeploymentConfig& config) {
    BuildOutcome outcome;
    outcome.artifact.reference = config.ImageReference();

    auto span = Tracer::Instance().StartSpan("berth.build");
    Tracer::Instance().SetAttribute(span, "image.reference", outcome.artifact.reference);

    std::error_code ec;
    if (!std::filesystem::is_regular_file(config.BuildDescriptorPath(), ec)) {
        outcome.error = BuildError::DescriptorMissing;
        outcome.message = "build descriptor not found: " + config.BuildDescriptorPath();
        std::cerr << "[Build] " << outcome.message << std::endl;
        Tracer::Instance().EndSpan(span, false);
        return outcome;
    }

    const BuildRequest request = MakeRequest(config);
    std::cout << "[Build] Building " << request.imageReference
              << " (memory " << FormatMemorySize(request.caps.memoryBytes)
              << ", cpus " << FormatDecimal(request.caps.cpus)
              << ", workers " << config.workerProcesses << "x" << config.workerThreads << ")" << std::endl;

    const ImageBuildResult built = runtime_.BuildImage(request);
    Tracer::Instance().SetAttribute(span, "build.exit_code", static_cast<int64_t>(built.exitCode));
    if (!built.ok) {
        outcome.error = BuildError::BuildStepFailed;
        outcome.message = built.error.empty() ? "image build failed" : built.error;
        std::cerr << "[Build] " << outcome.message << std::endl;
        Tracer::Instance().EndSpan(span, false);
        return outcome;
    }

    outcome.artifact = built.artifact;
    if (outcome.artifact.reference.empty()) {
        outcome.artifact.reference = request.imageReference;
    }
    std::cout << "[Build] Image ready: " << outcome.artifact.reference;
    if (!outcome.artifact.imageId.empty()) {
        std::cout << " id=" << outcome.artifact.imageId.substr(0, 19);
    }
    std::cout << " size=" << HumanSize(outcome.artifact.sizeBytes) << std::endl;

    Tracer::Instance().SetAttribute(span, "image.size_bytes", static_cast<int64_t>(outcome.artifact.sizeBytes));
    Tracer::Instance().EndSpan(span, true);
    return outcome;
}

BuildRequest ArtifactBuilder::MakeRequest(const DeploymentConfig& config) {
    BuildRequest request;
    request.imageReference = config.ImageReference();
    request.contextDir = config.workDir;
    request.buildDescriptorPath = config.BuildDescriptorPath();
    request.buildArgs = {
        {"WORKER_PROCESSES", std::to_string(config.workerProcesses)},
        {"WORKER_THREADS", std::to_string(config.workerThreads)},
        {"MAX_REQUESTS", std::to_string(config.maxRequests)},
    };
    request.caps.cpus = kBuildCpus;
    request.caps.memoryBytes = kBuildMemoryBytes;
    return request;
}

const char* ToString(BuildError error) {
    switch (error) {
    case BuildError::None:
        return "none";
    case BuildError::DescriptorMissing:
        return "build descriptor missing";
    case BuildError::BuildStepFailed:
        return "build step failed";
    }
    return "unknown";
}
