#include "ArtifactBuilder.hpp"
#include "TestSupport.hpp"

#include <string>

namespace {
DeploymentConfig ConfigIn(const TempDir& dir) {
    DeploymentConfig config;
    config.workDir = dir.Path().string();
    config.registry = "registry.local:5000";
    config.version = "1.2.0";
    config.workerProcesses = 2;
    config.workerThreads = 4;
    config.maxRequests = 500;
    return config;
}

int MissingDockerfileNeverInvokesBuild() {
    TempDir dir;
    FakeRuntime runtime;
    ArtifactBuilder builder(runtime);

    const BuildOutcome outcome = builder.Build(ConfigIn(dir));
    if (outcome.Ok() || outcome.error != BuildError::DescriptorMissing) {
        return Fail("Missing Dockerfile should report DescriptorMissing.");
    }
    if (runtime.builds != 0) {
        return Fail("Runtime build must not run without a Dockerfile.");
    }
    return 0;
}

int SuccessfulBuildReturnsArtifact() {
    TempDir dir;
    dir.Write("Dockerfile", "FROM python:3.11-slim\n");
    FakeRuntime runtime;
    ArtifactBuilder builder(runtime);

    const BuildOutcome outcome = builder.Build(ConfigIn(dir));
    if (!outcome.Ok()) {
        return Fail("Build should succeed: " + outcome.message);
    }
    if (outcome.artifact.reference != "registry.local:5000/chinese-text-classifier:1.2.0") {
        return Fail("Unexpected artifact reference: " + outcome.artifact.reference);
    }
    if (outcome.artifact.imageId != "sha256:0123456789abcdef") {
        return Fail("Image id should come from the runtime.");
    }

    const BuildRequest& request = runtime.lastBuild;
    if (request.caps.cpus != ArtifactBuilder::kBuildCpus
        || request.caps.memoryBytes != ArtifactBuilder::kBuildMemoryBytes) {
        return Fail("Build caps should be 1.5 CPUs and 1 GiB.");
    }
    if (request.buildArgs.size() != 3 || request.buildArgs[0].first != "WORKER_PROCESSES"
        || request.buildArgs[0].second != "2" || request.buildArgs[2].second != "500") {
        return Fail("Worker settings should be passed as build args.");
    }
    if (request.contextDir != dir.Path().string()) {
        return Fail("Build context should be the working directory.");
    }
    return 0;
}

int FailingBuildStepIsReported() {
    TempDir dir;
    dir.Write("Dockerfile", "FROM scratch\n");
    FakeRuntime runtime;
    runtime.buildSucceeds = false;
    ArtifactBuilder builder(runtime);

    const BuildOutcome outcome = builder.Build(ConfigIn(dir));
    if (outcome.error != BuildError::BuildStepFailed) {
        return Fail("Failed runtime build should report BuildStepFailed.");
    }
    if (outcome.message.empty()) {
        return Fail("Failure should carry the runtime message.");
    }
    return 0;
}
} // namespace

int main() {
    if (const int rc = MissingDockerfileNeverInvokesBuild()) {
        return rc;
    }
    if (const int rc = SuccessfulBuildReturnsArtifact()) {
        return rc;
    }
    return FailingBuildStepIsReported();
}
