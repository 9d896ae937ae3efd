#include "DescriptorGenerator.hpp"
#include "TestSupport.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace {
ArtifactRef SampleArtifact() {
    ArtifactRef artifact;
    artifact.reference = "localhost:5000/text-classifier:latest";
    artifact.imageId = "sha256:0123456789abcdef";
    artifact.sizeBytes = 1024;
    return artifact;
}

int RenderIsDeterministic() {
    const DeploymentConfig config;
    const Descriptor first = DescriptorGenerator::Render(config, SampleArtifact());
    const Descriptor second = DescriptorGenerator::Render(config, SampleArtifact());
    if (first.document != second.document) {
        return Fail("Identical inputs must render identical documents.");
    }
    if (first.document.empty() || first.document.back() != '\n') {
        return Fail("Document should end with a newline.");
    }
    return 0;
}

int RenderCarriesLimitsAndHealthCheck() {
    DeploymentConfig config;
    config.maxCpus = 2.0;
    config.maxMemoryBytes = 2ULL * 1024 * 1024 * 1024;
    config.workerThreads = 6;

    const Descriptor descriptor = DescriptorGenerator::Render(config, SampleArtifact());
    if (descriptor.serviceName != "app" || descriptor.containerName != "chinese-text-classifier") {
        return Fail("Unexpected service or container name.");
    }

    const auto document = nlohmann::json::parse(descriptor.document, nullptr, false);
    if (document.is_discarded()) {
        return Fail("Rendered document is not valid JSON.");
    }

    const auto& service = document["services"]["app"];
    if (service["image"] != "localhost:5000/text-classifier:latest") {
        return Fail("Service image should be the artifact reference.");
    }
    if (service["restart"] != "unless-stopped") {
        return Fail("Restart policy should be unless-stopped.");
    }

    const auto& resources = service["deploy"]["resources"];
    if (resources["limits"]["cpus"] != "2" || resources["limits"]["memory"] != "2g") {
        return Fail("Limits should follow the configured ceilings.");
    }
    if (resources["reservations"]["cpus"] != "0.5" || resources["reservations"]["memory"] != "256m") {
        return Fail("Reservations should be 0.5 CPUs and 256m.");
    }

    if (service["environment"]["WORKER_THREADS"] != "6"
        || service["environment"]["ENVIRONMENT"] != "production") {
        return Fail("Environment block should carry the configuration.");
    }

    const auto& healthcheck = service["healthcheck"];
    if (healthcheck["interval"] != "60s" || healthcheck["timeout"] != "15s"
        || healthcheck["retries"] != 3 || healthcheck["start_period"] != "45s") {
        return Fail("Unexpected healthcheck policy.");
    }
    if (healthcheck["test"].size() != 4 || healthcheck["test"][3] != "http://localhost:8000/health") {
        return Fail("Healthcheck should curl the service health endpoint.");
    }

    if (service["ports"].size() != 1 || service["ports"][0] != "8000:8000") {
        return Fail("Service port should be published.");
    }
    if (service["stop_grace_period"] != "30s") {
        return Fail("Shutdown grace should be 30s.");
    }
    return 0;
}

int ChangedConfigChangesDocument() {
    DeploymentConfig config;
    const std::string before = DescriptorGenerator::Render(config, SampleArtifact()).document;
    config.maxRequests = 2000;
    const std::string after = DescriptorGenerator::Render(config, SampleArtifact()).document;
    if (before == after) {
        return Fail("MAX_REQUESTS change should be reflected in the document.");
    }
    return 0;
}
} // namespace

int main() {
    if (const int rc = RenderIsDeterministic()) {
        return rc;
    }
    if (const int rc = RenderCarriesLimitsAndHealthCheck()) {
        return rc;
    }
    return ChangedConfigChangesDocument();
}
