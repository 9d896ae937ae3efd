#include "DescriptorGenerator.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace {
std::string Seconds(std::chrono::seconds value) {
    return std::to_string(value.count()) + "s";
}

nlohmann::json EnvironmentFor(const DeploymentConfig& config) {
    return {
        {"ENVIRONMENT", ToString(config.environment)},
        {"DOCKER_REGISTRY", config.registry},
        {"IMAGE_NAME", config.imageName},
        {"VERSION", config.version},
        {"MAX_MEMORY", FormatMemorySize(config.maxMemoryBytes)},
        {"MAX_CPUS", FormatDecimal(config.maxCpus)},
        {"WORKER_PROCESSES", std::to_string(config.workerProcesses)},
        {"WORKER_THREADS", std::to_string(config.workerThreads)},
        {"MAX_REQUESTS", std::to_string(config.maxRequests)},
        {"BACKUP_ENABLED", config.backupEnabled ? "true" : "false"},
    };
}

nlohmann::json HealthCheckFor(const DeploymentConfig& config, const HealthCheckPolicy& policy) {
    const std::string url = "http://localhost:" + std::to_string(config.servicePort) + "/health";
    return {
        {"test", nlohmann::json::array({"CMD", "curl", "-f", url})},
        {"interval", Seconds(policy.interval)},
        {"timeout", Seconds(policy.timeout)},
        {"retries", policy.retries},
        {"start_period", Seconds(policy.startPeriod)},
    };
}
} // namespace

Descriptor DescriptorGenerator::Render(const DeploymentConfig& config, const ArtifactRef& artifact) {
    const std::string port = std::to_string(config.servicePort);
    const std::string image = artifact.reference.empty() ? config.ImageReference() : artifact.reference;

    nlohmann::json service = {
        {"image", image},
        {"container_name", config.imageName},
        {"restart", "unless-stopped"},
        {"deploy", {
            {"resources", {
                {"limits", {
                    {"cpus", FormatDecimal(config.maxCpus)},
                    {"memory", FormatMemorySize(config.maxMemoryBytes)}
                }},
                {"reservations", {
                    {"cpus", FormatDecimal(kReservedCpus)},
                    {"memory", FormatMemorySize(kReservedMemoryBytes)}
                }}
            }}
        }},
        {"ports", nlohmann::json::array({port + ":" + port})},
        {"environment", EnvironmentFor(config)},
        {"volumes", nlohmann::json::array({"./logs:/app/logs", "./models:/app/models:ro", "./data:/app/data"})},
        {"healthcheck", HealthCheckFor(config, DefaultHealthCheck())},
        {"security_opt", nlohmann::json::array({"no-new-privileges:true"})},
        {"stop_grace_period", Seconds(kShutdownGrace)},
    };

    nlohmann::json document = {
        {"version", "3.8"},
        {"services", {{kServiceName, std::move(service)}}},
        {"networks", {
            {"default", {
                {"name", config.imageName + "-network"},
                {"driver", "bridge"}
            }}
        }},
    };

    Descriptor descriptor;
    descriptor.serviceName = kServiceName;
    descriptor.containerName = config.imageName;
    descriptor.path = config.DescriptorPath();
    // Object keys come out sorted.
    descriptor.document = document.dump(2) + "\n";
    return descriptor;
}

HealthCheckPolicy DescriptorGenerator::DefaultHealthCheck() {
    return HealthCheckPolicy{};
}
