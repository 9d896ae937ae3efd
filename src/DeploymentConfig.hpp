#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>

enum class Environment {
    Development,
    Production
};

struct TraceSettings {
    bool enabled = false;
    std::string endpoint;
};

struct DeploymentConfig {
    Environment environment = Environment::Production;
    std::string registry = "localhost:5000";
    std::string imageName = "chinese-text-classifier";
    std::string version = "latest";

    double maxCpus = 1.5;
    std::uint64_t maxMemoryBytes = 1536ULL * 1024 * 1024;

    int workerProcesses = 1;
    int workerThreads = 2;
    int maxRequests = 1000;
    bool backupEnabled = false;

    int servicePort = 8000;
    std::string healthUrl = "http://localhost:8000/health";

    std::string workDir = ".";
    std::string descriptorFile = "docker-compose.berth.json";
    std::string buildDescriptorFile = "Dockerfile";
    std::string envFile = ".env";
    std::string logsDir = "logs";
    std::string backupsDir = "backups";

    TraceSettings tracing;

    std::string ImageReference() const;
    std::string DescriptorPath() const;
    std::string BuildDescriptorPath() const;
    std::string EnvFilePath() const;
    std::string LogsPath() const;
    std::string BackupsPath() const;
};

using EnvLookup = std::function<std::optional<std::string>(const char*)>;

// Reads the process environment through std::getenv.
std::optional<std::string> ProcessEnvLookup(const char* name);

// Unset or unparsable keys keep their default; the latter log a warning.
DeploymentConfig LoadDeploymentConfig(const EnvLookup& lookup = ProcessEnvLookup);

std::optional<Environment> ParseEnvironment(const std::string& value);
const char* ToString(Environment environment);

// Accepts docker-style sizes: "1536m", "1g", "512k", "1073741824".
std::optional<std::uint64_t> ParseMemorySize(const std::string& value);
std::string FormatMemorySize(std::uint64_t bytes);
std::optional<double> ParseDecimal(const std::string& value);
std::string FormatDecimal(double value);
