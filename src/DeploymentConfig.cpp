#include "DeploymentConfig.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <limits>
#include <locale>
#include <sstream>

namespace {
constexpr std::uint64_t kKiB = 1024;
constexpr std::uint64_t kMiB = kKiB * 1024;
constexpr std::uint64_t kGiB = kMiB * 1024;

std::string ToLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return value;
}

std::string Trim(const std::string& value) {
    const auto first = value.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = value.find_last_not_of(" \t\r\n");
    return value.substr(first, last - first + 1);
}

void WarnInvalid(const char* name, const std::string& value) {
    std::cerr << "[WARN] Ignoring invalid " << name << "=\"" << value << "\", using default." << std::endl;
}

std::optional<int> ParsePositiveInt(const std::string& value) {
    const std::string trimmed = Trim(value);
    if (trimmed.empty()) {
        return std::nullopt;
    }

    try {
        size_t index = 0;
        const long parsed = std::stol(trimmed, &index);
        if (index == trimmed.size() && parsed > 0 && parsed <= std::numeric_limits<int>::max()) {
            return static_cast<int>(parsed);
        }
    } catch (const std::exception&) {
    }

    return std::nullopt;
}

std::optional<bool> ParseBool(const std::string& value) {
    const std::string normalized = ToLower(Trim(value));
    if (normalized == "1" || normalized == "true" || normalized == "yes") {
        return true;
    }
    if (normalized == "0" || normalized == "false" || normalized == "no") {
        return false;
    }
    return std::nullopt;
}

std::string GetEnvOrDefault(const EnvLookup& lookup, const char* name, const std::string& defaultValue) {
    const auto value = lookup(name);
    if (!value || Trim(*value).empty()) {
        return defaultValue;
    }
    return Trim(*value);
}

std::string JoinPath(const std::string& base, const std::string& leaf) {
    return (std::filesystem::path(base) / leaf).string();
}
} // namespace

std::string DeploymentConfig::ImageReference() const {
    if (registry.empty()) {
        return imageName + ":" + version;
    }
    return registry + "/" + imageName + ":" + version;
}

std::string DeploymentConfig::DescriptorPath() const {
    return JoinPath(workDir, descriptorFile);
}

std::string DeploymentConfig::BuildDescriptorPath() const {
    return JoinPath(workDir, buildDescriptorFile);
}

std::string DeploymentConfig::EnvFilePath() const {
    return JoinPath(workDir, envFile);
}

std::string DeploymentConfig::LogsPath() const {
    return JoinPath(workDir, logsDir);
}

std::string DeploymentConfig::BackupsPath() const {
    return JoinPath(workDir, backupsDir);
}

std::optional<std::string> ProcessEnvLookup(const char* name) {
    const char* value = std::getenv(name);
    if (value == nullptr) {
        return std::nullopt;
    }
    return std::string(value);
}

DeploymentConfig LoadDeploymentConfig(const EnvLookup& lookup) {
    DeploymentConfig config;

    if (const auto value = lookup("ENVIRONMENT")) {
        if (const auto parsed = ParseEnvironment(*value)) {
            config.environment = *parsed;
        } else {
            WarnInvalid("ENVIRONMENT", *value);
        }
    }

    config.registry = GetEnvOrDefault(lookup, "DOCKER_REGISTRY", config.registry);
    config.imageName = GetEnvOrDefault(lookup, "IMAGE_NAME", config.imageName);
    config.version = GetEnvOrDefault(lookup, "VERSION", config.version);

    if (const auto value = lookup("MAX_MEMORY")) {
        if (const auto parsed = ParseMemorySize(*value)) {
            config.maxMemoryBytes = *parsed;
        } else {
            WarnInvalid("MAX_MEMORY", *value);
        }
    }

    if (const auto value = lookup("MAX_CPUS")) {
        const auto parsed = ParseDecimal(*value);
        if (parsed && *parsed > 0.0) {
            config.maxCpus = *parsed;
        } else {
            WarnInvalid("MAX_CPUS", *value);
        }
    }

    const struct {
        const char* name;
        int* target;
    } counts[] = {
        {"WORKER_PROCESSES", &config.workerProcesses},
        {"WORKER_THREADS", &config.workerThreads},
        {"MAX_REQUESTS", &config.maxRequests},
    };
    for (const auto& entry : counts) {
        if (const auto value = lookup(entry.name)) {
            if (const auto parsed = ParsePositiveInt(*value)) {
                *entry.target = *parsed;
            } else {
                WarnInvalid(entry.name, *value);
            }
        }
    }

    if (const auto value = lookup("BACKUP_ENABLED")) {
        if (const auto parsed = ParseBool(*value)) {
            config.backupEnabled = *parsed;
        } else {
            WarnInvalid("BACKUP_ENABLED", *value);
        }
    }

    if (const auto value = lookup("BERTH_OTEL_ENABLED")) {
        config.tracing.enabled = ParseBool(*value).value_or(false);
    }
    config.tracing.endpoint = GetEnvOrDefault(lookup, "BERTH_OTEL_ENDPOINT", "");

    return config;
}

std::optional<Environment> ParseEnvironment(const std::string& value) {
    const std::string normalized = ToLower(Trim(value));
    if (normalized == "production" || normalized == "prod") {
        return Environment::Production;
    }
    if (normalized == "development" || normalized == "dev") {
        return Environment::Development;
    }
    return std::nullopt;
}

const char* ToString(Environment environment) {
    switch (environment) {
    case Environment::Development:
        return "development";
    case Environment::Production:
        return "production";
    }
    return "unknown";
}

std::optional<std::uint64_t> ParseMemorySize(const std::string& value) {
    std::string normalized = ToLower(Trim(value));
    if (normalized.empty()) {
        return std::nullopt;
    }

    if (normalized.size() > 1 && normalized.back() == 'b') {
        normalized.pop_back();
    }

    std::uint64_t multiplier = 1;
    switch (normalized.back()) {
    case 'k':
        multiplier = kKiB;
        break;
    case 'm':
        multiplier = kMiB;
        break;
    case 'g':
        multiplier = kGiB;
        break;
    default:
        break;
    }
    if (multiplier != 1) {
        normalized.pop_back();
    }

    if (normalized.empty() || !std::all_of(normalized.begin(), normalized.end(), [](unsigned char ch) {
            return std::isdigit(ch) != 0;
        })) {
        return std::nullopt;
    }

    try {
        const std::uint64_t amount = std::stoull(normalized);
        if (amount == 0 || amount > std::numeric_limits<std::uint64_t>::max() / multiplier) {
            return std::nullopt;
        }
        return amount * multiplier;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::string FormatMemorySize(std::uint64_t bytes) {
    if (bytes != 0 && bytes % kGiB == 0) {
        return std::to_string(bytes / kGiB) + "g";
    }
    if (bytes != 0 && bytes % kMiB == 0) {
        return std::to_string(bytes / kMiB) + "m";
    }
    if (bytes != 0 && bytes % kKiB == 0) {
        return std::to_string(bytes / kKiB) + "k";
    }
    return std::to_string(bytes);
}

std::optional<double> ParseDecimal(const std::string& value) {
    const std::string trimmed = Trim(value);
    if (trimmed.empty()) {
        return std::nullopt;
    }

    std::istringstream input(trimmed);
    input.imbue(std::locale::classic());
    double parsed = 0.0;
    input >> parsed;
    if (input.fail() || !input.eof()) {
        return std::nullopt;
    }
    return parsed;
}

std::string FormatDecimal(double value) {
    std::ostringstream output;
    output.imbue(std::locale::classic());
    output << std::setprecision(6) << value;
    return output.str();
}
