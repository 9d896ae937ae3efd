#include "BackupManager.hpp"

#include "Tracing.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <system_error>
#include <utility>

#ifndef _WIN32
#include <sys/utsname.h>
#include <unistd.h>
#endif

namespace fs = std::filesystem;

namespace {
bool CopyIfPresent(const fs::path& source, const fs::path& destinationDir, std::vector<std::string>& copied) {
    std::error_code ec;
    if (!fs::exists(source, ec)) {
        return false;
    }

    const fs::path target = destinationDir / source.filename();
    if (fs::is_directory(source, ec)) {
        fs::copy(source, target, fs::copy_options::recursive | fs::copy_options::overwrite_existing, ec);
    } else {
        fs::copy_file(source, target, fs::copy_options::overwrite_existing, ec);
    }

    if (ec) {
        std::cerr << "[WARN] Backup could not copy " << source.string() << ": " << ec.message() << std::endl;
        return false;
    }

    copied.push_back(source.filename().string());
    return true;
}

nlohmann::json ToJson(const ResourceSnapshot& snapshot) {
    nlohmann::json json = {
        {"totalMemoryBytes", snapshot.totalMemoryBytes},
        {"availableMemoryBytes", snapshot.availableMemoryBytes},
        {"cpuCores", snapshot.cpuCores},
        {"diskTotalBytes", snapshot.diskTotalBytes},
        {"diskUsedBytes", snapshot.diskUsedBytes},
    };
    if (snapshot.loadAverage1m) {
        json["loadAverage1m"] = *snapshot.loadAverage1m;
    } else {
        json["loadAverage1m"] = nullptr;
    }
    return json;
}

nlohmann::json ToJson(const DeploymentConfig& config) {
    return {
        {"environment", ToString(config.environment)},
        {"image", config.ImageReference()},
        {"maxMemory", FormatMemorySize(config.maxMemoryBytes)},
        {"maxCpus", FormatDecimal(config.maxCpus)},
        {"workerProcesses", config.workerProcesses},
        {"workerThreads", config.workerThreads},
        {"maxRequests", config.maxRequests},
    };
}
} // namespace

const char* ToString(BackupStatus status) {
    switch (status) {
    case BackupStatus::Created:
        return "created";
    case BackupStatus::Disabled:
        return "disabled";
    case BackupStatus::SkippedDevelopment:
        return "skipped (development)";
    case BackupStatus::Failed:
        return "failed";
    }
    return "unknown";
}

BackupManager::BackupManager(Clock clock, SnapshotSource resources)
    : clock_(std::move(clock)),
      resources_(std::move(resources)) {}

BackupOutcome BackupManager::Snapshot(const DeploymentConfig& config) const {
    BackupOutcome outcome;

    if (!config.backupEnabled) {
        std::cout << "[Backup] Backups are disabled (BACKUP_ENABLED=false)." << std::endl;
        outcome.status = BackupStatus::Disabled;
        return outcome;
    }

    if (config.environment != Environment::Production) {
        std::cerr << "[WARN] Backups are only taken in production." << std::endl;
        outcome.status = BackupStatus::SkippedDevelopment;
        return outcome;
    }

    auto span = Tracer::Instance().StartSpan("berth.backup");

    BackupRecord record;
    record.createdAt = clock_.Now();
    record.id = FormatBackupId(record.createdAt);
    const fs::path backupDir = fs::path(config.BackupsPath()) / record.id;
    record.path = backupDir.string();

    std::error_code ec;
    fs::create_directories(backupDir.parent_path(), ec);
    // create_directory reports false for an existing entry; a record is never rewritten.
    const bool created = !ec && fs::create_directory(backupDir, ec);
    if (!created) {
        outcome.message = ec
            ? "cannot create " + record.path + ": " + ec.message()
            : "backup " + record.id + " already exists";
        std::cerr << "[Backup] " << outcome.message << std::endl;
        Tracer::Instance().EndSpan(span, false);
        return outcome;
    }

    CopyIfPresent(config.LogsPath(), backupDir, record.files);
    CopyIfPresent(config.BuildDescriptorPath(), backupDir, record.files);
    CopyIfPresent(config.DescriptorPath(), backupDir, record.files);
    CopyIfPresent(config.EnvFilePath(), backupDir, record.files);

    record.host = DetectHostInfo();
    record.resources = resources_ ? resources_() : SysMonitor().Collect();
    record.config = config;

    if (!WriteMetadata(record)) {
        outcome.message = "cannot write metadata for " + record.path;
        std::cerr << "[Backup] " << outcome.message << std::endl;
        fs::remove_all(backupDir, ec);
        if (ec) {
            std::cerr << "[WARN] Could not remove incomplete backup " << record.id << ": " << ec.message() << std::endl;
        }
        Tracer::Instance().EndSpan(span, false);
        return outcome;
    }

    std::cout << "[Backup] Backup complete: " << record.path << std::endl;
    Prune(config.BackupsPath(), kRetainedBackups);

    Tracer::Instance().SetAttribute(span, "backup.id", record.id);
    Tracer::Instance().EndSpan(span, true);

    outcome.status = BackupStatus::Created;
    outcome.record = std::move(record);
    return outcome;
}

std::vector<std::string> BackupManager::List(const std::string& backupsDir) const {
    std::vector<std::string> ids;

    std::error_code ec;
    fs::directory_iterator it(backupsDir, ec);
    if (ec) {
        return ids;
    }

    fs::directory_iterator end;
    for (; it != end; it.increment(ec)) {
        if (ec) {
            break;
        }
        std::error_code typeError;
        if (it->is_directory(typeError) && IsBackupId(it->path().filename().string())) {
            ids.push_back(it->path().filename().string());
        }
    }

    std::sort(ids.begin(), ids.end(), std::greater<std::string>());
    return ids;
}

size_t BackupManager::Prune(const std::string& backupsDir, size_t keep) const {
    const std::vector<std::string> ids = List(backupsDir);
    size_t removed = 0;
    for (size_t index = keep; index < ids.size(); ++index) {
        std::error_code ec;
        fs::remove_all(fs::path(backupsDir) / ids[index], ec);
        if (ec) {
            std::cerr << "[WARN] Could not remove old backup " << ids[index] << ": " << ec.message() << std::endl;
            continue;
        }
        std::cout << "[Backup] Removed old backup " << ids[index] << std::endl;
        ++removed;
    }
    return removed;
}

size_t BackupManager::PruneLogs(const std::string& logsDir, std::chrono::hours maxAge) const {
    size_t removed = 0;

    std::error_code ec;
    fs::recursive_directory_iterator it(logsDir, ec);
    if (ec) {
        return removed;
    }

    const auto cutoff = fs::file_time_type::clock::now() - maxAge;
    std::vector<fs::path> expired;
    fs::recursive_directory_iterator end;
    for (; it != end; it.increment(ec)) {
        if (ec) {
            break;
        }

        std::error_code entryError;
        if (!it->is_regular_file(entryError)) {
            continue;
        }
        if (it->path().filename().string().find(".log.") == std::string::npos) {
            continue;
        }

        const auto modified = it->last_write_time(entryError);
        if (!entryError && modified < cutoff) {
            expired.push_back(it->path());
        }
    }

    for (const auto& path : expired) {
        std::error_code removeError;
        if (fs::remove(path, removeError)) {
            ++removed;
        }
    }

    if (removed > 0) {
        std::cout << "[Backup] Removed " << removed << " expired log file(s)." << std::endl;
    }
    return removed;
}

bool BackupManager::IsBackupId(const std::string& name) {
    if (name.size() != 15 || name[8] != '_') {
        return false;
    }

    for (size_t index = 0; index < name.size(); ++index) {
        if (index == 8) {
            continue;
        }
        if (!std::isdigit(static_cast<unsigned char>(name[index]))) {
            return false;
        }
    }
    return true;
}

std::string BackupManager::FormatBackupId(Clock::TimePoint time) {
    const auto timeT = std::chrono::system_clock::to_time_t(time);
    std::tm utcTime = {};
#ifdef _WIN32
    gmtime_s(&utcTime, &timeT);
#else
    gmtime_r(&timeT, &utcTime);
#endif

    std::ostringstream output;
    output << std::put_time(&utcTime, "%Y%m%d_%H%M%S");
    return output.str();
}

HostInfo BackupManager::DetectHostInfo() {
    HostInfo info;
#ifdef _WIN32
    info.system = "Windows";
#else
    struct utsname uts;
    if (uname(&uts) == 0) {
        info.hostname = uts.nodename;
        info.system = uts.sysname;
        info.kernelRelease = uts.release;
        info.machine = uts.machine;
    }

    char hostnameBuffer[256] = {};
    if (gethostname(hostnameBuffer, sizeof(hostnameBuffer) - 1) == 0) {
        info.hostname = hostnameBuffer;
    }
#endif
    return info;
}

bool BackupManager::WriteMetadata(const BackupRecord& record) const {
    const nlohmann::json metadata = {
        {"id", record.id},
        {"createdAt", static_cast<int64_t>(std::chrono::system_clock::to_time_t(record.createdAt))},
        {"host", {
            {"hostname", record.host.hostname},
            {"system", record.host.system},
            {"kernelRelease", record.host.kernelRelease},
            {"machine", record.host.machine}
        }},
        {"resources", ToJson(record.resources)},
        {"config", ToJson(record.config)},
        {"files", record.files},
    };

    std::ofstream output(fs::path(record.path) / kMetadataFile, std::ios::binary | std::ios::trunc);
    if (!output) {
        return false;
    }

    output << metadata.dump(2) << "\n";
    return output.good();
}
