#pragma once

#include "Clock.hpp"
#include "DeploymentConfig.hpp"
#include "SysMonitor.hpp"

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <vector>

struct HostInfo {
    std::string hostname;
    std::string system;
    std::string kernelRelease;
    std::string machine;
};

struct BackupRecord {
    // YYYYMMDD_HHMMSS, UTC. Doubles as the sort key.
    std::string id;
    Clock::TimePoint createdAt;
    std::string path;
    HostInfo host;
    ResourceSnapshot resources;
    DeploymentConfig config;
    std::vector<std::string> files;
};

enum class BackupStatus {
    Created,
    Disabled,
    SkippedDevelopment,
    Failed
};

struct BackupOutcome {
    BackupStatus status = BackupStatus::Failed;
    std::optional<BackupRecord> record;
    std::string message;

    bool Ok() const { return status != BackupStatus::Failed; }
    bool IsNoOp() const { return status == BackupStatus::Disabled || status == BackupStatus::SkippedDevelopment; }
};

class BackupManager {
public:
    using SnapshotSource = std::function<ResourceSnapshot()>;

    static constexpr size_t kRetainedBackups = 3;
    static constexpr std::chrono::hours kLogMaxAge{24 * 7};
    static constexpr const char* kMetadataFile = "backup_info.json";

    explicit BackupManager(Clock clock = Clock::System(), SnapshotSource resources = SnapshotSource());

    BackupOutcome Snapshot(const DeploymentConfig& config) const;

    // Newest first. Missing directory yields an empty list.
    std::vector<std::string> List(const std::string& backupsDir) const;

    // Keeps the `keep` newest backups. Deletion failures are logged and skipped.
    size_t Prune(const std::string& backupsDir, size_t keep = kRetainedBackups) const;

    // Removes rotated logs (*.log.*) last modified more than maxAge ago.
    size_t PruneLogs(const std::string& logsDir, std::chrono::hours maxAge = kLogMaxAge) const;

    static bool IsBackupId(const std::string& name);
    static std::string FormatBackupId(Clock::TimePoint time);
    static HostInfo DetectHostInfo();

private:
    bool WriteMetadata(const BackupRecord& record) const;

    Clock clock_;
    SnapshotSource resources_;
};

const char* ToString(BackupStatus status);
