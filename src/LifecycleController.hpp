#pragma once

#include "ArtifactBuilder.hpp"
#include "BackupManager.hpp"
#include "Clock.hpp"
#include "ContainerRuntime.hpp"
#include "DeploymentConfig.hpp"
#include "HealthMonitor.hpp"
#include "ResourceGate.hpp"
#include "StatusReporter.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

enum class ServiceState {
    Stopped,
    ResourceCheckFailed,
    Building,
    Starting,
    Healthy,
    Unhealthy,
    Failed
};

enum class LifecycleEvent {
    GatePassed,
    GateFailed,
    BuildSucceeded,
    BuildFailed,
    HealthPassed,
    HealthExhausted,
    Stop
};

enum class DeployFailure {
    None,
    InsufficientMemory,
    BuildDescriptorMissing,
    BuildFailed,
    ApplyFailed,
    HealthCheckExhausted,
    InvalidState
};

struct DeployResult {
    bool ok = false;
    ServiceState state = ServiceState::Stopped;
    DeployFailure failure = DeployFailure::None;
    std::string message;
    GateResult gate;
    std::optional<ArtifactRef> artifact;
    std::optional<HealthCheckResult> health;
};

struct StopResult {
    bool ok = false;
    ServiceState state = ServiceState::Stopped;
    StopOutcome outcome = StopOutcome::AlreadyStopped;
};

struct CleanResult {
    size_t removedBackups = 0;
    size_t removedLogs = 0;
};

struct LifecycleOptions {
    GateThresholds gate;
    RetryPolicy health;
    std::chrono::milliseconds restartPause = std::chrono::seconds(5);
    int diagnosticLogLines = 100;
};

class LifecycleController {
public:
    LifecycleController(
        DeploymentConfig config,
        ContainerRuntime& runtime,
        ResourceGate gate,
        const HealthMonitor& health,
        BackupManager backups,
        Clock clock = Clock::System(),
        LifecycleOptions options = LifecycleOptions());

    // Gate -> build -> render -> stop previous -> apply -> wait healthy.
    // Accepted from Stopped, ResourceCheckFailed and Failed; a running service
    // is replaced with Restart. Not transactional: a failure leaves the state
    // where the attempt stopped.
    DeployResult Deploy();
    // Idempotent; stopping an instance that is not running succeeds.
    StopResult Stop();
    // Stop followed by Deploy with the same config. Not atomic.
    DeployResult Restart();

    BackupOutcome Backup() const;
    CleanResult Clean();
    StatusSnapshot Status() const;
    HealthReport Health() const;
    bool Logs(const std::string& service, bool follow);

    ServiceState State() const { return state_; }
    const std::vector<ServiceState>& History() const { return history_; }
    const DeploymentConfig& Config() const { return config_; }
    RuntimeHandle Handle() const;

    // Pure transition table. Empty when the event is not valid in `from`.
    static std::optional<ServiceState> Transition(ServiceState from, LifecycleEvent event);

private:
    bool Apply(LifecycleEvent event);
    DeployResult Finish(DeployResult result, DeployFailure failure, const std::string& message) const;
    void PrepareLayout() const;
    StatusReporter Reporter() const;

    const DeploymentConfig config_;
    ContainerRuntime& runtime_;
    ResourceGate gate_;
    const HealthMonitor& health_;
    BackupManager backups_;
    ArtifactBuilder builder_;
    Clock clock_;
    LifecycleOptions options_;

    ServiceState state_ = ServiceState::Stopped;
    std::vector<ServiceState> history_;
    std::optional<RuntimeHandle> handle_;
};

const char* ToString(ServiceState state);
const char* ToString(LifecycleEvent event);
const char* ToString(DeployFailure failure);
