#include "LifecycleController.hpp"

#include "DescriptorGenerator.hpp"
#include "Tracing.hpp"

#include <filesystem>
#include <initializer_list>
#include <iostream>
#include <system_error>
#include <utility>

namespace {
bool IsSettled(ServiceState state) {
    return state != ServiceState::Building && state != ServiceState::Starting;
}

// A running instance (Healthy or Unhealthy) is replaced through Restart.
bool AcceptsDeploy(ServiceState state) {
    return state == ServiceState::Stopped
        || state == ServiceState::ResourceCheckFailed
        || state == ServiceState::Failed;
}

DeployFailure FromBuildError(BuildError error) {
    switch (error) {
    case BuildError::DescriptorMissing:
        return DeployFailure::BuildDescriptorMissing;
    case BuildError::BuildStepFailed:
        return DeployFailure::BuildFailed;
    case BuildError::None:
        break;
    }
    return DeployFailure::None;
}
} // namespace

LifecycleController::LifecycleController(
    DeploymentConfig config,
    ContainerRuntime& runtime,
    ResourceGate gate,
    const HealthMonitor& health,
    BackupManager backups,
    Clock clock,
    LifecycleOptions options)
    : config_(std::move(config)),
      runtime_(runtime),
      gate_(std::move(gate)),
      health_(health),
      backups_(std::move(backups)),
      builder_(runtime),
      clock_(std::move(clock)),
      options_(std::move(options)) {
    history_.push_back(state_);
}

DeployResult LifecycleController::Deploy() {
    DeployResult result;
    if (!IsSettled(state_)) {
        return Finish(std::move(result), DeployFailure::InvalidState,
            std::string("deploy already in progress (") + ToString(state_) + ")");
    }
    if (!AcceptsDeploy(state_)) {
        return Finish(std::move(result), DeployFailure::InvalidState,
            std::string("service is ") + ToString(state_) + "; use restart");
    }

    auto span = Tracer::Instance().StartSpan("berth.deploy");
    Tracer::Instance().SetAttribute(span, "deploy.environment", ToString(config_.environment));
    Tracer::Instance().SetAttribute(span, "image.reference", config_.ImageReference());

    std::cout << "[Berth] Deploying " << config_.ImageReference()
              << " (" << ToString(config_.environment) << ")" << std::endl;

    result.gate = gate_.Check(options_.gate);
    if (!result.gate.Passed()) {
        Apply(LifecycleEvent::GateFailed);
        Tracer::Instance().EndSpan(span, false);
        return Finish(std::move(result), DeployFailure::InsufficientMemory, "insufficient total memory");
    }
    Apply(LifecycleEvent::GatePassed);

    const BuildOutcome build = builder_.Build(config_);
    if (!build.Ok()) {
        Apply(LifecycleEvent::BuildFailed);
        Tracer::Instance().EndSpan(span, false);
        return Finish(std::move(result), FromBuildError(build.error), build.message);
    }
    result.artifact = build.artifact;

    const Descriptor descriptor = DescriptorGenerator::Render(config_, build.artifact);
    PrepareLayout();

    std::cout << "[Berth] Stopping previous instance..." << std::endl;
    const StopOutcome previous = runtime_.Stop(Handle());
    if (previous == StopOutcome::Failed) {
        std::cerr << "[WARN] Previous instance did not stop cleanly; continuing." << std::endl;
    }

    std::cout << "[Berth] Starting service from " << descriptor.path << std::endl;
    const ApplyResult applied = runtime_.ApplyDescriptor(descriptor);
    handle_ = applied.handle;
    if (!applied.ok) {
        Apply(LifecycleEvent::BuildFailed);
        Tracer::Instance().EndSpan(span, false);
        return Finish(std::move(result), DeployFailure::ApplyFailed, applied.error);
    }
    Apply(LifecycleEvent::BuildSucceeded);

    const HealthCheckResult health = health_.WaitHealthy(options_.health);
    result.health = health;
    if (!health.success) {
        Apply(LifecycleEvent::HealthExhausted);
        std::cerr << "[Berth] Service failed to become healthy; recent logs:" << std::endl;
        if (!runtime_.Logs(*handle_, "", options_.diagnosticLogLines, false)) {
            std::cerr << "[Berth] Unable to read service logs." << std::endl;
        }
        Tracer::Instance().EndSpan(span, false);
        return Finish(std::move(result), DeployFailure::HealthCheckExhausted,
            "health check failed after " + std::to_string(health.attempt) + " attempt(s)");
    }
    Apply(LifecycleEvent::HealthPassed);

    std::cout << "[Berth] Deployment succeeded. Limits: memory " << FormatMemorySize(config_.maxMemoryBytes)
              << ", cpus " << FormatDecimal(config_.maxCpus)
              << ", workers " << config_.workerProcesses << "x" << config_.workerThreads << std::endl;
    Tracer::Instance().EndSpan(span, true);
    return Finish(std::move(result), DeployFailure::None, "");
}

StopResult LifecycleController::Stop() {
    StopResult result;
    if (!IsSettled(state_)) {
        std::cerr << "[Berth] Cannot stop while " << ToString(state_) << std::endl;
        result.state = state_;
        result.outcome = StopOutcome::Failed;
        return result;
    }

    std::cout << "[Berth] Stopping service..." << std::endl;
    result.outcome = runtime_.Stop(Handle());
    switch (result.outcome) {
    case StopOutcome::Stopped:
        std::cout << "[Berth] Service stopped." << std::endl;
        break;
    case StopOutcome::AlreadyStopped:
        std::cout << "[Berth] Service was not running." << std::endl;
        break;
    case StopOutcome::Failed:
        std::cerr << "[Berth] Teardown reported an error." << std::endl;
        break;
    }

    Apply(LifecycleEvent::Stop);
    handle_.reset();
    result.state = state_;
    result.ok = result.outcome != StopOutcome::Failed;
    return result;
}

DeployResult LifecycleController::Restart() {
    std::cout << "[Berth] Restarting service..." << std::endl;
    const StopResult stopped = Stop();
    if (!stopped.ok) {
        std::cerr << "[WARN] Continuing restart after teardown error." << std::endl;
    }

    clock_.SleepFor(options_.restartPause);
    return Deploy();
}

BackupOutcome LifecycleController::Backup() const {
    return backups_.Snapshot(config_);
}

CleanResult LifecycleController::Clean() {
    std::cout << "[Berth] Reclaiming unused runtime resources..." << std::endl;
    runtime_.PruneResources();

    CleanResult result;
    result.removedBackups = backups_.Prune(config_.BackupsPath());
    result.removedLogs = backups_.PruneLogs(config_.LogsPath());
    std::cout << "[Berth] Clean complete: " << result.removedBackups << " backup(s), "
              << result.removedLogs << " log file(s) removed." << std::endl;
    return result;
}

StatusSnapshot LifecycleController::Status() const {
    return Reporter().Sample();
}

HealthReport LifecycleController::Health() const {
    const StatusSnapshot snapshot = Reporter().Sample();
    const HealthReport report = StatusReporter::Evaluate(snapshot);

    if (report.apiHealthy) {
        std::cout << "[Health] API healthy (response time "
                  << static_cast<double>(snapshot.health.latency.count()) / 1000.0 << "s)" << std::endl;
    } else {
        std::cerr << "[Health] API unhealthy" << std::endl;
    }

    if (report.containerRunning) {
        std::cout << "[Health] Container running" << std::endl;
    } else {
        std::cerr << "[Health] Container not running" << std::endl;
    }

    for (const auto& warning : report.warnings) {
        std::cerr << "[WARN] " << warning << std::endl;
    }
    if (report.systemHealthy) {
        std::cout << "[Health] System resources normal" << std::endl;
    }
    return report;
}

bool LifecycleController::Logs(const std::string& service, bool follow) {
    return runtime_.Logs(Handle(), service, options_.diagnosticLogLines, follow);
}

RuntimeHandle LifecycleController::Handle() const {
    if (handle_) {
        return *handle_;
    }

    RuntimeHandle handle;
    handle.containerName = config_.imageName;
    handle.serviceName = DescriptorGenerator::kServiceName;
    handle.descriptorPath = config_.DescriptorPath();
    return handle;
}

std::optional<ServiceState> LifecycleController::Transition(ServiceState from, LifecycleEvent event) {
    switch (event) {
    case LifecycleEvent::GatePassed:
        return AcceptsDeploy(from) ? std::optional<ServiceState>(ServiceState::Building) : std::nullopt;
    case LifecycleEvent::GateFailed:
        return AcceptsDeploy(from) ? std::optional<ServiceState>(ServiceState::ResourceCheckFailed) : std::nullopt;
    case LifecycleEvent::BuildSucceeded:
        return from == ServiceState::Building ? std::optional<ServiceState>(ServiceState::Starting) : std::nullopt;
    case LifecycleEvent::BuildFailed:
        return from == ServiceState::Building ? std::optional<ServiceState>(ServiceState::Failed) : std::nullopt;
    case LifecycleEvent::HealthPassed:
        return from == ServiceState::Starting ? std::optional<ServiceState>(ServiceState::Healthy) : std::nullopt;
    case LifecycleEvent::HealthExhausted:
        return from == ServiceState::Starting ? std::optional<ServiceState>(ServiceState::Unhealthy) : std::nullopt;
    case LifecycleEvent::Stop:
        return IsSettled(from) ? std::optional<ServiceState>(ServiceState::Stopped) : std::nullopt;
    }
    return std::nullopt;
}

bool LifecycleController::Apply(LifecycleEvent event) {
    const auto next = Transition(state_, event);
    if (!next) {
        std::cerr << "[Berth] Ignoring " << ToString(event) << " in state " << ToString(state_) << std::endl;
        return false;
    }

    if (*next != state_) {
        std::cout << "[Berth] State " << ToString(state_) << " -> " << ToString(*next) << std::endl;
    }
    state_ = *next;
    history_.push_back(state_);
    return true;
}

DeployResult LifecycleController::Finish(DeployResult result, DeployFailure failure, const std::string& message) const {
    result.failure = failure;
    result.ok = failure == DeployFailure::None;
    result.state = state_;
    result.message = message;
    if (!result.ok) {
        std::cerr << "[Berth] Deploy failed: " << ToString(failure);
        if (!message.empty()) {
            std::cerr << " (" << message << ")";
        }
        std::cerr << std::endl;
    }
    return result;
}

void LifecycleController::PrepareLayout() const {
    for (const char* leaf : {"logs", "models", "data"}) {
        std::error_code ec;
        std::filesystem::create_directories(std::filesystem::path(config_.workDir) / leaf, ec);
        if (ec) {
            std::cerr << "[WARN] Unable to create " << leaf << ": " << ec.message() << std::endl;
        }
    }
}

StatusReporter LifecycleController::Reporter() const {
    return StatusReporter(runtime_, health_, config_.imageName, clock_);
}

const char* ToString(ServiceState state) {
    switch (state) {
    case ServiceState::Stopped:
        return "Stopped";
    case ServiceState::ResourceCheckFailed:
        return "ResourceCheckFailed";
    case ServiceState::Building:
        return "Building";
    case ServiceState::Starting:
        return "Starting";
    case ServiceState::Healthy:
        return "Healthy";
    case ServiceState::Unhealthy:
        return "Unhealthy";
    case ServiceState::Failed:
        return "Failed";
    }
    return "Unknown";
}

const char* ToString(LifecycleEvent event) {
    switch (event) {
    case LifecycleEvent::GatePassed:
        return "GatePassed";
    case LifecycleEvent::GateFailed:
        return "GateFailed";
    case LifecycleEvent::BuildSucceeded:
        return "BuildSucceeded";
    case LifecycleEvent::BuildFailed:
        return "BuildFailed";
    case LifecycleEvent::HealthPassed:
        return "HealthPassed";
    case LifecycleEvent::HealthExhausted:
        return "HealthExhausted";
    case LifecycleEvent::Stop:
        return "Stop";
    }
    return "Unknown";
}

const char* ToString(DeployFailure failure) {
    switch (failure) {
    case DeployFailure::None:
        return "none";
    case DeployFailure::InsufficientMemory:
        return "insufficient memory";
    case DeployFailure::BuildDescriptorMissing:
        return "build descriptor missing";
    case DeployFailure::BuildFailed:
        return "build failed";
    case DeployFailure::ApplyFailed:
        return "runtime apply failed";
    case DeployFailure::HealthCheckExhausted:
        return "health check retries exhausted";
    case DeployFailure::InvalidState:
        return "invalid state";
    }
    return "unknown";
}
