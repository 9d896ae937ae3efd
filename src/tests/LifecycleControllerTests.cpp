#include "LifecycleController.hpp"
#include "TestSupport.hpp"

#include <string>
#include <vector>

namespace {
struct Harness {
    TempDir dir;
    FakeClock clock;
    FakeRuntime runtime;
    bool probeSucceeds = true;
    int probes = 0;
    ResourceSnapshot host = MakeSnapshot(4096, 3072, 4);
    HealthMonitor health;

    Harness()
        : health("http://localhost:8000/health", clock.Make(), [this] {
              ++probes;
              ProbeResult result;
              result.success = probeSucceeds;
              result.statusCode = probeSucceeds ? 200 : 503;
              result.latency = std::chrono::milliseconds(12);
              return result;
          }) {
        dir.Write("Dockerfile", "FROM python:3.11-slim\n");
    }

    DeploymentConfig Config() const {
        DeploymentConfig config;
        config.workDir = dir.Path().string();
        return config;
    }

    LifecycleController Make() {
        return Make(Config());
    }

    LifecycleController Make(const DeploymentConfig& config) {
        ResourceGate gate([this] { return host; }, [] { return true; });
        BackupManager backups(clock.Make(), [this] { return host; });
        return LifecycleController(config, runtime, gate, health, backups, clock.Make());
    }
};

bool SameStates(const std::vector<ServiceState>& actual, const std::vector<ServiceState>& expected) {
    return actual == expected;
}

std::string Describe(const std::vector<ServiceState>& states) {
    std::string text;
    for (const auto state : states) {
        if (!text.empty()) {
            text += " -> ";
        }
        text += ToString(state);
    }
    return text;
}

int HappyPathReachesHealthy() {
    Harness harness;
    LifecycleController controller = harness.Make();

    const DeployResult result = controller.Deploy();
    if (!result.ok || result.state != ServiceState::Healthy) {
        return Fail("Deploy should succeed: " + result.message);
    }

    const std::vector<ServiceState> expected = {
        ServiceState::Stopped, ServiceState::Building, ServiceState::Starting, ServiceState::Healthy};
    if (!SameStates(controller.History(), expected)) {
        return Fail("Unexpected history: " + Describe(controller.History()));
    }
    if (harness.runtime.builds != 1 || harness.runtime.applies != 1) {
        return Fail("Expected exactly one build and one apply.");
    }
    if (harness.runtime.lastDescriptor.containerName != "chinese-text-classifier") {
        return Fail("Descriptor should target the configured container.");
    }
    if (!result.artifact || result.artifact->imageId.empty()) {
        return Fail("Deploy result should carry the built artifact.");
    }
    if (!std::filesystem::is_directory(harness.dir.Path() / "models")) {
        return Fail("Deploy should prepare the models directory.");
    }
    if (harness.probes != 1) {
        return Fail("A healthy service should be probed once.");
    }
    return 0;
}

int GateFailureNeverBuilds() {
    Harness harness;
    harness.host = MakeSnapshot(1024, 900, 4);
    LifecycleController controller = harness.Make();

    const DeployResult result = controller.Deploy();
    if (result.ok || result.failure != DeployFailure::InsufficientMemory) {
        return Fail("Deploy on a small host should fail with InsufficientMemory.");
    }
    if (controller.State() != ServiceState::ResourceCheckFailed) {
        return Fail("State should be ResourceCheckFailed.");
    }
    for (const auto state : controller.History()) {
        if (state == ServiceState::Building) {
            return Fail("Gate failure must never reach Building.");
        }
    }
    if (harness.runtime.builds != 0 || harness.runtime.applies != 0) {
        return Fail("Nothing should be built or applied after a gate failure.");
    }
    return 0;
}

int MissingDockerfileFails() {
    Harness harness;
    std::filesystem::remove(harness.dir.Path() / "Dockerfile");
    LifecycleController controller = harness.Make();

    const DeployResult result = controller.Deploy();
    if (result.failure != DeployFailure::BuildDescriptorMissing || controller.State() != ServiceState::Failed) {
        return Fail("Missing Dockerfile should end in Failed.");
    }
    if (harness.runtime.builds != 0) {
        return Fail("No build should run without a Dockerfile.");
    }
    return 0;
}

int BuildFailureFails() {
    Harness harness;
    harness.runtime.buildSucceeds = false;
    LifecycleController controller = harness.Make();

    const DeployResult result = controller.Deploy();
    if (result.failure != DeployFailure::BuildFailed || controller.State() != ServiceState::Failed) {
        return Fail("Build failure should end in Failed.");
    }
    if (harness.runtime.applies != 0) {
        return Fail("Nothing should be applied after a failed build.");
    }
    return 0;
}

int ApplyFailureFails() {
    Harness harness;
    harness.runtime.applySucceeds = false;
    LifecycleController controller = harness.Make();

    const DeployResult result = controller.Deploy();
    if (result.failure != DeployFailure::ApplyFailed || controller.State() != ServiceState::Failed) {
        return Fail("Apply failure should end in Failed.");
    }
    if (harness.probes != 0) {
        return Fail("Health should not be probed when apply fails.");
    }
    return 0;
}

int ExhaustedHealthChecksEndUnhealthy() {
    Harness harness;
    harness.probeSucceeds = false;
    LifecycleController controller = harness.Make();

    const DeployResult result = controller.Deploy();
    if (result.failure != DeployFailure::HealthCheckExhausted || controller.State() != ServiceState::Unhealthy) {
        return Fail("Exhausted health checks should end in Unhealthy.");
    }
    if (harness.probes != 10) {
        return Fail("Expected 10 probes, got " + std::to_string(harness.probes));
    }
    if (!result.health || result.health->attempt != 10) {
        return Fail("Result should report the last attempt.");
    }
    if (harness.runtime.logReads != 1) {
        return Fail("Recent logs should be printed on health failure.");
    }
    return 0;
}

int StopIsIdempotent() {
    Harness harness;
    LifecycleController controller = harness.Make();

    const StopResult first = controller.Stop();
    if (!first.ok || first.outcome != StopOutcome::AlreadyStopped || first.state != ServiceState::Stopped) {
        return Fail("Stopping a stopped service should succeed as AlreadyStopped.");
    }

    if (!controller.Deploy().ok) {
        return Fail("Deploy should succeed.");
    }
    const StopResult second = controller.Stop();
    if (!second.ok || second.outcome != StopOutcome::Stopped) {
        return Fail("Stopping a running service should report Stopped.");
    }
    if (harness.runtime.running) {
        return Fail("Container should no longer run after stop.");
    }
    return 0;
}

int RestartWithBrokenBuildLeavesNothingRunning() {
    Harness harness;
    LifecycleController controller = harness.Make();
    if (!controller.Deploy().ok) {
        return Fail("Initial deploy should succeed.");
    }

    harness.runtime.buildSucceeds = false;
    const auto sleptBefore = harness.clock.slept;
    const DeployResult result = controller.Restart();
    if (result.ok || controller.State() != ServiceState::Failed) {
        return Fail("Restart with a broken build should end in Failed.");
    }
    if (harness.runtime.running) {
        return Fail("The old instance must not keep running after a failed restart.");
    }
    if (harness.clock.slept - sleptBefore < std::chrono::seconds(5)) {
        return Fail("Restart should pause between stop and deploy.");
    }

    const auto& history = controller.History();
    const std::vector<ServiceState> tail(history.end() - 4, history.end());
    const std::vector<ServiceState> expected = {
        ServiceState::Healthy, ServiceState::Stopped, ServiceState::Building, ServiceState::Failed};
    if (!SameStates(tail, expected)) {
        return Fail("Unexpected restart history: " + Describe(history));
    }
    return 0;
}

int RedeployFromFailedSucceeds() {
    Harness harness;
    harness.runtime.buildSucceeds = false;
    LifecycleController controller = harness.Make();
    controller.Deploy();

    harness.runtime.buildSucceeds = true;
    const DeployResult result = controller.Deploy();
    if (!result.ok || controller.State() != ServiceState::Healthy) {
        return Fail("Deploy from Failed should be allowed and succeed.");
    }
    return 0;
}

int DeployOverRunningInstanceIsRejected() {
    Harness harness;
    LifecycleController controller = harness.Make();
    if (!controller.Deploy().ok) {
        return Fail("Initial deploy should succeed.");
    }

    harness.runtime.buildSucceeds = false;
    const size_t historyBefore = controller.History().size();
    const DeployResult broken = controller.Deploy();
    if (broken.ok || broken.failure != DeployFailure::InvalidState) {
        return Fail("Deploy over a Healthy service should be rejected as InvalidState.");
    }
    if (controller.State() != ServiceState::Healthy || controller.History().size() != historyBefore) {
        return Fail("Rejected deploy must leave the state untouched.");
    }
    if (harness.runtime.builds != 1 || !harness.runtime.running) {
        return Fail("Rejected deploy must not build or disturb the running instance.");
    }

    harness.runtime.buildSucceeds = true;
    harness.host = MakeSnapshot(1024, 900, 4);
    if (controller.Deploy().failure != DeployFailure::InvalidState
        || controller.State() != ServiceState::Healthy) {
        return Fail("Gate must not run while the service is Healthy.");
    }

    harness.probeSucceeds = false;
    harness.host = MakeSnapshot(4096, 3072, 4);
    const DeployResult restarted = controller.Restart();
    if (restarted.ok || controller.State() != ServiceState::Unhealthy) {
        return Fail("Restart with failing health checks should end Unhealthy.");
    }
    if (controller.Deploy().failure != DeployFailure::InvalidState) {
        return Fail("Deploy over an Unhealthy service should be rejected as InvalidState.");
    }
    return 0;
}

int TransitionTableRejectsInvalidEvents() {
    using T = LifecycleController;
    if (T::Transition(ServiceState::Stopped, LifecycleEvent::GatePassed) != ServiceState::Building) {
        return Fail("GatePassed from Stopped should go to Building.");
    }
    if (T::Transition(ServiceState::Stopped, LifecycleEvent::BuildSucceeded)) {
        return Fail("BuildSucceeded is only valid while Building.");
    }
    if (T::Transition(ServiceState::Building, LifecycleEvent::HealthPassed)) {
        return Fail("HealthPassed is only valid while Starting.");
    }
    if (T::Transition(ServiceState::Starting, LifecycleEvent::Stop)) {
        return Fail("Stop is not valid mid-deploy.");
    }
    if (T::Transition(ServiceState::Starting, LifecycleEvent::HealthExhausted) != ServiceState::Unhealthy) {
        return Fail("HealthExhausted from Starting should go to Unhealthy.");
    }
    if (T::Transition(ServiceState::Unhealthy, LifecycleEvent::Stop) != ServiceState::Stopped) {
        return Fail("Stop from Unhealthy should go to Stopped.");
    }
    if (T::Transition(ServiceState::Healthy, LifecycleEvent::GatePassed)
        || T::Transition(ServiceState::Unhealthy, LifecycleEvent::GateFailed)) {
        return Fail("Gate events are not valid while an instance is running.");
    }
    if (T::Transition(ServiceState::ResourceCheckFailed, LifecycleEvent::GateFailed)
        != ServiceState::ResourceCheckFailed) {
        return Fail("GateFailed from ResourceCheckFailed should stay in ResourceCheckFailed.");
    }
    return 0;
}

int CleanPrunesRuntimeAndBackups() {
    Harness harness;
    for (const char* id : {"20240101_000000", "20240102_000000", "20240103_000000", "20240104_000000"}) {
        std::filesystem::create_directories(harness.dir.Path() / "backups" / id);
    }
    LifecycleController controller = harness.Make();

    const CleanResult result = controller.Clean();
    if (harness.runtime.prunes != 1) {
        return Fail("Clean should prune runtime resources.");
    }
    if (result.removedBackups != 1) {
        return Fail("Clean should keep only the three newest backups.");
    }
    if (std::filesystem::exists(harness.dir.Path() / "backups" / "20240101_000000")) {
        return Fail("Oldest backup should be removed.");
    }
    return 0;
}

int BackupIsDisabledByDefault() {
    Harness harness;
    LifecycleController controller = harness.Make();

    const BackupOutcome outcome = controller.Backup();
    if (outcome.status != BackupStatus::Disabled) {
        return Fail("Backup should be a no-op when disabled.");
    }
    if (std::filesystem::exists(harness.dir.Path() / "backups")) {
        return Fail("Disabled backup must not create the backups directory.");
    }
    return 0;
}
} // namespace

int main() {
    if (const int rc = HappyPathReachesHealthy()) {
        return rc;
    }
    if (const int rc = GateFailureNeverBuilds()) {
        return rc;
    }
    if (const int rc = MissingDockerfileFails()) {
        return rc;
    }
    if (const int rc = BuildFailureFails()) {
        return rc;
    }
    if (const int rc = ApplyFailureFails()) {
        return rc;
    }
    if (const int rc = ExhaustedHealthChecksEndUnhealthy()) {
        return rc;
    }
    if (const int rc = StopIsIdempotent()) {
        return rc;
    }
    if (const int rc = RestartWithBrokenBuildLeavesNothingRunning()) {
        return rc;
    }
    if (const int rc = RedeployFromFailedSucceeds()) {
        return rc;
    }
    if (const int rc = DeployOverRunningInstanceIsRejected()) {
        return rc;
    }
    if (const int rc = TransitionTableRejectsInvalidEvents()) {
        return rc;
    }
    if (const int rc = CleanPrunesRuntimeAndBackups()) {
        return rc;
    }
    return BackupIsDisabledByDefault();
}
