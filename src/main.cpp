#include "BackupManager.hpp"
#include "DeploymentConfig.hpp"
#include "DockerRuntime.hpp"
#include "HealthMonitor.hpp"
#include "LifecycleController.hpp"
#include "ResourceGate.hpp"
#include "StatusReporter.hpp"
#include "SysMonitor.hpp"
#include "Tracing.hpp"

#include <atomic>
#include <csignal>
#include <iostream>
#include <string>

namespace {
std::atomic<bool> g_cancelled{false};

void HandleStopSignal(int) {
    g_cancelled.store(true);
}

void PrintHelp(const char* program, const DeploymentConfig& config) {
    std::cout << "Usage: " << program << " <command> [argument]\n"
              << "\n"
              << "Commands:\n"
              << "  deploy [env]     Deploy the service (default)\n"
              << "  status           Show service status and resource usage\n"
              << "  logs [service]   Follow service logs\n"
              << "  stop             Stop the service\n"
              << "  backup           Take a lightweight backup (production, BACKUP_ENABLED=true)\n"
              << "  health           Run a one-shot health check\n"
              << "  restart          Stop, then deploy again\n"
              << "  clean            Reclaim runtime resources, prune old backups and logs\n"
              << "  monitor          Live status view (Ctrl+C to exit)\n"
              << "  help             Show this help\n"
              << "\n"
              << "Environments: development | production (default: production)\n"
              << "\n"
              << "Environment variables:\n"
              << "  MAX_MEMORY=" << FormatMemorySize(config.maxMemoryBytes) << "\n"
              << "  MAX_CPUS=" << FormatDecimal(config.maxCpus) << "\n"
              << "  WORKER_PROCESSES=" << config.workerProcesses << "\n"
              << "  WORKER_THREADS=" << config.workerThreads << "\n"
              << "  MAX_REQUESTS=" << config.maxRequests << "\n"
              << "  BACKUP_ENABLED=" << (config.backupEnabled ? "true" : "false") << "\n"
              << "  DOCKER_REGISTRY, IMAGE_NAME, VERSION, BERTH_OTEL_ENABLED, BERTH_OTEL_ENDPOINT\n";
}

int RunMonitor(const StatusReporter& reporter) {
    std::signal(SIGINT, HandleStopSignal);
    std::signal(SIGTERM, HandleStopSignal);

    std::cout << "[Berth] Monitoring (Ctrl+C to exit)..." << std::endl;
    reporter.Stream(
        [](const StatusSnapshot& snapshot) {
            std::cout << "\033[2J\033[H" << StatusReporter::Format(snapshot) << "\nPress Ctrl+C to exit..."
                      << std::endl;
            return true;
        },
        g_cancelled);

    std::cout << std::endl << "[Berth] Monitor stopped." << std::endl;
    return 0;
}
} // namespace

int main(int argc, char** argv) {
    const std::string command = argc > 1 ? argv[1] : "deploy";
    const std::string argument = argc > 2 ? argv[2] : "";

    DeploymentConfig config = LoadDeploymentConfig();
    if (command == "deploy" && !argument.empty()) {
        const auto environment = ParseEnvironment(argument);
        if (!environment) {
            std::cerr << "[Berth] Unknown environment: " << argument << std::endl;
            PrintHelp(argv[0], config);
            return 1;
        }
        config.environment = *environment;
    }

    if (command == "help" || command == "-h" || command == "--help") {
        PrintHelp(argv[0], config);
        return 0;
    }

    TraceConfig traceConfig;
    traceConfig.enabled = config.tracing.enabled;
    traceConfig.endpoint = config.tracing.endpoint;
    Tracer::Instance().Configure(traceConfig);

    const Clock clock = Clock::System();
    const SysMonitor monitor;
    const auto collect = [&monitor] { return monitor.Collect(); };

    DockerRuntime runtime;
    const HealthMonitor health(config.healthUrl, clock);
    ResourceGate gate(collect, [] { return ResourceGate::CurrentUserInGroup("docker"); });
    BackupManager backups(clock, collect);
    LifecycleController controller(config, runtime, gate, health, backups, clock);

    int exitCode = 0;
    if (command == "deploy") {
        const DeployResult result = controller.Deploy();
        if (result.ok) {
            std::cout << StatusReporter::Format(controller.Status());
        }
        exitCode = result.ok ? 0 : 1;
    } else if (command == "status") {
        std::cout << StatusReporter::Format(controller.Status());
    } else if (command == "logs") {
        exitCode = controller.Logs(argument, true) ? 0 : 1;
    } else if (command == "stop") {
        exitCode = controller.Stop().ok ? 0 : 1;
    } else if (command == "backup") {
        exitCode = controller.Backup().Ok() ? 0 : 1;
    } else if (command == "health") {
        exitCode = controller.Health().Passed() ? 0 : 1;
    } else if (command == "restart") {
        exitCode = controller.Restart().ok ? 0 : 1;
    } else if (command == "clean") {
        controller.Clean();
    } else if (command == "monitor") {
        exitCode = RunMonitor(StatusReporter(runtime, health, config.imageName, clock, collect));
    } else {
        std::cerr << "[Berth] Unknown command: " << command << std::endl;
        PrintHelp(argv[0], config);
        exitCode = 1;
    }

    Tracer::Instance().Shutdown();
    return exitCode;
}
