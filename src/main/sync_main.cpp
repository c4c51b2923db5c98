#include "main/sync_main.hpp"
#include "common/logger.hpp"
#include "sync/plan_loader.hpp"
#include "sync/strategy_factory.hpp"
#include "sync/sync_engine.hpp"
#include <csignal>
#include <iostream>
#include <mutex>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

volatile std::sig_atomic_t interruptRequested = 0;

void handleInterrupt(int) {
    interruptRequested = 1;
}

std::mutex outputMutex;

void printJsonLine(const json& j) {
    std::lock_guard<std::mutex> lock(outputMutex);
    std::cout << j.dump() << std::endl;
}

} // namespace

void printSyncUsage() {
    std::cout << "Usage: datasync [--config <file>] <command> [options]\n"
              << "Commands:\n"
              << "  run <plan.json>      Execute a sync plan\n"
              << "  verify <plan.json>   Verify every task of a plan without syncing\n"
              << "  strategies           List available sync strategies\n"
              << "\n"
              << "Options:\n"
              << "  -c, --config <file>  Configuration file (JSON)\n"
              << "  --verbose            Echo log lines to the console\n"
              << "  -h, --help           Show this help message\n"
              << "  -v, --version        Show version information\n";
}

int runMain(int argc, char* argv[], const SyncConfig& config) {
    if (argc < 2) {
        std::cerr << "Error: run requires a plan file" << std::endl;
        return 1;
    }

    PlanDocument document = loadPlanFile(argv[1], config.defaults);
    SyncEngine engine(createDefaultRegistry(config), config.progressQueueCapacity);
    SyncPlan plan = engine.createPlan(document.name, std::move(document.tasks));

    std::signal(SIGINT, handleInterrupt);
    std::signal(SIGTERM, handleInterrupt);

    if (!engine.start(plan.getId(), [](const SyncEvent& event) { printJsonLine(event.toJson()); })) {
        std::cerr << "Error: " << engine.getLastError() << std::endl;
        return 1;
    }

    bool cancelRequested = false;
    while (!engine.waitForCompletion(plan.getId(), std::chrono::milliseconds(200))) {
        if (interruptRequested && !cancelRequested) {
            Logger::warning("Interrupt received, cancelling plan " + plan.getId());
            cancelRequested = engine.cancel(plan.getId());
        }
    }

    auto execution = engine.getPlan(plan.getId());
    if (!execution) {
        return 1;
    }
    Logger::info("Plan " + plan.getId() + " finished: " + planStateToString(execution->state));
    return execution->state == PlanState::COMPLETED ? 0 : 1;
}

int verifyMain(int argc, char* argv[], const SyncConfig& config) {
    if (argc < 2) {
        std::cerr << "Error: verify requires a plan file" << std::endl;
        return 1;
    }

    PlanDocument document = loadPlanFile(argv[1], config.defaults);
    SyncEngine engine(createDefaultRegistry(config), config.progressQueueCapacity);
    SyncPlan plan = engine.createPlan(document.name, std::move(document.tasks));

    bool allValid = true;
    for (const auto& task : plan.tasks()) {
        json line = {{"task", task.name}, {"taskId", task.id}};
        try {
            VerifyResult result = engine.verifyTask(plan.getId(), task.id);
            line["result"] = result.toJson();
            allValid = allValid && result.isValid();
        } catch (const SyncError& e) {
            line["error"] = e.what();
            line["category"] = SyncError::categoryToString(e.getCategory());
            allValid = false;
        }
        printJsonLine(line);
    }
    return allValid ? 0 : 1;
}

int strategiesMain(const SyncConfig& config) {
    auto registry = createDefaultRegistry(config);
    for (const auto& capabilities : registry->getAllCapabilities()) {
        printJsonLine({
            {"name", capabilities.name},
            {"type", syncTypeToString(capabilities.type)},
            {"supportsIncremental", capabilities.supportsIncremental},
            {"supportsResume", capabilities.supportsResume},
        });
    }
    return 0;
}
