#include "common/Logger.h"
#include "common/Config.h"
#include "common/PathUtils.h"
#include "engine/AllocationEngine.h"

#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

using namespace capflow;

namespace {

const char* kKeeperCaller = "keeper";

// Global engine instance for Ctrl+C shutdown.
std::unique_ptr<engine::AllocationEngine> g_engine;

void signalHandler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        LOG_INFO("Shutdown signal received");
        if (g_engine) {
            g_engine->stop();
        }
    }
}

void printUsage() {
    std::cout << "Usage: capflow [--config PATH] [--cycles N] [--interval SECONDS]\n";
    std::cout << "  --config    engine config (default: config/capflow.json)\n";
    std::cout << "  --cycles    stop after N keeper cycles (default: run until Ctrl+C)\n";
    std::cout << "  --interval  override engine.cycle_interval_seconds\n";
}

void printSummary(const engine::AllocationEngine& engine) {
    std::cout << "\n[Allocation summary]\n";
    for (const auto& asset : engine.ledger().assets()) {
        const auto a = engine.analytics(asset);
        std::cout << asset << ": total=" << a.total_deposited
                  << " utilized=" << a.total_utilized
                  << " idle=" << a.idle_capital
                  << " unallocated=" << a.unallocated
                  << " yield=" << a.weighted_yield_bps << "bps"
                  << " reallocations=" << a.completed_reallocations
                  << "/" << (a.completed_reallocations + a.failed_reallocations)
                  << " journal_events=" << engine.auditTrail(asset).size() << "\n";
        const auto entry = engine.ledger().snapshot(asset);
        if (entry) {
            for (const auto& [venue, amount] : entry->per_venue_balance) {
                std::cout << "  " << venue << " = " << amount << "\n";
            }
        }
    }
}

}

int main(int argc, char* argv[]) {
    std::string config_path = "config/capflow.json";
    int max_cycles = 0;
    int interval_override = 0;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            printUsage();
            return 0;
        }
        if ((arg == "--config" || arg == "--cycles" || arg == "--interval") && i + 1 >= argc) {
            std::cerr << "Missing value for " << arg << "\n";
            printUsage();
            return 1;
        }
        try {
            if (arg == "--config") {
                config_path = argv[++i];
            } else if (arg == "--cycles") {
                max_cycles = std::stoi(argv[++i]);
            } else if (arg == "--interval") {
                interval_override = std::stoi(argv[++i]);
            } else {
                std::cerr << "Unknown argument: " << arg << "\n";
                printUsage();
                return 1;
            }
        } catch (const std::exception& e) {
            std::cerr << "Invalid value for " << arg << ": " << e.what() << "\n";
            return 1;
        }
    }

    try {
        auto& config = Config::getInstance();
        if (!config.load(config_path)) {
            std::cerr << "Config could not be parsed: " << config_path << "\n";
            return 1;
        }

        Logger::getInstance().initialize(utils::PathUtils::resolveStatePath(config.getLogDir()), config.getLogLevel());

        auto engine_config = config.getEngineConfig();
        if (interval_override > 0) {
            engine_config.cycle_interval_seconds = interval_override;
        }
        engine_config.journal_path = utils::PathUtils::resolveStatePath(engine_config.journal_path);
        engine_config.strategy_store_path = utils::PathUtils::resolveStatePath(engine_config.strategy_store_path);

        LOG_INFO("========================================");
        LOG_INFO("capflow allocation keeper - {} mode",
                 engine_config.mode == engine::EngineMode::LIVE ? "LIVE" : "PAPER");
        LOG_INFO("========================================");

        if (engine_config.mode == engine::EngineMode::LIVE) {
            LOG_ERROR("LIVE mode needs venue adapters registered by an embedding process");
            std::cout << "LIVE mode is not available from the standalone keeper.\n";
            return 1;
        }

        g_engine = std::make_unique<engine::AllocationEngine>(engine_config);
        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);

        if (!g_engine->start(kKeeperCaller, max_cycles)) {
            LOG_ERROR("Keeper loop failed to start");
            return 1;
        }

        std::cout << "Keeper running. Press Ctrl+C to stop.\n";
        while (g_engine->isRunning()) {
            std::this_thread::sleep_for(std::chrono::seconds(1));
        }
        g_engine->stop();

        printSummary(*g_engine);
        g_engine.reset();
        LOG_INFO("Program terminated");
        return 0;
    } catch (const std::exception& e) {
        LOG_ERROR("Fatal error: {}", e.what());
        std::cerr << "\nFatal error: " << e.what() << std::endl;
        return 1;
    }
}
