/**
 * Botarr - XDCC downloader
 *
 * Main entry point for the command line client.
 * Downloads every irc:// pack locator given on the command line and prints
 * a JSON summary of the results.
 *
 * @version 1.0.0
 * @license MIT
 */

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/Application.hpp"
#include "core/Config.hpp"
#include "core/Logger.hpp"
#include "core/xdcc/DownloadDriver.hpp"
#include "core/xdcc/PackLocator.hpp"
#include "core/xdcc/TransferManager.hpp"
#include "core/xdcc/XdccError.hpp"
#include "utils/PathUtils.hpp"

namespace fs = std::filesystem;

using botarr::core::Application;
using botarr::core::Config;
using botarr::core::Logger;
using namespace botarr::core::xdcc;

namespace {

std::atomic<bool> g_stopRequested{false};

/**
 * Signal handler for graceful shutdown
 */
void signalHandler(int) {
    g_stopRequested = true;
}

/**
 * Setup signal handlers for graceful shutdown
 */
void setupSignalHandlers() {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
#ifdef SIGPIPE
    std::signal(SIGPIPE, SIG_IGN);
#endif
}

struct Options {
    bool debug{false};
    std::string configPath;
    std::string outputDir;
    TransferPriority priority{TransferPriority::Normal};
    std::vector<std::string> urls;
};

void printUsage(const char* program) {
    std::cout << Application::getName() << " - XDCC downloader\n"
              << "\nUsage: " << program << " [options] <irc://network/channel/bot/slot>...\n"
              << "\nOptions:\n"
              << "  -d, --debug              Enable debug logging\n"
              << "  -c, --config <file>      Configuration file\n"
              << "  -o, --output <dir>       Download directory\n"
              << "  -p, --priority <level>   low, normal, high or urgent\n"
              << "  -h, --help               Show this help message\n"
              << "  -v, --version            Show version information\n"
              << std::endl;
}

/**
 * Load the configuration, creating it with defaults when missing
 * @return Message to log once the logger is up
 */
std::string loadConfiguration(const fs::path& configPath, bool& ok) {
    auto& config = Config::instance();
    ok = true;

    if (fs::exists(configPath)) {
        if (config.load(configPath.string())) {
            return "Configuration loaded from " + configPath.string();
        }
        ok = false;
        return "Invalid configuration file " + configPath.string();
    }

    config.setDefaults();
    if (config.save(configPath.string())) {
        return "Default configuration created at " + configPath.string();
    }
    return "Using default configuration, could not write " + configPath.string();
}

} // namespace

/**
 * Main application entry point
 */
int main(int argc, char* argv[]) {
    Options options;

    // Parse command line arguments
    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);

        auto nextValue = [&](const std::string& name) -> const char* {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << name << "\n";
                return nullptr;
            }
            return argv[++i];
        };

        if (arg == "--debug" || arg == "-d") {
            options.debug = true;
        } else if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else if (arg == "--version" || arg == "-v") {
            std::cout << Application::getName() << " v" << Application::getVersion() << std::endl;
            return 0;
        } else if (arg == "--config" || arg == "-c") {
            const char* value = nextValue(arg);
            if (!value) return 2;
            options.configPath = value;
        } else if (arg == "--output" || arg == "-o") {
            const char* value = nextValue(arg);
            if (!value) return 2;
            options.outputDir = value;
        } else if (arg == "--priority" || arg == "-p") {
            const char* value = nextValue(arg);
            if (!value) return 2;
            auto priority = parsePriority(value);
            if (!priority) {
                std::cerr << "Unknown priority: " << value << "\n";
                return 2;
            }
            options.priority = *priority;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << "\n";
            printUsage(argv[0]);
            return 2;
        } else {
            options.urls.push_back(arg);
        }
    }

    if (options.urls.empty()) {
        printUsage(argv[0]);
        return 2;
    }

    // Validate every locator before connecting anywhere
    std::vector<PackLocator> locators;
    for (const auto& url : options.urls) {
        try {
            locators.push_back(PackLocator::parse(url));
        } catch (const XdccError& e) {
            std::cerr << e.what() << "\n";
            return 2;
        }
    }

    fs::path configPath = options.configPath.empty()
        ? botarr::utils::PathUtils::getConfigPath()
        : fs::path(options.configPath);

    bool configOk = true;
    std::string configMessage = loadConfiguration(configPath, configOk);

    auto& config = Config::instance();
    if (!options.outputDir.empty()) {
        config.set("downloads.directory", options.outputDir);
    }

    // Initialize logger
    auto level = options.debug
        ? botarr::core::LogLevel::Debug
        : Logger::parseLevel(config.get<std::string>("logging.level", "info"));
    Logger::instance().initialize(level, botarr::utils::PathUtils::getLogsPath().string());

    auto& logger = Logger::instance();
    logger.info("{} v{} starting...", Application::getName(), Application::getVersion());
    if (configOk) {
        logger.info("{}", configMessage);
    } else {
        logger.critical("{}", configMessage);
        return 1;
    }

    setupSignalHandlers();

    try {
        Application app;
        if (!app.initialize()) {
            logger.critical("Failed to initialize application");
            return 1;
        }

        auto manager = app.getTransferManager();
        auto driver = app.getDownloadDriver();

        std::set<std::string> ids;
        for (const auto& locator : locators) {
            ids.insert(driver->start(locator, options.priority));
        }

        bool cancelled = false;
        while (!driver->waitForAll(std::chrono::milliseconds(200))) {
            if (g_stopRequested && !cancelled) {
                LOG_INFO("Interrupted, cancelling transfers...");
                driver->cancelAll();
                cancelled = true;
            }
        }

        nlohmann::json transfers = nlohmann::json::array();
        size_t completed = 0;
        for (const auto& transfer : manager->getHistory()) {
            if (ids.count(transfer.id) == 0) continue;
            if (transfer.status == TransferStatus::Completed) ++completed;
            transfers.push_back(transfer.toJson());
        }
        for (const auto& transfer : manager->listTransfers()) {
            if (ids.count(transfer.transfer.id) != 0) {
                transfers.push_back(transfer.toJson());
            }
        }

        nlohmann::json botStats = nlohmann::json::array();
        for (const auto& stats : manager->getAllBotStats()) {
            botStats.push_back(stats.toJson());
        }

        nlohmann::json summary = {
            {"transfers", transfers},
            {"analytics", manager->getAnalytics().toJson()},
            {"bot_stats", botStats}
        };
        std::cout << summary.dump(2) << std::endl;

        app.shutdown();

        LOG_INFO("{} finished: {}/{} completed", Application::getName(), completed, ids.size());
        return completed == ids.size() ? 0 : 1;

    } catch (const std::exception& e) {
        logger.critical("Unhandled exception: {}", e.what());
        return 1;
    }
}
