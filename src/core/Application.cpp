/**
 * Application.cpp
 *
 * Implementation of the core Application class.
 */

#include "Application.hpp"
#include "Logger.hpp"
#include "Config.hpp"
#include "ThreadPool.hpp"
#include "postprocess/PostProcessor.hpp"
#include "xdcc/DownloadDriver.hpp"
#include "xdcc/TransferManager.hpp"
#include "xdcc/XdccSettings.hpp"
#include "../utils/PathUtils.hpp"

#include <filesystem>

namespace botarr::core {

Application::Application() {
    Logger::instance().debug("Application instance created");
}

Application::~Application() {
    if (m_state != AppState::Uninitialized && m_state != AppState::ShuttingDown) {
        shutdown();
    }
    Logger::instance().debug("Application instance destroyed");
}

bool Application::initialize() {
    if (m_state != AppState::Uninitialized) {
        Logger::instance().warn("Application already initialized");
        return false;
    }

    setState(AppState::Initializing);
    Logger::instance().info("Initializing application...");

    auto startTime = std::chrono::steady_clock::now();

    if (!initializePostProcessing()) {
        Logger::instance().error("Failed to initialize post-processing");
        setState(AppState::Error);
        return false;
    }

    if (!initializeDownloads()) {
        Logger::instance().error("Failed to initialize downloads");
        setState(AppState::Error);
        return false;
    }

    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - startTime);
    Logger::instance().info("Application initialized in {}ms", duration.count());

    setState(AppState::Ready);
    return true;
}

void Application::shutdown(std::chrono::milliseconds grace) {
    if (m_state == AppState::ShuttingDown || m_state == AppState::Uninitialized) {
        return;
    }

    setState(AppState::ShuttingDown);
    Logger::instance().info("Shutting down application...");

    if (m_downloadDriver) {
        m_downloadDriver->cancelAll();
        if (!m_downloadDriver->waitForAll(grace)) {
            Logger::instance().warn("Transfers still stopping after {}ms", grace.count());
        }
    }

    // The pool joins its workers before the objects their tasks use go away
    m_threadPool.reset();
    m_downloadDriver.reset();
    m_postProcessor.reset();
    m_transferManager.reset();

    Logger::instance().info("Application shutdown complete");
    Logger::instance().flush();

    setState(AppState::Uninitialized);
}

void Application::onStateChange(std::function<void(AppState)> callback) {
    std::lock_guard<std::mutex> lock(m_callbackMutex);
    m_stateCallbacks.push_back(std::move(callback));
}

void Application::setState(AppState state) {
    m_state = state;

    std::lock_guard<std::mutex> lock(m_callbackMutex);
    for (const auto& callback : m_stateCallbacks) {
        try {
            callback(state);
        } catch (const std::exception& e) {
            Logger::instance().error("State callback error: {}", e.what());
        }
    }
}

bool Application::initializeDownloads() {
    try {
        auto& config = Config::instance();

        auto settings = xdcc::XdccSettings::fromConfig();
        auto directory = utils::PathUtils::resolveDownloadPath(settings.downloadDirectory);
        std::filesystem::create_directories(directory);
        settings.downloadDirectory = directory.string();

        int maxConcurrent = config.get<int>("downloads.maxConcurrent", 4);
        int maxRetries = config.get<int>("downloads.maxRetries", 3);
        int retryDelay = config.get<int>("downloads.retryDelay", 5);

        if (maxConcurrent < 1) maxConcurrent = 1;
        if (maxRetries < 0) maxRetries = 0;
        if (retryDelay < 0) retryDelay = 0;

        m_transferManager = std::make_shared<xdcc::TransferManager>(
            settings.downloadDirectory, static_cast<uint32_t>(maxRetries));
        m_threadPool = std::make_shared<ThreadPool>(static_cast<size_t>(maxConcurrent));
        m_downloadDriver = std::make_shared<xdcc::DownloadDriver>(
            *m_transferManager, *m_threadPool, settings, std::chrono::seconds(retryDelay));

        if (m_postProcessor->options().enabled()) {
            auto postProcessor = m_postProcessor;
            m_downloadDriver->setCompletionHook(
                [postProcessor](const std::string& id, const std::filesystem::path& file) {
                    auto result = postProcessor->process(file);
                    if (result.ok()) {
                        Logger::instance().info("Post-processing of {} done: {}", id, result.finalPath.string());
                    }
                });
        }

        Logger::instance().info("Downloads go to {} ({} concurrent, {} retries, {}s backoff)",
                                settings.downloadDirectory, maxConcurrent, maxRetries, retryDelay);
        return true;
    } catch (const std::exception& e) {
        Logger::instance().error("Download initialization error: {}", e.what());
        return false;
    }
}

bool Application::initializePostProcessing() {
    try {
        m_postProcessor = std::make_shared<postprocess::PostProcessor>(
            postprocess::PostProcessOptions::fromConfig());
        return true;
    } catch (const std::exception& e) {
        Logger::instance().error("Post-processing initialization error: {}", e.what());
        return false;
    }
}

} // namespace botarr::core
