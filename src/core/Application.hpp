#pragma once

/**
 * Application.hpp
 *
 * Core application class that manages the lifecycle of the downloader.
 * Wires the transfer manager, the worker pool, the download driver and
 * post-processing together from the configuration.
 */

#include <memory>
#include <atomic>
#include <string>
#include <functional>
#include <vector>
#include <mutex>
#include <chrono>

namespace botarr::core::xdcc { class TransferManager; class DownloadDriver; }
namespace botarr::core::postprocess { class PostProcessor; }

namespace botarr::core {

class ThreadPool;

/**
 * Application state enum
 */
enum class AppState {
    Uninitialized,
    Initializing,
    Ready,
    ShuttingDown,
    Error
};

/**
 * Main application class
 *
 * Handles initialization, shutdown, and coordination of all subsystems.
 * Settings are read from Config once, in initialize().
 */
class Application {
public:
    /**
     * Constructor
     */
    Application();

    /**
     * Destructor
     */
    ~Application();

    // Disable copy and move
    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;
    Application(Application&&) = delete;
    Application& operator=(Application&&) = delete;

    /**
     * Initialize all application subsystems
     * @return true if initialization successful
     */
    bool initialize();

    /**
     * Cancel running transfers and shut the subsystems down
     * @param grace Time given to running attempts to stop
     */
    void shutdown(std::chrono::milliseconds grace = std::chrono::seconds(10));

    /**
     * Get current application state
     * @return Current AppState
     */
    AppState getState() const { return m_state.load(); }

    bool isRunning() const { return m_state.load() == AppState::Ready; }

    std::shared_ptr<xdcc::TransferManager> getTransferManager() const { return m_transferManager; }
    std::shared_ptr<xdcc::DownloadDriver> getDownloadDriver() const { return m_downloadDriver; }

    /**
     * Register state change callback
     * @param callback Function to call on state change
     */
    void onStateChange(std::function<void(AppState)> callback);

    /**
     * Get application version string
     * @return Version string
     */
    static std::string getVersion() { return "1.0.0"; }

    /**
     * Get application name
     * @return Application name
     */
    static std::string getName() { return "Botarr"; }

private:
    /**
     * Set application state and notify listeners
     * @param state New state
     */
    void setState(AppState state);

    bool initializeDownloads();
    bool initializePostProcessing();

private:
    // Application state
    std::atomic<AppState> m_state{AppState::Uninitialized};

    // State change callbacks
    std::vector<std::function<void(AppState)>> m_stateCallbacks;
    std::mutex m_callbackMutex;

    // Subsystems; shutdown() stops the pool before releasing the rest
    std::shared_ptr<xdcc::TransferManager> m_transferManager;
    std::shared_ptr<ThreadPool> m_threadPool;
    std::shared_ptr<xdcc::DownloadDriver> m_downloadDriver;
    std::shared_ptr<postprocess::PostProcessor> m_postProcessor;
};

} // namespace botarr::core
