#pragma once

/**
 * DownloadDriver.hpp
 *
 * Runs protocol sessions on the thread pool and feeds their events into
 * the TransferManager.
 */

#include "PackLocator.hpp"
#include "SessionEvents.hpp"
#include "TransferManager.hpp"
#include "XdccSettings.hpp"
#include "../ThreadPool.hpp"

#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

namespace botarr::core::xdcc {

/**
 * Called after a transfer completed
 */
using CompletionHook = std::function<void(const std::string& id, const std::filesystem::path& file)>;

/**
 * DownloadDriver - one ThreadPool task per attempt.
 *
 * Each attempt runs its ProtocolSession on a producer thread and consumes
 * the session events in order. A retry directive from the manager is
 * honored after a fixed backoff that cancellation interrupts.
 */
class DownloadDriver {
public:
    static constexpr std::chrono::seconds kDefaultRetryDelay{5};
    static constexpr std::chrono::milliseconds kEventPollInterval{250};

    /**
     * @param manager Transfer state owner
     * @param pool Pool the attempts run on
     * @param settings Session settings shared by every attempt
     * @param retryDelay Backoff before a retried attempt
     */
    DownloadDriver(TransferManager& manager,
                   ThreadPool& pool,
                   XdccSettings settings,
                   std::chrono::milliseconds retryDelay = kDefaultRetryDelay);

    ~DownloadDriver();

    DownloadDriver(const DownloadDriver&) = delete;
    DownloadDriver& operator=(const DownloadDriver&) = delete;

    void setCompletionHook(CompletionHook hook);

    /**
     * Create a transfer and dispatch its first attempt
     * @return Transfer id
     */
    std::string start(const PackLocator& locator, TransferPriority priority = TransferPriority::Normal);

    /**
     * Manual retry of an active transfer
     * @return false if the manager rejected the retry
     */
    bool retry(const std::string& id);

    bool cancel(const std::string& id);

    /**
     * Cancel every non-terminal transfer
     * @return Number of transfers cancelled
     */
    size_t cancelAll();

    /**
     * Wait until no attempt is running or waiting for its backoff
     * @return false on timeout
     */
    bool waitForAll(std::chrono::milliseconds timeout);

    /**
     * Attempts running or waiting for a retry
     */
    size_t outstanding() const;

private:
    void dispatch(const std::string& id, const PackLocator& locator, CancellationHandlePtr handle);
    void runAttempt(const std::string& id, const PackLocator& locator, const CancellationHandlePtr& handle);
    std::optional<RetryDirective> consumeEvents(const std::string& id,
                                                EventQueue& queue,
                                                const CancellationHandlePtr& handle);
    void runCompletionHook(const std::string& id, const std::filesystem::path& file);
    void finishAttempt();

private:
    TransferManager& m_manager;
    ThreadPool& m_pool;
    XdccSettings m_settings;
    std::chrono::milliseconds m_retryDelay;

    std::mutex m_hookMutex;
    CompletionHook m_completionHook;

    mutable std::mutex m_outstandingMutex;
    std::condition_variable m_outstandingCondition;
    size_t m_outstanding{0};
};

} // namespace botarr::core::xdcc
