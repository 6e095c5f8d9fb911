#pragma once

/**
 * TransferManager.hpp
 *
 * Authoritative state of every XDCC transfer: active records, the pending
 * queue, retry policy, bot statistics, bounded history and analytics.
 */

#include "PackLocator.hpp"
#include "SessionEvents.hpp"
#include "TransferModels.hpp"

#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace botarr::core::xdcc {

/**
 * Returned by setFailed() when the transfer should be attempted again
 */
struct RetryDirective {
    PackLocator locator;
    CancellationHandlePtr handle;
};

/**
 * Returned by createTransfer()
 */
struct CreatedTransfer {
    std::string id;
    CancellationHandlePtr handle;
};

/**
 * TransferManager - transfer orchestration
 *
 * Each collection has its own mutex and no operation holds two of them at
 * once. The manager never schedules work itself; retries are handed back to
 * the caller as a RetryDirective.
 */
class TransferManager {
public:
    static constexpr size_t kMaxHistory = 50;

    /**
     * @param downloadDirectory Directory used by deleteHistoryItem()
     * @param maxRetries Retry limit given to new transfers
     */
    explicit TransferManager(std::string downloadDirectory = "downloads",
                             uint32_t maxRetries = EnhancedTransfer::kDefaultMaxRetries);

    TransferManager(const TransferManager&) = delete;
    TransferManager& operator=(const TransferManager&) = delete;

    /**
     * Create a Pending transfer and queue it
     * @return New id and the cancellation handle of its first attempt
     */
    CreatedTransfer createTransfer(const PackLocator& locator,
                                   TransferPriority priority = TransferPriority::Normal);

    /**
     * Set the status of an active transfer. Completed, Failed and Cancelled
     * finalize the record like setCompleted(), a fatal setFailed() and
     * cancelTransfer() respectively.
     */
    void updateStatus(const std::string& id, TransferStatus status);

    void updateProgress(const std::string& id, uint64_t downloaded, double speed);
    void setFileInfo(const std::string& id, const std::string& filename, uint64_t size);

    /**
     * Retry decision point.
     * @param fatal Errors that cannot succeed on retry skip the retry budget
     * @return A directive when the transfer was re-queued for another attempt
     */
    std::optional<RetryDirective> setFailed(const std::string& id, const std::string& error, bool fatal);

    /**
     * Manual retry; rejected for unknown ids or an exhausted retry budget
     */
    bool retryTransfer(const std::string& id);

    /**
     * Cancel the current handle of an active transfer and issue a new one
     * @return The new handle, nullptr when the transfer is not active
     */
    CancellationHandlePtr renewCancellationHandle(const std::string& id);

    void setCompleted(const std::string& id);

    /**
     * Active transfer: signal its handle and mark it Cancelled.
     * Terminal transfer: remove it.
     * @return false if the id is unknown
     */
    bool cancelTransfer(const std::string& id);

    bool setPriority(const std::string& id, TransferPriority priority);

    std::optional<EnhancedTransfer> getTransfer(const std::string& id) const;

    /**
     * Active transfers, newest first
     */
    std::vector<EnhancedTransfer> listTransfers() const;

    /**
     * Finished transfers, newest first
     */
    std::vector<Transfer> getHistory(size_t limit = kMaxHistory) const;

    DownloadAnalytics getAnalytics() const;

    /**
     * Bot statistics by descending reliability, scores refreshed to now
     */
    std::vector<BotStats> getAllBotStats() const;

    /**
     * Number of Pending transfers
     */
    size_t queueSize() const;

    /**
     * Ids of queued transfers in dispatch order
     */
    std::vector<std::string> queuedIds() const;

    /**
     * Remove a history entry, optionally deleting its downloaded file
     */
    bool deleteHistoryItem(const std::string& id, bool deleteFile);

    /**
     * Hard delete from the active set, the queue and the handle table
     */
    bool removeTransfer(const std::string& id);

    const std::string& downloadDirectory() const { return m_downloadDirectory; }

private:
    struct QueueEntry {
        std::string id;
        TransferPriority priority;
        uint64_t sequence;
    };

    void enqueue(const std::string& id, TransferPriority priority);
    void dequeue(const std::string& id);
    void refreshQueuePositions();

    CancellationHandlePtr releaseHandle(const std::string& id);
    CancellationHandlePtr issueHandle(const std::string& id);

    /**
     * Undo a retry armed while cancelTransfer() ran on another thread.
     * Only removes the handle table entry when it is still @p handle.
     */
    void disarmRetry(const std::string& id, const CancellationHandlePtr& handle);

    bool isPending(const std::string& id) const;

    /**
     * Terminal failure bookkeeping for a record already removed from the active set
     */
    void finalizeFailure(Transfer transfer);

    void appendHistory(const Transfer& transfer);
    void recordBotSuccess(const PackLocator& locator, uint64_t bytes, double speed);
    void recordBotFailure(const PackLocator& locator);
    void updateAnalytics(const Transfer& transfer, bool success);

private:
    std::string m_downloadDirectory;
    uint32_t m_maxRetries;

    mutable std::mutex m_transfersMutex;
    std::unordered_map<std::string, EnhancedTransfer> m_transfers;

    mutable std::mutex m_handlesMutex;
    std::unordered_map<std::string, CancellationHandlePtr> m_handles;

    mutable std::mutex m_queueMutex;
    std::vector<QueueEntry> m_queue;
    uint64_t m_nextSequence{0};

    mutable std::mutex m_botStatsMutex;
    std::unordered_map<std::string, BotStats> m_botStats;

    mutable std::mutex m_historyMutex;
    std::deque<Transfer> m_history;

    mutable std::mutex m_analyticsMutex;
    DownloadAnalytics m_analytics;
};

} // namespace botarr::core::xdcc
