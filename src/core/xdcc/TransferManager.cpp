/**
 * TransferManager.cpp
 */

#include "TransferManager.hpp"
#include "../Logger.hpp"
#include "../../utils/StringUtils.hpp"

#include <algorithm>
#include <filesystem>
#include <map>
#include <system_error>
#include <unordered_set>

namespace botarr::core::xdcc {

namespace fs = std::filesystem;
using utils::StringUtils;

TransferManager::TransferManager(std::string downloadDirectory, uint32_t maxRetries)
    : m_downloadDirectory(std::move(downloadDirectory))
    , m_maxRetries(maxRetries) {
}

CreatedTransfer TransferManager::createTransfer(const PackLocator& locator, TransferPriority priority) {
    std::string id = StringUtils::generateUUID();

    EnhancedTransfer enhanced(Transfer(id, locator));
    enhanced.priority = priority;
    enhanced.maxRetries = m_maxRetries;

    {
        std::lock_guard<std::mutex> lock(m_transfersMutex);
        m_transfers.emplace(id, std::move(enhanced));
    }

    CancellationHandlePtr handle = issueHandle(id);
    enqueue(id, priority);
    refreshQueuePositions();

    Logger::instance().info("Created transfer {} for {} (priority {})",
                            id, locator.toText(), toString(priority));
    return CreatedTransfer{id, handle};
}

void TransferManager::updateStatus(const std::string& id, TransferStatus status) {
    switch (status) {
        case TransferStatus::Completed:
            setCompleted(id);
            return;
        case TransferStatus::Cancelled:
            cancelTransfer(id);
            return;
        case TransferStatus::Failed: {
            std::optional<Transfer> failed;
            {
                std::lock_guard<std::mutex> lock(m_transfersMutex);
                auto it = m_transfers.find(id);
                if (it == m_transfers.end() || isTerminal(it->second.transfer.status)) {
                    return;
                }
                failed = it->second.transfer;
                m_transfers.erase(it);
            }
            if (!failed->error) {
                failed->error = "Failed";
            }
            finalizeFailure(std::move(*failed));
            return;
        }
        default:
            break;
    }

    {
        std::lock_guard<std::mutex> lock(m_transfersMutex);
        auto it = m_transfers.find(id);
        if (it == m_transfers.end()) {
            return;
        }
        Transfer& transfer = it->second.transfer;
        if (isTerminal(transfer.status)) {
            Logger::instance().debug("Ignoring status {} for finished transfer {}", toString(status), id);
            return;
        }
        transfer.status = status;
        transfer.updatedAt = std::chrono::system_clock::now();
    }

    if (status != TransferStatus::Pending) {
        dequeue(id);
        refreshQueuePositions();
    }
}

void TransferManager::updateProgress(const std::string& id, uint64_t downloaded, double speed) {
    std::lock_guard<std::mutex> lock(m_transfersMutex);
    auto it = m_transfers.find(id);
    if (it == m_transfers.end()) {
        return;
    }

    Transfer& transfer = it->second.transfer;
    transfer.downloaded = downloaded;
    transfer.speed = speed;
    if (transfer.size && *transfer.size > 0) {
        transfer.progress = static_cast<double>(downloaded) / static_cast<double>(*transfer.size) * 100.0;
    }
    transfer.updatedAt = std::chrono::system_clock::now();
}

void TransferManager::setFileInfo(const std::string& id, const std::string& filename, uint64_t size) {
    std::lock_guard<std::mutex> lock(m_transfersMutex);
    auto it = m_transfers.find(id);
    if (it == m_transfers.end()) {
        return;
    }
    it->second.transfer.filename = filename;
    it->second.transfer.size = size;
    it->second.transfer.updatedAt = std::chrono::system_clock::now();
}

std::optional<RetryDirective> TransferManager::setFailed(const std::string& id,
                                                         const std::string& error,
                                                         bool fatal) {
    std::optional<PackLocator> retryLocator;
    std::optional<Transfer> failed;
    TransferPriority priority = TransferPriority::Normal;

    {
        std::lock_guard<std::mutex> lock(m_transfersMutex);
        auto it = m_transfers.find(id);
        if (it != m_transfers.end()) {
            EnhancedTransfer& enhanced = it->second;
            Transfer& transfer = enhanced.transfer;

            if (transfer.status == TransferStatus::Cancelled) {
                Logger::instance().debug("Ignoring failure of cancelled transfer {}: {}", id, error);
                return std::nullopt;
            }

            if (!fatal && enhanced.canRetry()) {
                ++enhanced.retryCount;
                transfer.status = TransferStatus::Pending;
                transfer.error.reset();
                // downloaded/progress stay for the resume
                transfer.speed = 0.0;
                transfer.updatedAt = std::chrono::system_clock::now();
                priority = enhanced.priority;
                retryLocator = transfer.locator;

                Logger::instance().info("Transfer {} failed (retryable), will retry (attempt {}/{}): {}",
                                        id, enhanced.retryCount, enhanced.maxRetries, error);
            } else {
                transfer.status = TransferStatus::Failed;
                transfer.error = error;
                transfer.updatedAt = std::chrono::system_clock::now();
                failed = transfer;
                m_transfers.erase(it);
            }
        }
    }

    if (retryLocator) {
        CancellationHandlePtr handle = issueHandle(id);
        enqueue(id, priority);
        // A cancel between the reset and issueHandle() only saw the previous handle
        if (!isPending(id)) {
            Logger::instance().info("Transfer {} was cancelled before its retry", id);
            disarmRetry(id, handle);
            return std::nullopt;
        }
        refreshQueuePositions();
        return RetryDirective{*retryLocator, handle};
    }

    if (failed) {
        Logger::instance().error("Transfer {} failed: {}", id, error);
        finalizeFailure(std::move(*failed));
    } else {
        releaseHandle(id);
        dequeue(id);
    }
    return std::nullopt;
}

bool TransferManager::retryTransfer(const std::string& id) {
    TransferPriority priority;
    {
        std::lock_guard<std::mutex> lock(m_transfersMutex);
        auto it = m_transfers.find(id);
        if (it == m_transfers.end() || !it->second.canRetry()) {
            return false;
        }

        EnhancedTransfer& enhanced = it->second;
        ++enhanced.retryCount;
        enhanced.transfer.status = TransferStatus::Pending;
        enhanced.transfer.error.reset();
        enhanced.transfer.speed = 0.0;
        enhanced.transfer.updatedAt = std::chrono::system_clock::now();
        priority = enhanced.priority;

        Logger::instance().info("Manual retry of transfer {} (attempt {}/{})",
                                id, enhanced.retryCount, enhanced.maxRetries);
    }

    enqueue(id, priority);
    if (!isPending(id)) {
        dequeue(id);
        refreshQueuePositions();
        return false;
    }
    refreshQueuePositions();
    return true;
}

CancellationHandlePtr TransferManager::renewCancellationHandle(const std::string& id) {
    {
        std::lock_guard<std::mutex> lock(m_transfersMutex);
        auto it = m_transfers.find(id);
        if (it == m_transfers.end() || isTerminal(it->second.transfer.status)) {
            return nullptr;
        }
    }

    auto handle = std::make_shared<CancellationHandle>();
    CancellationHandlePtr previous;
    {
        std::lock_guard<std::mutex> lock(m_handlesMutex);
        auto& slot = m_handles[id];
        previous = std::move(slot);
        slot = handle;
    }

    if (previous) {
        previous->cancel();
    }

    bool active = false;
    {
        std::lock_guard<std::mutex> lock(m_transfersMutex);
        auto it = m_transfers.find(id);
        active = it != m_transfers.end() && !isTerminal(it->second.transfer.status);
    }
    if (!active) {
        disarmRetry(id, handle);
        return nullptr;
    }
    return handle;
}

void TransferManager::setCompleted(const std::string& id) {
    std::optional<Transfer> completed;
    {
        std::lock_guard<std::mutex> lock(m_transfersMutex);
        auto it = m_transfers.find(id);
        if (it == m_transfers.end()) {
            return;
        }
        Transfer& transfer = it->second.transfer;
        if (transfer.status == TransferStatus::Cancelled) {
            Logger::instance().debug("Ignoring completion of cancelled transfer {}", id);
            return;
        }
        transfer.status = TransferStatus::Completed;
        transfer.progress = 100.0;
        transfer.updatedAt = std::chrono::system_clock::now();
        completed = transfer;
        m_transfers.erase(it);
    }

    releaseHandle(id);
    dequeue(id);

    recordBotSuccess(completed->locator, completed->size.value_or(completed->downloaded), completed->speed);
    appendHistory(*completed);
    updateAnalytics(*completed, true);
    refreshQueuePositions();

    Logger::instance().info("Transfer {} completed: {} ({})", id,
                            completed->filename.value_or("<unknown>"),
                            StringUtils::formatBytes(completed->size.value_or(completed->downloaded)));
}

bool TransferManager::cancelTransfer(const std::string& id) {
    std::optional<TransferStatus> status;
    {
        std::lock_guard<std::mutex> lock(m_transfersMutex);
        auto it = m_transfers.find(id);
        if (it != m_transfers.end()) {
            status = it->second.transfer.status;
        }
    }

    if (!status) {
        return false;
    }
    if (isTerminal(*status)) {
        return removeTransfer(id);
    }

    bool found = false;
    {
        std::lock_guard<std::mutex> lock(m_transfersMutex);
        auto it = m_transfers.find(id);
        if (it != m_transfers.end()) {
            found = true;
            if (!isTerminal(it->second.transfer.status)) {
                it->second.transfer.status = TransferStatus::Cancelled;
                it->second.transfer.speed = 0.0;
                it->second.transfer.updatedAt = std::chrono::system_clock::now();
            }
        }
    }

    // Released after the status change: a retry that issues a handle later sees Cancelled
    if (auto handle = releaseHandle(id)) {
        handle->cancel();
        Logger::instance().info("Cancelled download task for {}", id);
    }

    dequeue(id);
    refreshQueuePositions();
    return found;
}

bool TransferManager::setPriority(const std::string& id, TransferPriority priority) {
    bool pending = false;
    {
        std::lock_guard<std::mutex> lock(m_transfersMutex);
        auto it = m_transfers.find(id);
        if (it == m_transfers.end()) {
            return false;
        }
        it->second.priority = priority;
        pending = it->second.transfer.status == TransferStatus::Pending;
    }

    if (pending) {
        dequeue(id);
        enqueue(id, priority);
        refreshQueuePositions();
    }
    return true;
}

std::optional<EnhancedTransfer> TransferManager::getTransfer(const std::string& id) const {
    std::lock_guard<std::mutex> lock(m_transfersMutex);
    auto it = m_transfers.find(id);
    if (it == m_transfers.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<EnhancedTransfer> TransferManager::listTransfers() const {
    std::vector<EnhancedTransfer> list;
    {
        std::lock_guard<std::mutex> lock(m_transfersMutex);
        list.reserve(m_transfers.size());
        for (const auto& [id, transfer] : m_transfers) {
            list.push_back(transfer);
        }
    }

    std::sort(list.begin(), list.end(), [](const EnhancedTransfer& a, const EnhancedTransfer& b) {
        return a.transfer.createdAt > b.transfer.createdAt;
    });
    return list;
}

std::vector<Transfer> TransferManager::getHistory(size_t limit) const {
    std::lock_guard<std::mutex> lock(m_historyMutex);
    std::vector<Transfer> result;
    for (auto it = m_history.rbegin(); it != m_history.rend() && result.size() < limit; ++it) {
        result.push_back(*it);
    }
    return result;
}

DownloadAnalytics TransferManager::getAnalytics() const {
    DownloadAnalytics analytics;
    {
        std::lock_guard<std::mutex> lock(m_analyticsMutex);
        analytics = m_analytics;
    }

    // Derived from the bot statistics at read time
    auto stats = getAllBotStats();
    if (!stats.empty()) {
        analytics.mostReliableBot = stats.front().botName;

        std::map<std::string, uint64_t> attemptsByNetwork;
        for (const auto& bot : stats) {
            attemptsByNetwork[bot.network] += bot.totalDownloads;
        }
        auto busiest = std::max_element(attemptsByNetwork.begin(), attemptsByNetwork.end(),
            [](const auto& a, const auto& b) { return a.second < b.second; });
        analytics.mostActiveNetwork = busiest->first;
    }
    return analytics;
}

std::vector<BotStats> TransferManager::getAllBotStats() const {
    std::vector<BotStats> stats;
    {
        std::lock_guard<std::mutex> lock(m_botStatsMutex);
        stats.reserve(m_botStats.size());
        for (const auto& [key, bot] : m_botStats) {
            stats.push_back(bot);
        }
    }

    auto now = std::chrono::system_clock::now();
    for (auto& bot : stats) {
        bot.refreshReliability(now);
    }

    std::sort(stats.begin(), stats.end(), [](const BotStats& a, const BotStats& b) {
        if (a.reliabilityScore != b.reliabilityScore) {
            return a.reliabilityScore > b.reliabilityScore;
        }
        return a.botName + "@" + a.network < b.botName + "@" + b.network;
    });
    return stats;
}

size_t TransferManager::queueSize() const {
    std::lock_guard<std::mutex> lock(m_transfersMutex);
    return static_cast<size_t>(std::count_if(m_transfers.begin(), m_transfers.end(),
        [](const auto& entry) { return entry.second.transfer.status == TransferStatus::Pending; }));
}

std::vector<std::string> TransferManager::queuedIds() const {
    std::lock_guard<std::mutex> lock(m_queueMutex);
    std::vector<std::string> ids;
    ids.reserve(m_queue.size());
    for (const auto& entry : m_queue) {
        ids.push_back(entry.id);
    }
    return ids;
}

bool TransferManager::deleteHistoryItem(const std::string& id, bool deleteFile) {
    Logger::instance().info("Deleting history item {} (delete file: {})", id, deleteFile);

    std::optional<Transfer> item;
    {
        std::lock_guard<std::mutex> lock(m_historyMutex);
        auto it = std::find_if(m_history.begin(), m_history.end(),
                               [&id](const Transfer& t) { return t.id == id; });
        if (it == m_history.end()) {
            Logger::instance().warn("History item {} not found", id);
            return false;
        }
        item = *it;
        m_history.erase(it);
    }

    if (deleteFile) {
        if (!item->filename) {
            Logger::instance().warn("No filename present for history item {}", id);
            return true;
        }

        fs::path path = fs::path(m_downloadDirectory) / StringUtils::sanitizeFileName(*item->filename);
        std::error_code ec;
        if (fs::remove(path, ec)) {
            Logger::instance().info("Deleted file {}", path.string());
        } else if (ec) {
            Logger::instance().error("Failed to delete file {}: {}", path.string(), ec.message());
        } else {
            Logger::instance().warn("File not found for deletion: {}", path.string());
        }
    }
    return true;
}

bool TransferManager::removeTransfer(const std::string& id) {
    bool removed = false;
    {
        std::lock_guard<std::mutex> lock(m_transfersMutex);
        removed = m_transfers.erase(id) > 0;
    }

    if (removed) {
        releaseHandle(id);
        dequeue(id);
        refreshQueuePositions();
        Logger::instance().info("Removed transfer {}", id);
    }
    return removed;
}

// -- Queue --

void TransferManager::enqueue(const std::string& id, TransferPriority priority) {
    std::lock_guard<std::mutex> lock(m_queueMutex);

    m_queue.erase(std::remove_if(m_queue.begin(), m_queue.end(),
                                 [&id](const QueueEntry& entry) { return entry.id == id; }),
                  m_queue.end());

    // After every entry of the same or higher priority
    auto position = std::find_if(m_queue.begin(), m_queue.end(), [priority](const QueueEntry& entry) {
        return entry.priority < priority;
    });
    m_queue.insert(position, QueueEntry{id, priority, m_nextSequence++});
}

void TransferManager::dequeue(const std::string& id) {
    std::lock_guard<std::mutex> lock(m_queueMutex);
    m_queue.erase(std::remove_if(m_queue.begin(), m_queue.end(),
                                 [&id](const QueueEntry& entry) { return entry.id == id; }),
                  m_queue.end());
}

void TransferManager::refreshQueuePositions() {
    std::unordered_map<std::string, size_t> positions;
    {
        std::lock_guard<std::mutex> lock(m_queueMutex);
        for (size_t i = 0; i < m_queue.size(); ++i) {
            positions[m_queue[i].id] = i + 1;
        }
    }

    std::lock_guard<std::mutex> lock(m_transfersMutex);
    for (auto& [id, transfer] : m_transfers) {
        auto it = positions.find(id);
        if (it != positions.end()) {
            transfer.queuePosition = it->second;
        } else {
            transfer.queuePosition.reset();
        }
    }
}

// -- Handles --

CancellationHandlePtr TransferManager::releaseHandle(const std::string& id) {
    std::lock_guard<std::mutex> lock(m_handlesMutex);
    auto it = m_handles.find(id);
    if (it == m_handles.end()) {
        return nullptr;
    }
    CancellationHandlePtr handle = std::move(it->second);
    m_handles.erase(it);
    return handle;
}

CancellationHandlePtr TransferManager::issueHandle(const std::string& id) {
    auto handle = std::make_shared<CancellationHandle>();
    std::lock_guard<std::mutex> lock(m_handlesMutex);
    m_handles[id] = handle;
    return handle;
}

void TransferManager::disarmRetry(const std::string& id, const CancellationHandlePtr& handle) {
    handle->cancel();
    {
        std::lock_guard<std::mutex> lock(m_handlesMutex);
        auto it = m_handles.find(id);
        if (it != m_handles.end() && it->second == handle) {
            m_handles.erase(it);
        }
    }
    dequeue(id);
    refreshQueuePositions();
}

bool TransferManager::isPending(const std::string& id) const {
    std::lock_guard<std::mutex> lock(m_transfersMutex);
    auto it = m_transfers.find(id);
    return it != m_transfers.end() && it->second.transfer.status == TransferStatus::Pending;
}

// -- Terminal bookkeeping --

void TransferManager::finalizeFailure(Transfer transfer) {
    const std::string id = transfer.id;

    releaseHandle(id);
    dequeue(id);

    recordBotFailure(transfer.locator);
    appendHistory(transfer);
    updateAnalytics(transfer, false);
    refreshQueuePositions();
}

void TransferManager::appendHistory(const Transfer& transfer) {
    std::lock_guard<std::mutex> lock(m_historyMutex);
    m_history.push_back(transfer);
    while (m_history.size() > kMaxHistory) {
        m_history.pop_front();
    }
}

void TransferManager::recordBotSuccess(const PackLocator& locator, uint64_t bytes, double speed) {
    std::lock_guard<std::mutex> lock(m_botStatsMutex);
    auto it = m_botStats.try_emplace(locator.botKey(), locator.bot(), locator.network()).first;
    it->second.recordSuccess(bytes, speed);
}

void TransferManager::recordBotFailure(const PackLocator& locator) {
    std::lock_guard<std::mutex> lock(m_botStatsMutex);
    auto it = m_botStats.try_emplace(locator.botKey(), locator.bot(), locator.network()).first;
    it->second.recordFailure();
}

void TransferManager::updateAnalytics(const Transfer& transfer, bool success) {
    std::lock_guard<std::mutex> lock(m_analyticsMutex);

    ++m_analytics.totalDownloads;
    if (!success) {
        ++m_analytics.failedDownloads;
        return;
    }

    ++m_analytics.successfulDownloads;
    m_analytics.totalBytesDownloaded += transfer.size.value_or(transfer.downloaded);

    // The first successful sample initializes the average
    if (m_analytics.successfulDownloads == 1 || m_analytics.averageDownloadSpeed == 0.0) {
        m_analytics.averageDownloadSpeed = transfer.speed;
    } else {
        m_analytics.averageDownloadSpeed = m_analytics.averageDownloadSpeed * 0.9 + transfer.speed * 0.1;
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(transfer.updatedAt - transfer.createdAt);
    if (elapsed.count() > 0) {
        m_analytics.totalDownloadTimeSeconds += static_cast<uint64_t>(elapsed.count());
    }
}

} // namespace botarr::core::xdcc
