#pragma once

/**
 * TransferModels.hpp
 *
 * Transfer records, bot statistics and analytics kept by the TransferManager.
 * All of them serialize to JSON with snake_case keys.
 */

#include "PackLocator.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace botarr::core::xdcc {

using TimePoint = std::chrono::system_clock::time_point;

/**
 * Transfer status
 */
enum class TransferStatus {
    Pending,
    Connecting,
    Joining,
    Requesting,
    Downloading,
    Completed,
    Failed,
    Cancelled
};

std::string toString(TransferStatus status);

/**
 * Completed, Failed or Cancelled
 */
bool isTerminal(TransferStatus status);

/**
 * Transfer priority (higher value leaves the queue first)
 */
enum class TransferPriority {
    Low = 0,
    Normal = 1,
    High = 2,
    Urgent = 3
};

std::string toString(TransferPriority priority);

/**
 * Parse "low", "normal", "high" or "urgent" (case-insensitive)
 */
std::optional<TransferPriority> parsePriority(const std::string& text);

/**
 * One download, from request to terminal state
 */
struct Transfer {
    std::string id;
    PackLocator locator;
    TransferStatus status{TransferStatus::Pending};
    std::optional<std::string> filename;
    std::optional<uint64_t> size;
    uint64_t downloaded{0};
    double speed{0.0};      // bytes per second
    double progress{0.0};   // 0..100
    std::optional<std::string> error;
    TimePoint createdAt;
    TimePoint updatedAt;

    Transfer(std::string id, PackLocator locator);

    nlohmann::json toJson() const;
};

/**
 * Transfer plus its queueing and retry bookkeeping
 */
struct EnhancedTransfer {
    static constexpr uint32_t kDefaultMaxRetries = 3;

    Transfer transfer;
    TransferPriority priority{TransferPriority::Normal};
    uint32_t retryCount{0};
    uint32_t maxRetries{kDefaultMaxRetries};
    std::optional<size_t> queuePosition;  // 1-based while Pending

    explicit EnhancedTransfer(Transfer t) : transfer(std::move(t)) {}

    bool canRetry() const { return retryCount < maxRetries; }

    /**
     * Transfer fields flattened with the bookkeeping fields
     */
    nlohmann::json toJson() const;
};

/**
 * Per bot statistics, keyed by "bot@network"
 */
struct BotStats {
    std::string botName;
    std::string network;
    uint32_t totalDownloads{0};
    uint32_t successfulDownloads{0};
    uint32_t failedDownloads{0};
    uint64_t totalBytes{0};
    double averageSpeed{0.0};
    TimePoint lastSeen;
    double reliabilityScore{0.5};

    BotStats(std::string bot, std::string networkName);

    void recordSuccess(uint64_t bytes, double speed);
    void recordFailure();

    /**
     * success_rate * 0.7 + exp(-days_since_last_seen / 30) * 0.3,
     * 0.5 before any attempt.
     */
    double computeReliability(TimePoint now) const;
    void refreshReliability(TimePoint now) { reliabilityScore = computeReliability(now); }

    nlohmann::json toJson() const;
};

/**
 * Process wide download analytics
 */
struct DownloadAnalytics {
    uint64_t totalDownloads{0};
    uint64_t successfulDownloads{0};
    uint64_t failedDownloads{0};
    uint64_t totalBytesDownloaded{0};
    double averageDownloadSpeed{0.0};
    uint64_t totalDownloadTimeSeconds{0};
    std::optional<std::string> mostActiveNetwork;
    std::optional<std::string> mostReliableBot;

    nlohmann::json toJson() const;
};

} // namespace botarr::core::xdcc
