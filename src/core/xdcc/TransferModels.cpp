/**
 * TransferModels.cpp
 */

#include "TransferModels.hpp"
#include "../../utils/StringUtils.hpp"

#include <algorithm>
#include <cmath>

namespace botarr::core::xdcc {

using json = nlohmann::json;
using utils::StringUtils;

namespace {

template<typename T>
json optionalToJson(const std::optional<T>& value) {
    return value ? json(*value) : json(nullptr);
}

} // namespace

std::string toString(TransferStatus status) {
    switch (status) {
        case TransferStatus::Pending:     return "pending";
        case TransferStatus::Connecting:  return "connecting";
        case TransferStatus::Joining:     return "joining";
        case TransferStatus::Requesting:  return "requesting";
        case TransferStatus::Downloading: return "downloading";
        case TransferStatus::Completed:   return "completed";
        case TransferStatus::Failed:      return "failed";
        case TransferStatus::Cancelled:   return "cancelled";
    }
    return "unknown";
}

bool isTerminal(TransferStatus status) {
    return status == TransferStatus::Completed ||
           status == TransferStatus::Failed ||
           status == TransferStatus::Cancelled;
}

std::string toString(TransferPriority priority) {
    switch (priority) {
        case TransferPriority::Low:    return "low";
        case TransferPriority::Normal: return "normal";
        case TransferPriority::High:   return "high";
        case TransferPriority::Urgent: return "urgent";
    }
    return "normal";
}

std::optional<TransferPriority> parsePriority(const std::string& text) {
    std::string lower = StringUtils::toLower(StringUtils::trim(text));
    if (lower == "low") return TransferPriority::Low;
    if (lower == "normal") return TransferPriority::Normal;
    if (lower == "high") return TransferPriority::High;
    if (lower == "urgent") return TransferPriority::Urgent;
    return std::nullopt;
}

// -- Transfer --

Transfer::Transfer(std::string transferId, PackLocator packLocator)
    : id(std::move(transferId))
    , locator(std::move(packLocator))
    , createdAt(std::chrono::system_clock::now())
    , updatedAt(createdAt) {
}

json Transfer::toJson() const {
    return {
        {"id", id},
        {"url", locator.toText()},
        {"locator", locator.toJson()},
        {"status", toString(status)},
        {"file_name", optionalToJson(filename)},
        {"size", optionalToJson(size)},
        {"downloaded", downloaded},
        {"speed", speed},
        {"progress", progress},
        {"error", optionalToJson(error)},
        {"created_at", StringUtils::formatTimestamp(createdAt)},
        {"updated_at", StringUtils::formatTimestamp(updatedAt)}
    };
}

json EnhancedTransfer::toJson() const {
    json j = transfer.toJson();
    j["priority"] = toString(priority);
    j["retry_count"] = retryCount;
    j["max_retries"] = maxRetries;
    j["queue_position"] = optionalToJson(queuePosition);
    return j;
}

// -- BotStats --

BotStats::BotStats(std::string bot, std::string networkName)
    : botName(std::move(bot))
    , network(std::move(networkName))
    , lastSeen(std::chrono::system_clock::now()) {
}

void BotStats::recordSuccess(uint64_t bytes, double speed) {
    ++totalDownloads;
    ++successfulDownloads;
    totalBytes += bytes;

    // Exponential moving average, the first sample initializes it
    if (successfulDownloads == 1 || averageSpeed == 0.0) {
        averageSpeed = speed;
    } else {
        averageSpeed = averageSpeed * 0.7 + speed * 0.3;
    }

    lastSeen = std::chrono::system_clock::now();
    refreshReliability(lastSeen);
}

void BotStats::recordFailure() {
    ++totalDownloads;
    ++failedDownloads;
    lastSeen = std::chrono::system_clock::now();
    refreshReliability(lastSeen);
}

double BotStats::computeReliability(TimePoint now) const {
    if (totalDownloads == 0) {
        return 0.5;
    }

    double successRate = static_cast<double>(successfulDownloads) / static_cast<double>(totalDownloads);

    auto hours = std::chrono::duration_cast<std::chrono::hours>(now - lastSeen).count();
    double days = static_cast<double>(std::max<int64_t>(hours, 0) / 24);
    double recency = std::exp(-days / 30.0);

    return std::clamp(successRate * 0.7 + recency * 0.3, 0.0, 1.0);
}

json BotStats::toJson() const {
    return {
        {"bot_name", botName},
        {"network", network},
        {"total_downloads", totalDownloads},
        {"successful_downloads", successfulDownloads},
        {"failed_downloads", failedDownloads},
        {"total_bytes", totalBytes},
        {"average_speed", averageSpeed},
        {"last_seen", StringUtils::formatTimestamp(lastSeen)},
        {"reliability_score", reliabilityScore}
    };
}

// -- DownloadAnalytics --

json DownloadAnalytics::toJson() const {
    return {
        {"total_downloads", totalDownloads},
        {"successful_downloads", successfulDownloads},
        {"failed_downloads", failedDownloads},
        {"total_bytes_downloaded", totalBytesDownloaded},
        {"average_download_speed", averageDownloadSpeed},
        {"total_download_time_seconds", totalDownloadTimeSeconds},
        {"most_active_network", optionalToJson(mostActiveNetwork)},
        {"most_reliable_bot", optionalToJson(mostReliableBot)}
    };
}

} // namespace botarr::core::xdcc
