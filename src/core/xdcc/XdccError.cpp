/**
 * XdccError.cpp
 */

#include "XdccError.hpp"

namespace botarr::core::xdcc {

std::string errorKindLabel(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::InvalidUrl:        return "Invalid URL";
        case ErrorKind::ConnectionFailed:  return "Connection failed";
        case ErrorKind::ChannelJoinFailed: return "Channel join failed";
        case ErrorKind::TransferFailed:    return "Transfer failed";
        case ErrorKind::SearchFailed:      return "Search failed";
        case ErrorKind::Timeout:           return "Timeout";
        case ErrorKind::BotBusy:           return "Bot busy";
        case ErrorKind::InvalidPack:       return "Invalid pack";
    }
    return "Unknown error";
}

bool isFatal(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::ConnectionFailed:
        case ErrorKind::Timeout:
        case ErrorKind::TransferFailed:
            return false;
        default:
            return true;
    }
}

XdccError::XdccError(ErrorKind kind, const std::string& detail)
    : std::runtime_error(errorKindLabel(kind) + ": " + detail)
    , m_kind(kind)
    , m_detail(detail) {
}

} // namespace botarr::core::xdcc
