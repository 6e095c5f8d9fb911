#pragma once

/**
 * XdccError.hpp
 *
 * Error kinds raised by the XDCC layer and their retry classification.
 */

#include <stdexcept>
#include <string>

namespace botarr::core::xdcc {

/**
 * Error kind enumeration
 */
enum class ErrorKind {
    InvalidUrl,
    ConnectionFailed,
    ChannelJoinFailed,
    TransferFailed,
    SearchFailed,
    Timeout,
    BotBusy,
    InvalidPack
};

/**
 * Human readable label ("Connection failed", "Invalid pack", ...)
 */
std::string errorKindLabel(ErrorKind kind);

/**
 * Whether an error of this kind must not be retried.
 *
 * Fatal: InvalidUrl, InvalidPack, BotBusy, ChannelJoinFailed, SearchFailed.
 * Retryable: ConnectionFailed, Timeout, TransferFailed.
 */
bool isFatal(ErrorKind kind);

/**
 * XdccError - exception carrying an error kind and its detail text.
 * what() renders as "<label>: <detail>".
 */
class XdccError : public std::runtime_error {
public:
    XdccError(ErrorKind kind, const std::string& detail);

    ErrorKind kind() const { return m_kind; }
    const std::string& detail() const { return m_detail; }
    bool isFatal() const { return xdcc::isFatal(m_kind); }

private:
    ErrorKind m_kind;
    std::string m_detail;
};

} // namespace botarr::core::xdcc
