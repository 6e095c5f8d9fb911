#pragma once

/**
 * Ctcp.hpp
 *
 * Parsing and formatting of the CTCP DCC payloads used by XDCC bots:
 * DCC SEND, DCC RESUME and DCC ACCEPT.
 */

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace botarr::core::xdcc {

/**
 * File offer announced by a bot via DCC SEND
 */
struct DccOffer {
    std::string filename;
    std::string ip;     // dotted quad
    uint16_t port{0};
    uint64_t size{0};

    nlohmann::json toJson() const;
};

/**
 * Bot reply to a DCC RESUME request
 */
struct DccAccept {
    std::string filename;
    uint16_t port{0};
    uint64_t position{0};
};

class Ctcp {
public:
    static constexpr char kDelimiter = '\x01';

    /**
     * Find and parse a "DCC SEND <file> <ip> <port> <size>" payload anywhere
     * in an IRC line. The file name may be double quoted.
     * @return The offer, or std::nullopt if the line carries none
     */
    static std::optional<DccOffer> parseDccSend(const std::string& line);

    /**
     * Find and parse a "DCC ACCEPT <file> <port> <position>" payload
     */
    static std::optional<DccAccept> parseDccAccept(const std::string& line);

    /**
     * CTCP message body for a resume request, \x01 delimited.
     * The file name is quoted when it contains a space.
     */
    static std::string buildDccResume(const std::string& filename, uint16_t port, uint64_t position);

    /**
     * 3232235521 -> "192.168.0.1"
     */
    static std::string ipFromInteger(uint32_t address);

private:
    /**
     * Split "<file> <rest>" honoring a quoted file name
     * @return false when the payload is malformed
     */
    static bool splitFilename(const std::string& payload, std::string& filename, std::string& rest);

    /**
     * Payload following the given command ("DCC SEND"), with CTCP markers removed
     */
    static std::optional<std::string> extractPayload(const std::string& line, const std::string& command);
};

} // namespace botarr::core::xdcc
