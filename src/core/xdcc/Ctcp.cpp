/**
 * Ctcp.cpp
 */

#include "Ctcp.hpp"
#include "../../utils/StringUtils.hpp"

#include <cctype>
#include <limits>
#include <sstream>
#include <vector>

namespace botarr::core::xdcc {

using utils::StringUtils;

namespace {

// Strict unsigned parse, the whole token must be digits
template<typename T>
std::optional<T> parseUnsigned(const std::string& token) {
    if (token.empty()) {
        return std::nullopt;
    }
    uint64_t value = 0;
    for (char c : token) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return std::nullopt;
        }
        uint64_t next = value * 10 + static_cast<uint64_t>(c - '0');
        if (next < value) {
            return std::nullopt;
        }
        value = next;
    }
    if (value > std::numeric_limits<T>::max()) {
        return std::nullopt;
    }
    return static_cast<T>(value);
}

std::vector<std::string> tokens(const std::string& text) {
    std::vector<std::string> result;
    std::istringstream stream(text);
    std::string token;
    while (stream >> token) {
        result.push_back(token);
    }
    return result;
}

} // namespace

nlohmann::json DccOffer::toJson() const {
    return {
        {"filename", filename},
        {"ip", ip},
        {"port", port},
        {"size", size}
    };
}

std::optional<std::string> Ctcp::extractPayload(const std::string& line, const std::string& command) {
    auto start = line.find(command);
    if (start == std::string::npos) {
        return std::nullopt;
    }

    std::string payload = line.substr(start + command.size());
    auto end = payload.find(kDelimiter);
    if (end != std::string::npos) {
        payload.erase(end);
    }
    return StringUtils::trim(payload);
}

bool Ctcp::splitFilename(const std::string& payload, std::string& filename, std::string& rest) {
    if (payload.empty()) {
        return false;
    }

    if (payload.front() == '"') {
        auto close = payload.find('"', 1);
        if (close == std::string::npos) {
            return false;
        }
        filename = payload.substr(1, close - 1);
        rest = payload.substr(close + 1);
    } else {
        auto space = payload.find(' ');
        if (space == std::string::npos) {
            return false;
        }
        filename = payload.substr(0, space);
        rest = payload.substr(space + 1);
    }
    return !filename.empty();
}

std::optional<DccOffer> Ctcp::parseDccSend(const std::string& line) {
    auto payload = extractPayload(line, "DCC SEND");
    if (!payload) {
        return std::nullopt;
    }

    std::string filename;
    std::string rest;
    if (!splitFilename(*payload, filename, rest)) {
        return std::nullopt;
    }

    auto fields = tokens(rest);
    if (fields.size() < 3) {
        return std::nullopt;
    }

    auto address = parseUnsigned<uint32_t>(fields[0]);
    auto port = parseUnsigned<uint16_t>(fields[1]);
    auto size = parseUnsigned<uint64_t>(fields[2]);
    if (!address || !port || !size) {
        return std::nullopt;
    }

    DccOffer offer;
    offer.filename = filename;
    offer.ip = ipFromInteger(*address);
    offer.port = *port;
    offer.size = *size;
    return offer;
}

std::optional<DccAccept> Ctcp::parseDccAccept(const std::string& line) {
    auto payload = extractPayload(line, "DCC ACCEPT");
    if (!payload) {
        return std::nullopt;
    }

    std::string filename;
    std::string rest;
    if (!splitFilename(*payload, filename, rest)) {
        return std::nullopt;
    }

    auto fields = tokens(rest);
    if (fields.size() < 2) {
        return std::nullopt;
    }

    auto port = parseUnsigned<uint16_t>(fields[0]);
    auto position = parseUnsigned<uint64_t>(fields[1]);
    if (!port || !position) {
        return std::nullopt;
    }

    return DccAccept{filename, *port, *position};
}

std::string Ctcp::buildDccResume(const std::string& filename, uint16_t port, uint64_t position) {
    std::string name = StringUtils::contains(filename, " ") ? "\"" + filename + "\"" : filename;
    return std::string(1, kDelimiter) + "DCC RESUME " + name + " " + std::to_string(port) + " " +
           std::to_string(position) + std::string(1, kDelimiter);
}

std::string Ctcp::ipFromInteger(uint32_t address) {
    return std::to_string((address >> 24) & 0xFF) + "." +
           std::to_string((address >> 16) & 0xFF) + "." +
           std::to_string((address >> 8) & 0xFF) + "." +
           std::to_string(address & 0xFF);
}

} // namespace botarr::core::xdcc
