/**
 * PackLocator.cpp
 */

#include "PackLocator.hpp"
#include "XdccError.hpp"
#include "../../utils/StringUtils.hpp"

#include <cctype>
#include <limits>

namespace botarr::core::xdcc {

namespace {

constexpr const char* kScheme = "irc://";

uint32_t parseSlot(const std::string& segment) {
    std::string digits = segment;
    if (!digits.empty() && digits.front() == '#') {
        digits.erase(0, 1);
    }

    if (digits.empty()) {
        throw XdccError(ErrorKind::InvalidUrl, "Invalid slot number: " + segment);
    }

    uint64_t value = 0;
    for (char c : digits) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            throw XdccError(ErrorKind::InvalidUrl, "Invalid slot number: " + segment);
        }
        value = value * 10 + static_cast<uint64_t>(c - '0');
        if (value > std::numeric_limits<uint32_t>::max()) {
            throw XdccError(ErrorKind::InvalidUrl, "Slot number out of range: " + segment);
        }
    }
    return static_cast<uint32_t>(value);
}

} // namespace

PackLocator::PackLocator(std::string network, std::string channel, std::string bot, uint32_t slot)
    : m_network(std::move(network))
    , m_channel(std::move(channel))
    , m_bot(std::move(bot))
    , m_slot(slot) {
    if (m_channel.empty() || m_channel.front() != '#') {
        m_channel.insert(m_channel.begin(), '#');
    }
}

PackLocator PackLocator::parse(const std::string& text) {
    if (!utils::StringUtils::startsWith(text, kScheme)) {
        throw XdccError(ErrorKind::InvalidUrl, "URL must start with irc://");
    }

    auto parts = utils::StringUtils::split(text.substr(std::char_traits<char>::length(kScheme)), '/');
    if (parts.size() != 4) {
        throw XdccError(ErrorKind::InvalidUrl,
                        "URL must have format: irc://network/channel/bot/slot");
    }

    const std::string& network = parts[0];
    const std::string& channel = parts[1];
    const std::string& bot = parts[2];

    if (network.empty()) {
        throw XdccError(ErrorKind::InvalidUrl, "Missing network");
    }
    if (channel.empty() || channel == "#") {
        throw XdccError(ErrorKind::InvalidUrl, "Missing channel");
    }
    if (bot.empty()) {
        throw XdccError(ErrorKind::InvalidUrl, "Missing bot name");
    }

    return PackLocator(network, channel, bot, parseSlot(parts[3]));
}

std::string PackLocator::toText() const {
    // A second leading '#' belongs to the name; such channels render whole
    std::string channel = utils::StringUtils::startsWith(m_channel, "##")
        ? m_channel
        : m_channel.substr(1);
    return std::string(kScheme) + m_network + "/" + channel + "/" + m_bot + "/" +
           std::to_string(m_slot);
}

nlohmann::json PackLocator::toJson() const {
    return {
        {"network", m_network},
        {"channel", m_channel},
        {"bot", m_bot},
        {"slot", m_slot}
    };
}

bool PackLocator::operator==(const PackLocator& other) const {
    return m_slot == other.m_slot &&
           m_network == other.m_network &&
           m_channel == other.m_channel &&
           m_bot == other.m_bot;
}

} // namespace botarr::core::xdcc
