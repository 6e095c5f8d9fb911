#pragma once

/**
 * PackLocator.hpp
 *
 * Address of one XDCC pack: irc://network/channel/bot/slot
 */

#include <nlohmann/json.hpp>

#include <cstdint>
#include <functional>
#include <string>

namespace botarr::core::xdcc {

/**
 * PackLocator - immutable (network, channel, bot, slot) value.
 *
 * The channel always carries its leading '#'.
 */
class PackLocator {
public:
    PackLocator(std::string network, std::string channel, std::string bot, uint32_t slot);

    /**
     * Parse "irc://network/channel/bot/slot".
     * The channel gets a '#' prepended when missing, the slot may carry one
     * leading '#'.
     * @throws XdccError (InvalidUrl) on any malformed input
     */
    static PackLocator parse(const std::string& text);

    /**
     * Canonical text form, the inverse of parse()
     */
    std::string toText() const;

    const std::string& network() const { return m_network; }
    const std::string& channel() const { return m_channel; }
    const std::string& bot() const { return m_bot; }
    uint32_t slot() const { return m_slot; }

    /**
     * Statistics key, "bot@network"
     */
    std::string botKey() const { return m_bot + "@" + m_network; }

    nlohmann::json toJson() const;

    bool operator==(const PackLocator& other) const;
    bool operator!=(const PackLocator& other) const { return !(*this == other); }

private:
    std::string m_network;
    std::string m_channel;
    std::string m_bot;
    uint32_t m_slot;
};

} // namespace botarr::core::xdcc

namespace std {

template<>
struct hash<botarr::core::xdcc::PackLocator> {
    size_t operator()(const botarr::core::xdcc::PackLocator& locator) const noexcept {
        size_t seed = std::hash<std::string>{}(locator.network());
        auto combine = [&seed](size_t value) {
            seed ^= value + 0x9e3779b9 + (seed << 6) + (seed >> 2);
        };
        combine(std::hash<std::string>{}(locator.channel()));
        combine(std::hash<std::string>{}(locator.bot()));
        combine(std::hash<uint32_t>{}(locator.slot()));
        return seed;
    }
};

} // namespace std
