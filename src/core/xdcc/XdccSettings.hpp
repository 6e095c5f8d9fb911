#pragma once

/**
 * XdccSettings.hpp
 *
 * Typed settings consumed by a protocol session, built from the JSON
 * configuration document.
 */

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace botarr::core::xdcc {

/**
 * Connection parameters of one IRC network
 */
struct NetworkSettings {
    std::string host;
    uint16_t port{6667};
    bool ssl{false};
    std::vector<std::string> autojoinChannels;
    int joinDelay{6};  // seconds, 0 = none

    nlohmann::json toJson() const;
    static NetworkSettings fromJson(const nlohmann::json& j);
};

/**
 * XdccSettings - everything a session needs besides the locator
 */
struct XdccSettings {
    static constexpr uint16_t kPlainPort = 6667;
    static constexpr uint16_t kSslPort = 6697;
    static constexpr int kDefaultJoinDelay = 6;

    std::string nickname{defaultNickname()};
    std::string username{"botarr"};
    std::string realname{"Botarr XDCC Client"};

    bool useSsl{true};
    std::chrono::milliseconds connectTimeout{std::chrono::seconds(15)};
    std::chrono::milliseconds generalTimeout{std::chrono::seconds(120)};

    bool proxyEnabled{false};
    std::string proxyUrl;

    std::string downloadDirectory{"downloads"};
    bool resumeEnabled{true};

    // Keyed by display name, looked up case-insensitively
    std::map<std::string, NetworkSettings> networks;

    /**
     * Resolve a locator network name.
     *
     * Explicit mappings win (case-insensitive). Otherwise a dotted name is
     * used as the host and anything else becomes irc.<lowercase>.net, with
     * the global TLS default and its port.
     */
    NetworkSettings resolveNetwork(const std::string& network) const;

    /**
     * Build from a configuration document shaped like Config::setDefaults().
     * Missing keys keep their defaults; timeouts are in seconds.
     */
    static XdccSettings fromJson(const nlohmann::json& config);

    /**
     * Snapshot of the global Config singleton
     */
    static XdccSettings fromConfig();

    /**
     * "botarr" plus a random number below 10000, so separate installs
     * do not fight over one nickname
     */
    static std::string defaultNickname();
};

} // namespace botarr::core::xdcc
