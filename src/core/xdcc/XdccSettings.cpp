/**
 * XdccSettings.cpp
 */

#include "XdccSettings.hpp"
#include "../Config.hpp"
#include "../Logger.hpp"
#include "../../utils/StringUtils.hpp"

namespace botarr::core::xdcc {

using utils::StringUtils;

namespace {

template<typename T>
T valueOr(const nlohmann::json& object, const char* key, const T& fallback) {
    if (!object.is_object()) {
        return fallback;
    }
    auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        return fallback;
    }
    try {
        return it->get<T>();
    } catch (const nlohmann::json::exception& e) {
        Logger::instance().warn("Ignoring setting '{}': {}", key, e.what());
        return fallback;
    }
}

std::chrono::milliseconds secondsOr(const nlohmann::json& object, const char* key,
                                    std::chrono::milliseconds fallback) {
    double seconds = valueOr<double>(object, key, fallback.count() / 1000.0);
    if (seconds <= 0.0) {
        return fallback;
    }
    return std::chrono::milliseconds(static_cast<int64_t>(seconds * 1000.0));
}

} // namespace

nlohmann::json NetworkSettings::toJson() const {
    return {
        {"host", host},
        {"port", port},
        {"ssl", ssl},
        {"autojoinChannels", autojoinChannels},
        {"joinDelay", joinDelay}
    };
}

NetworkSettings NetworkSettings::fromJson(const nlohmann::json& j) {
    NetworkSettings settings;
    settings.host = valueOr<std::string>(j, "host", "");
    settings.ssl = valueOr<bool>(j, "ssl", false);
    settings.port = valueOr<uint16_t>(j, "port",
        settings.ssl ? XdccSettings::kSslPort : XdccSettings::kPlainPort);
    settings.autojoinChannels = valueOr<std::vector<std::string>>(j, "autojoinChannels", {});
    settings.joinDelay = valueOr<int>(j, "joinDelay", XdccSettings::kDefaultJoinDelay);
    if (settings.joinDelay < 0) {
        settings.joinDelay = 0;
    }
    return settings;
}

NetworkSettings XdccSettings::resolveNetwork(const std::string& network) const {
    for (const auto& [name, settings] : networks) {
        if (StringUtils::equalsIgnoreCase(name, network)) {
            return settings;
        }
    }

    NetworkSettings resolved;
    resolved.ssl = useSsl;
    resolved.port = useSsl ? kSslPort : kPlainPort;
    resolved.joinDelay = kDefaultJoinDelay;

    if (StringUtils::contains(network, ".")) {
        resolved.host = network;
    } else {
        resolved.host = "irc." + StringUtils::toLower(network) + ".net";
    }
    return resolved;
}

XdccSettings XdccSettings::fromJson(const nlohmann::json& config) {
    XdccSettings settings;

    const auto connection = config.value("connection", nlohmann::json::object());
    settings.useSsl = valueOr<bool>(connection, "useSsl", settings.useSsl);
    settings.connectTimeout = secondsOr(connection, "connectTimeout", settings.connectTimeout);
    settings.generalTimeout = secondsOr(connection, "generalTimeout", settings.generalTimeout);
    settings.proxyEnabled = valueOr<bool>(connection, "proxyEnabled", settings.proxyEnabled);
    settings.proxyUrl = valueOr<std::string>(connection, "proxyUrl", settings.proxyUrl);

    const auto identity = config.value("identity", nlohmann::json::object());
    std::string nickname = valueOr<std::string>(identity, "nickname", "");
    if (!StringUtils::trim(nickname).empty()) {
        settings.nickname = nickname;
    }
    settings.username = valueOr<std::string>(identity, "username", settings.username);
    settings.realname = valueOr<std::string>(identity, "realname", settings.realname);

    const auto downloads = config.value("downloads", nlohmann::json::object());
    settings.downloadDirectory = valueOr<std::string>(downloads, "directory", settings.downloadDirectory);
    settings.resumeEnabled = valueOr<bool>(downloads, "resumeEnabled", settings.resumeEnabled);

    const auto networks = config.value("networks", nlohmann::json::object());
    if (networks.is_object()) {
        for (const auto& [name, value] : networks.items()) {
            NetworkSettings network = NetworkSettings::fromJson(value);
            if (network.host.empty()) {
                Logger::instance().warn("Network '{}' has no host, skipped", name);
                continue;
            }
            settings.networks[name] = std::move(network);
        }
    }

    return settings;
}

std::string XdccSettings::defaultNickname() {
    return "botarr" + StringUtils::randomNumber(10000);
}

XdccSettings XdccSettings::fromConfig() {
    return fromJson(Config::instance().getAll());
}

} // namespace botarr::core::xdcc
