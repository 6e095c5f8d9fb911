/**
 * ProtocolSession.cpp
 *
 * IRC registration, XDCC request and DCC receive loop.
 */

#include "ProtocolSession.hpp"
#include "../Logger.hpp"
#include "../../utils/StringUtils.hpp"

#include <arpa/inet.h>

#include <algorithm>
#include <fstream>
#include <system_error>
#include <vector>

namespace botarr::core::xdcc {

namespace fs = std::filesystem;
using Clock = std::chrono::steady_clock;
using std::chrono::milliseconds;
using utils::StringUtils;

namespace {

// Unwinds the session when its handle is cancelled; never leaves run()
struct SessionCancelled {};

/**
 * Minimal IRC message split: [:prefix] command params... [:trailing]
 */
struct IrcMessage {
    std::string prefix;
    std::string command;
    std::vector<std::string> params;

    std::string nick() const {
        return prefix.substr(0, prefix.find('!'));
    }

    std::string param(size_t index) const {
        return index < params.size() ? params[index] : std::string();
    }

    static IrcMessage parse(const std::string& line) {
        IrcMessage message;
        size_t pos = 0;

        if (!line.empty() && line[0] == ':') {
            auto space = line.find(' ');
            message.prefix = line.substr(1, space == std::string::npos ? std::string::npos : space - 1);
            pos = space == std::string::npos ? line.size() : space + 1;
        }

        while (pos < line.size()) {
            if (line[pos] == ' ') {
                ++pos;
                continue;
            }
            if (line[pos] == ':' && !message.command.empty()) {
                message.params.push_back(line.substr(pos + 1));
                break;
            }
            auto space = line.find(' ', pos);
            std::string token = line.substr(pos, space == std::string::npos ? std::string::npos : space - pos);
            if (message.command.empty()) {
                message.command = StringUtils::toUpper(token);
            } else {
                message.params.push_back(token);
            }
            pos = space == std::string::npos ? line.size() : space + 1;
        }
        return message;
    }
};

bool isJoinFailure(const std::string& command) {
    static const char* numerics[] = {"403", "405", "471", "473", "474", "475", "477"};
    return std::any_of(std::begin(numerics), std::end(numerics),
                       [&command](const char* numeric) { return command == numeric; });
}

milliseconds remainingUntil(Clock::time_point deadline) {
    auto remaining = std::chrono::duration_cast<milliseconds>(deadline - Clock::now());
    return remaining.count() > 0 ? remaining : milliseconds(0);
}

double secondsSince(Clock::time_point start) {
    return std::chrono::duration<double>(Clock::now() - start).count();
}

} // namespace

ProtocolSession::ProtocolSession(PackLocator locator,
                                 XdccSettings settings,
                                 std::shared_ptr<EventQueue> events,
                                 CancellationHandlePtr cancellation)
    : m_locator(std::move(locator))
    , m_settings(std::move(settings))
    , m_events(std::move(events))
    , m_cancellation(std::move(cancellation))
    , m_nickname(m_settings.nickname) {
    if (!m_cancellation) {
        m_cancellation = std::make_shared<CancellationHandle>();
    }
}

ProtocolSession::~ProtocolSession() = default;

const char* ProtocolSession::stateName(State state) {
    switch (state) {
        case State::Idle:           return "idle";
        case State::Connecting:     return "connecting";
        case State::Registering:    return "registering";
        case State::Joining:        return "joining";
        case State::JoinDelay:      return "join-delay";
        case State::Requesting:     return "requesting";
        case State::AwaitingDcc:    return "awaiting-dcc";
        case State::AwaitingAccept: return "awaiting-accept";
        case State::Transferring:   return "transferring";
        case State::Completed:      return "completed";
        case State::Failed:         return "failed";
        case State::Cancelled:      return "cancelled";
    }
    return "unknown";
}

void ProtocolSession::run() {
    struct QueueCloser {
        EventQueue& queue;
        ~QueueCloser() { queue.close(); }
    } closer{*m_events};

    const std::string target = m_locator.toText();

    try {
        execute();
        return;
    } catch (const SessionCancelled&) {
        setState(State::Cancelled);
        Logger::instance().info("Session for {} cancelled", target);
        return;
    } catch (const XdccError& e) {
        if (m_cancellation->isCancelled()) {
            setState(State::Cancelled);
            Logger::instance().info("Session for {} cancelled", target);
            return;
        }
        setState(State::Failed);
        Logger::instance().error("XDCC download {} failed: {}", target, e.what());
        emit(events::Error{e.kind(), e.what()});
    } catch (const std::exception& e) {
        setState(State::Failed);
        XdccError error(ErrorKind::TransferFailed, e.what());
        Logger::instance().error("XDCC download {} failed unexpectedly: {}", target, e.what());
        emit(events::Error{error.kind(), error.what()});
    }
}

void ProtocolSession::execute() {
    setState(State::Connecting);
    emit(events::Connecting{});

    NetworkSettings network = m_settings.resolveNetwork(m_locator.network());
    Logger::instance().info("Connecting to IRC server {}:{} (SSL: {})",
                            network.host, network.port, network.ssl);

    m_stream = openTransport(network);
    m_reader = std::make_unique<LineReader>(*m_stream);
    emit(events::Connected{});

    registerClient(network);
    joinChannel();
    waitJoinDelay(network.joinDelay);
    requestPack();

    DccStart start = awaitDcc();
    receiveFile(start);

    quit();
    setState(State::Completed);
    emit(events::Completed{});
}

void ProtocolSession::setState(State state) {
    State previous = m_state.exchange(state);
    if (previous != state) {
        Logger::instance().debug("Session {}: {} -> {}", m_locator.toText(),
                                 stateName(previous), stateName(state));
    }
}

void ProtocolSession::emit(SessionEvent event) {
    if (m_cancellation->isCancelled()) {
        return;
    }
    if (!m_events->push(std::move(event))) {
        Logger::instance().debug("Event queue for {} closed, event dropped", m_locator.toText());
    }
}

void ProtocolSession::checkCancelled() const {
    if (m_cancellation->isCancelled()) {
        throw SessionCancelled{};
    }
}

// -- Connecting --

std::unique_ptr<Stream> ProtocolSession::openTransport(const NetworkSettings& network) {
    auto abort = [this] { return m_cancellation->isCancelled(); };
    const auto timeout = m_settings.connectTimeout;

    try {
        std::unique_ptr<TcpStream> tcp;

        if (m_settings.proxyEnabled && !m_settings.proxyUrl.empty()) {
            auto proxy = ProxyEndpoint::parse(m_settings.proxyUrl);
            if (!proxy) {
                throw XdccError(ErrorKind::ConnectionFailed, "Invalid proxy URL: " + m_settings.proxyUrl);
            }
            Logger::instance().info("Connecting via SOCKS5 proxy {}:{} -> {}:{}",
                                    proxy->host, proxy->port, network.host, network.port);
            tcp = TcpStream::connect(proxy->host, proxy->port, timeout, abort);
            socks5Connect(*tcp, *proxy, network.host, network.port, timeout);
        } else {
            tcp = TcpStream::connect(network.host, network.port, timeout, abort);
        }

        checkCancelled();
        Logger::instance().info("TCP connected to {}:{}", network.host, network.port);

        if (network.ssl) {
            auto tls = TlsStream::handshake(std::move(tcp), network.host, timeout);
            Logger::instance().info("TLS connection established to {}", network.host);
            return tls;
        }
        return tcp;

    } catch (const NetworkTimeout& e) {
        checkCancelled();
        throw XdccError(ErrorKind::Timeout, e.what());
    } catch (const NetworkError& e) {
        checkCancelled();
        throw XdccError(ErrorKind::ConnectionFailed, e.what());
    }
}

// -- Registering --

void ProtocolSession::registerClient(const NetworkSettings& network) {
    setState(State::Registering);

    sendLine("NICK " + m_nickname);
    sendLine("USER " + m_settings.username + " 0 * :" + m_settings.realname);

    int nickRetries = 0;
    while (true) {
        auto line = nextLine(m_settings.generalTimeout);
        if (!line) {
            throw XdccError(ErrorKind::Timeout, "Timed out waiting for server welcome");
        }

        IrcMessage message = IrcMessage::parse(*line);
        if (message.command == "001") {
            break;
        }
        if (message.command == "433") {
            if (nickRetries >= kMaxNickRetries) {
                throw XdccError(ErrorKind::ConnectionFailed,
                                "Nickname " + m_nickname + " is already in use");
            }
            ++nickRetries;
            m_nickname += "_";
            Logger::instance().warn("Nickname in use, retrying as {}", m_nickname);
            sendLine("NICK " + m_nickname);
        }
    }

    Logger::instance().info("Registered as {}", m_nickname);

    for (const auto& channel : network.autojoinChannels) {
        if (channel.empty()) {
            continue;
        }
        sendLine("JOIN " + (channel.front() == '#' ? channel : "#" + channel));
    }
}

// -- Joining --

void ProtocolSession::joinChannel() {
    setState(State::Joining);
    const std::string& channel = m_locator.channel();

    Logger::instance().info("Joining channel {}", channel);
    emit(events::Joining{channel});
    sendLine("JOIN " + channel);

    while (true) {
        auto line = nextLine(m_settings.generalTimeout);
        if (!line) {
            throw XdccError(ErrorKind::Timeout, "Timed out waiting to join channel " + channel);
        }

        IrcMessage message = IrcMessage::parse(*line);
        if (message.command == "366" && StringUtils::equalsIgnoreCase(message.param(1), channel)) {
            break;
        }
        if (message.command == "JOIN" && StringUtils::equalsIgnoreCase(message.param(0), channel) &&
            StringUtils::equalsIgnoreCase(message.nick(), m_nickname)) {
            break;
        }
        if (isJoinFailure(message.command) && StringUtils::equalsIgnoreCase(message.param(1), channel)) {
            std::string reason = message.params.empty() ? message.command : message.params.back();
            throw XdccError(ErrorKind::ChannelJoinFailed, channel + ": " + reason);
        }
    }

    Logger::instance().info("Joined channel {}", channel);
    emit(events::Joined{channel});
}

void ProtocolSession::waitJoinDelay(int seconds) {
    if (seconds <= 0) {
        return;
    }
    setState(State::JoinDelay);
    Logger::instance().debug("Waiting {}s before requesting the pack", seconds);

    // Keep answering PINGs; silence is expected here
    const auto deadline = Clock::now() + std::chrono::seconds(seconds);
    while (true) {
        auto remaining = remainingUntil(deadline);
        if (remaining.count() == 0) {
            break;
        }
        nextLine(remaining);
    }
}

// -- Requesting --

void ProtocolSession::requestPack() {
    setState(State::Requesting);
    Logger::instance().info("Requesting pack #{} from {}", m_locator.slot(), m_locator.bot());
    emit(events::Requesting{m_locator.bot(), m_locator.slot()});
    sendLine("PRIVMSG " + m_locator.bot() + " :xdcc send #" + std::to_string(m_locator.slot()));
}

ProtocolSession::DccStart ProtocolSession::awaitDcc() {
    setState(State::AwaitingDcc);
    std::optional<DccStart> pendingResume;

    while (true) {
        auto line = nextLine(m_settings.generalTimeout);
        if (!line) {
            if (pendingResume) {
                Logger::instance().warn("No DCC ACCEPT for {}, restarting from offset 0",
                                        pendingResume->offer.filename);
                pendingResume->offset = 0;
                return *pendingResume;
            }
            throw XdccError(ErrorKind::Timeout, "Timed out waiting for DCC response from bot");
        }

        if (pendingResume) {
            auto accept = Ctcp::parseDccAccept(*line);
            if (accept && accept->port == pendingResume->offer.port) {
                if (accept->position != pendingResume->offset) {
                    adoptResumePosition(*pendingResume, accept->position);
                }
                Logger::instance().info("Resume accepted for {} at {} bytes",
                                        pendingResume->offer.filename, pendingResume->offset);
                return *pendingResume;
            }
            continue;
        }

        auto offer = Ctcp::parseDccSend(*line);
        if (!offer) {
            continue;
        }

        Logger::instance().info("Received DCC SEND: {} from {}:{} ({} bytes)",
                                offer->filename, offer->ip, offer->port, offer->size);
        emit(events::Offer{*offer});

        if (m_settings.resumeEnabled) {
            std::error_code ec;
            auto existing = fs::file_size(targetPath(offer->filename), ec);
            if (!ec && existing > 0 && existing < offer->size) {
                Logger::instance().info("Partial file found ({} bytes), requesting resume", existing);
                sendLine("PRIVMSG " + m_locator.bot() + " :" +
                         Ctcp::buildDccResume(offer->filename, offer->port, existing));
                pendingResume = DccStart{*offer, existing};
                setState(State::AwaitingAccept);
                continue;
            }
        }

        return DccStart{*offer, 0};
    }
}

void ProtocolSession::adoptResumePosition(DccStart& start, uint64_t position) {
    Logger::instance().warn("Bot accepted resume of {} at {} instead of {}",
                            start.offer.filename, position, start.offset);

    // The bot streams from its own position; the local data must end exactly there
    if (position > start.offset) {
        throw XdccError(ErrorKind::TransferFailed, "Bot resumed " + start.offer.filename + " at " +
                        std::to_string(position) + " beyond the local " +
                        std::to_string(start.offset) + " bytes");
    }

    std::error_code ec;
    fs::resize_file(targetPath(start.offer.filename), position, ec);
    if (ec) {
        throw XdccError(ErrorKind::TransferFailed, "Cannot truncate " + start.offer.filename +
                        " to " + std::to_string(position) + " bytes: " + ec.message());
    }
    start.offset = position;
}

// -- Transferring --

void ProtocolSession::receiveFile(const DccStart& start) {
    setState(State::Transferring);
    const DccOffer& offer = start.offer;
    const fs::path path = targetPath(offer.filename);

    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
        throw XdccError(ErrorKind::TransferFailed,
                        "Cannot create " + path.parent_path().string() + ": " + ec.message());
    }

    Logger::instance().info("Connecting to DCC {}:{} for {}", offer.ip, offer.port, offer.filename);

    std::unique_ptr<TcpStream> dcc;
    try {
        dcc = TcpStream::connect(offer.ip, offer.port, kDccConnectTimeout,
                                 [this] { return m_cancellation->isCancelled(); });
    } catch (const NetworkTimeout&) {
        checkCancelled();
        throw XdccError(ErrorKind::Timeout, "DCC connection timed out");
    } catch (const NetworkError& e) {
        checkCancelled();
        throw XdccError(ErrorKind::TransferFailed, std::string("DCC connection failed: ") + e.what());
    }

    auto mode = std::ios::binary | (start.offset > 0 ? std::ios::app : std::ios::trunc);
    std::ofstream file(path, mode);
    if (!file.is_open()) {
        throw XdccError(ErrorKind::TransferFailed, "Failed to create file: " + path.string());
    }
    Logger::instance().info("Saving to {} (offset {})", path.string(), start.offset);

    std::vector<char> buffer(kChunkSize);
    uint64_t position = start.offset;
    uint64_t received = 0;
    uint64_t sinceUpdate = 0;

    const auto startTime = Clock::now();
    auto lastUpdate = startTime;
    auto lastData = startTime;
    auto lastLog = startTime;

    while (offer.size == 0 || position < offer.size) {
        checkCancelled();

        std::optional<size_t> n;
        try {
            n = dcc->readSome(buffer.data(), buffer.size(), kCancelPollInterval);
        } catch (const NetworkError& e) {
            throw XdccError(ErrorKind::TransferFailed, std::string("Read error: ") + e.what());
        }

        if (!n) {
            if (Clock::now() - lastData >= m_settings.generalTimeout) {
                throw XdccError(ErrorKind::Timeout, "DCC transfer stalled at " +
                                std::to_string(position) + " bytes");
            }
            continue;
        }
        if (*n == 0) {
            break;
        }

        lastData = Clock::now();
        file.write(buffer.data(), static_cast<std::streamsize>(*n));
        if (!file) {
            throw XdccError(ErrorKind::TransferFailed, "Write error: " + path.string());
        }
        position += *n;
        received += *n;
        sinceUpdate += *n;

        // Acknowledge the cumulative position, truncated to 32 bits
        uint32_t ack = htonl(static_cast<uint32_t>(position));
        try {
            dcc->writeAll(reinterpret_cast<const char*>(&ack), sizeof(ack));
        } catch (const NetworkError& e) {
            Logger::instance().debug("DCC acknowledgment not delivered: {}", e.what());
        }

        auto now = Clock::now();
        auto elapsed = std::chrono::duration<double>(now - lastUpdate).count();
        if (now - lastUpdate >= kProgressInterval) {
            double speed = static_cast<double>(sinceUpdate) / elapsed;
            emit(events::Progress{position, offer.size, speed});
            lastUpdate = now;
            sinceUpdate = 0;

            if (now - lastLog >= std::chrono::seconds(5)) {
                double percent = offer.size > 0
                    ? static_cast<double>(position) / static_cast<double>(offer.size) * 100.0
                    : 0.0;
                Logger::instance().debug("Progress: {:.1f}% ({} / {} bytes) @ {:.1f} KB/s",
                                         percent, position, offer.size, speed / 1024.0);
                lastLog = now;
            }
        }
    }

    file.close();
    if (file.fail()) {
        throw XdccError(ErrorKind::TransferFailed, "Failed to finalize " + path.string());
    }
    dcc->close();

    double totalTime = secondsSince(startTime);
    double averageSpeed = totalTime > 0.0 ? static_cast<double>(received) / totalTime : 0.0;
    emit(events::Progress{position, offer.size, averageSpeed});

    if (offer.size > 0 && position < offer.size) {
        Logger::instance().warn("DCC stream for {} ended at {} of {} bytes",
                                offer.filename, position, offer.size);
    }
    Logger::instance().info("DCC transfer complete: {} bytes in {:.1f}s ({:.1f} KB/s)",
                            received, totalTime, averageSpeed / 1024.0);
}

void ProtocolSession::quit() {
    try {
        sendLine("QUIT :Transfer complete");
    } catch (const XdccError& e) {
        Logger::instance().warn("QUIT not delivered: {}", e.what());
    }
    m_reader.reset();
    m_stream.reset();
}

// -- Line I/O --

std::optional<std::string> ProtocolSession::nextLine(milliseconds timeout) {
    const auto deadline = Clock::now() + timeout;

    while (true) {
        checkCancelled();
        auto remaining = remainingUntil(deadline);
        if (remaining.count() == 0) {
            return std::nullopt;
        }

        std::optional<std::string> line;
        try {
            line = m_reader->readLine(std::min(remaining, kCancelPollInterval));
        } catch (const NetworkError& e) {
            checkCancelled();
            throw XdccError(ErrorKind::ConnectionFailed, e.what());
        }

        if (!line || line->empty()) {
            continue;
        }

        Logger::instance().debug("IRC < {}", *line);

        if (StringUtils::startsWith(*line, "PING")) {
            sendLine("PONG" + line->substr(4));
            continue;
        }

        checkServerErrors(*line);
        return line;
    }
}

void ProtocolSession::sendLine(const std::string& line) {
    Logger::instance().debug("IRC > {}", line);
    try {
        m_stream->writeAll(line + "\r\n");
    } catch (const NetworkTimeout& e) {
        throw XdccError(ErrorKind::Timeout, std::string("Write timed out: ") + e.what());
    } catch (const NetworkError& e) {
        throw XdccError(ErrorKind::ConnectionFailed, std::string("Write error: ") + e.what());
    }
}

void ProtocolSession::checkServerErrors(const std::string& line) const {
    IrcMessage message = IrcMessage::parse(line);

    // Channel chatter is not addressed to us
    if (message.command == "PRIVMSG" && !message.param(0).empty() &&
        (message.param(0).front() == '#' || message.param(0).front() == '&')) {
        return;
    }

    if (StringUtils::contains(line, "Invalid Pack Number")) {
        throw XdccError(ErrorKind::InvalidPack, "Server error: " + line);
    }
    if (StringUtils::contains(line, "No such nick") ||
        StringUtils::contains(line, "is not online") ||
        StringUtils::contains(line, "You already requested")) {
        throw XdccError(ErrorKind::BotBusy, "Server error: " + line);
    }
    if (StringUtils::contains(line, "Closing Link")) {
        throw XdccError(ErrorKind::ConnectionFailed, "Server error: " + line);
    }
}

fs::path ProtocolSession::targetPath(const std::string& filename) const {
    return fs::path(m_settings.downloadDirectory) / StringUtils::sanitizeFileName(filename);
}

} // namespace botarr::core::xdcc
