/**
 * Transport.cpp
 *
 * POSIX socket and OpenSSL implementation of the session transports.
 */

#include "Transport.hpp"
#include "../Logger.hpp"
#include "../../utils/StringUtils.hpp"

#include <openssl/err.h>

#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <climits>
#include <cstring>

#ifndef MSG_NOSIGNAL
#define MSG_NOSIGNAL 0
#endif

namespace botarr::core::xdcc {

using Clock = std::chrono::steady_clock;
using std::chrono::milliseconds;

namespace {

constexpr milliseconds kPollSlice{250};
constexpr size_t kMaxLineLength = 64 * 1024;

std::string errnoString(int error) {
    return std::strerror(error);
}

milliseconds remainingUntil(Clock::time_point deadline) {
    auto remaining = std::chrono::duration_cast<milliseconds>(deadline - Clock::now());
    return remaining.count() > 0 ? remaining : milliseconds(0);
}

int toPollTimeout(milliseconds timeout) {
    return static_cast<int>(std::min<int64_t>(timeout.count(), INT_MAX));
}

/**
 * @return true if the socket became ready, false on timeout
 */
bool waitSocket(int fd, short events, milliseconds timeout) {
    auto deadline = Clock::now() + timeout;
    while (true) {
        pollfd pfd{fd, events, 0};
        int rc = ::poll(&pfd, 1, toPollTimeout(remainingUntil(deadline)));
        if (rc > 0) {
            return true;
        }
        if (rc == 0) {
            return false;
        }
        if (errno != EINTR) {
            throw NetworkError("poll failed: " + errnoString(errno));
        }
    }
}

std::string sslErrorString() {
    std::string message;
    unsigned long code;
    while ((code = ERR_get_error()) != 0) {
        char buffer[256];
        ERR_error_string_n(code, buffer, sizeof(buffer));
        if (!message.empty()) {
            message += "; ";
        }
        message += buffer;
    }
    return message.empty() ? "unknown TLS error" : message;
}

bool isIpLiteral(const std::string& host) {
    in_addr v4{};
    in6_addr v6{};
    return ::inet_pton(AF_INET, host.c_str(), &v4) == 1 ||
           ::inet_pton(AF_INET6, host.c_str(), &v6) == 1;
}

std::optional<uint16_t> parsePort(const std::string& text) {
    if (text.empty() || text.size() > 5 ||
        !std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c); })) {
        return std::nullopt;
    }
    int value = std::stoi(text);
    if (value <= 0 || value > 65535) {
        return std::nullopt;
    }
    return static_cast<uint16_t>(value);
}

} // namespace

// -- TcpStream --

TcpStream::TcpStream(int fd) : m_fd(fd) {
}

TcpStream::~TcpStream() {
    close();
}

std::unique_ptr<TcpStream> TcpStream::connect(const std::string& host, uint16_t port,
                                              milliseconds timeout, const AbortCheck& abort) {
    const std::string endpoint = host + ":" + std::to_string(port);

    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo* result = nullptr;
    int rc = ::getaddrinfo(host.c_str(), std::to_string(port).c_str(), &hints, &result);
    if (rc != 0) {
        throw NetworkError("Cannot resolve " + host + ": " + ::gai_strerror(rc));
    }
    std::unique_ptr<addrinfo, decltype(&::freeaddrinfo)> addresses(result, &::freeaddrinfo);

    const auto deadline = Clock::now() + timeout;
    std::string lastError = "no usable address";

    for (addrinfo* ai = addresses.get(); ai != nullptr; ai = ai->ai_next) {
        int fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (fd < 0) {
            lastError = errnoString(errno);
            continue;
        }
        std::unique_ptr<TcpStream> stream(new TcpStream(fd));

        int flags = ::fcntl(fd, F_GETFL, 0);
        if (flags < 0 || ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0 ||
            ::fcntl(fd, F_SETFD, FD_CLOEXEC) < 0) {
            lastError = errnoString(errno);
            continue;
        }

        if (::connect(fd, ai->ai_addr, ai->ai_addrlen) == 0) {
            return stream;
        }
        if (errno != EINPROGRESS) {
            lastError = errnoString(errno);
            continue;
        }

        while (true) {
            if (abort && abort()) {
                throw NetworkError("Connection to " + endpoint + " aborted");
            }
            auto remaining = remainingUntil(deadline);
            if (remaining.count() == 0) {
                throw NetworkTimeout("Connection to " + endpoint + " timed out after " +
                                     std::to_string(timeout.count() / 1000) + "s");
            }
            if (!waitSocket(fd, POLLOUT, std::min(remaining, kPollSlice))) {
                continue;
            }

            int error = 0;
            socklen_t length = sizeof(error);
            if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &error, &length) < 0) {
                error = errno;
            }
            if (error == 0) {
                return stream;
            }
            lastError = errnoString(error);
            break;
        }
    }

    throw NetworkError("Connection to " + endpoint + " failed: " + lastError);
}

std::optional<size_t> TcpStream::readSome(char* buffer, size_t length, milliseconds timeout) {
    if (m_fd < 0) {
        throw NetworkError("Socket is closed");
    }
    if (!waitSocket(m_fd, POLLIN, timeout)) {
        return std::nullopt;
    }

    ssize_t n = ::recv(m_fd, buffer, length, 0);
    if (n < 0) {
        if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
            return std::nullopt;
        }
        throw NetworkError("Read error: " + errnoString(errno));
    }
    return static_cast<size_t>(n);
}

void TcpStream::readExact(char* buffer, size_t length, milliseconds timeout) {
    const auto deadline = Clock::now() + timeout;
    size_t received = 0;
    while (received < length) {
        auto remaining = remainingUntil(deadline);
        if (remaining.count() == 0) {
            throw NetworkTimeout("Timed out waiting for " + std::to_string(length) + " bytes");
        }
        auto n = readSome(buffer + received, length - received, remaining);
        if (!n) {
            continue;
        }
        if (*n == 0) {
            throw NetworkError("Connection closed by peer");
        }
        received += *n;
    }
}

void TcpStream::writeAll(const char* data, size_t length) {
    if (m_fd < 0) {
        throw NetworkError("Socket is closed");
    }

    size_t sent = 0;
    while (sent < length) {
        ssize_t n = ::send(m_fd, data + sent, length - sent, MSG_NOSIGNAL);
        if (n >= 0) {
            sent += static_cast<size_t>(n);
            continue;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            if (!waitSocket(m_fd, POLLOUT, m_writeTimeout)) {
                throw NetworkTimeout("Write timed out");
            }
            continue;
        }
        throw NetworkError("Write error: " + errnoString(errno));
    }
}

void TcpStream::close() {
    if (m_fd >= 0) {
        ::close(m_fd);
        m_fd = -1;
    }
}

// -- SOCKS5 --

std::optional<ProxyEndpoint> ProxyEndpoint::parse(const std::string& url) {
    std::string rest = utils::StringUtils::trim(url);
    for (const char* scheme : {"socks5://", "socks5h://"}) {
        if (utils::StringUtils::startsWith(rest, scheme)) {
            rest = rest.substr(std::strlen(scheme));
            break;
        }
    }
    if (!rest.empty() && rest.back() == '/') {
        rest.pop_back();
    }

    ProxyEndpoint proxy;

    auto at = rest.rfind('@');
    if (at != std::string::npos) {
        std::string credentials = rest.substr(0, at);
        rest = rest.substr(at + 1);
        auto colon = credentials.find(':');
        proxy.username = credentials.substr(0, colon);
        if (colon != std::string::npos) {
            proxy.password = credentials.substr(colon + 1);
        }
    }

    std::string portText;
    if (!rest.empty() && rest.front() == '[') {
        auto close = rest.find(']');
        if (close == std::string::npos) {
            return std::nullopt;
        }
        proxy.host = rest.substr(1, close - 1);
        if (close + 1 < rest.size()) {
            if (rest[close + 1] != ':') {
                return std::nullopt;
            }
            portText = rest.substr(close + 2);
        }
    } else {
        auto colon = rest.rfind(':');
        proxy.host = rest.substr(0, colon);
        if (colon != std::string::npos) {
            portText = rest.substr(colon + 1);
        }
    }

    if (proxy.host.empty()) {
        return std::nullopt;
    }
    if (!portText.empty()) {
        auto port = parsePort(portText);
        if (!port) {
            return std::nullopt;
        }
        proxy.port = *port;
    }
    return proxy;
}

void socks5Connect(TcpStream& stream, const ProxyEndpoint& proxy,
                   const std::string& host, uint16_t port, milliseconds timeout) {
    const auto deadline = Clock::now() + timeout;
    const bool useCredentials = !proxy.username.empty();

    if (host.size() > 255) {
        throw NetworkError("SOCKS5 host name too long");
    }

    // Method selection: no authentication, plus username/password when configured
    std::string greeting;
    greeting.push_back(5);
    if (useCredentials) {
        greeting.push_back(2);
        greeting.push_back(0);
        greeting.push_back(2);
    } else {
        greeting.push_back(1);
        greeting.push_back(0);
    }
    stream.writeAll(greeting);

    unsigned char reply[4];
    stream.readExact(reinterpret_cast<char*>(reply), 2, remainingUntil(deadline));
    if (reply[0] != 5) {
        throw NetworkError("SOCKS unsupported version");
    }

    if (reply[1] == 2) {
        if (!useCredentials) {
            throw NetworkError("SOCKS username required");
        }
        if (proxy.username.size() > 255 || proxy.password.size() > 255) {
            throw NetworkError("SOCKS credentials too long");
        }
        std::string auth;
        auth.push_back(1);
        auth.push_back(static_cast<char>(proxy.username.size()));
        auth += proxy.username;
        auth.push_back(static_cast<char>(proxy.password.size()));
        auth += proxy.password;
        stream.writeAll(auth);

        stream.readExact(reinterpret_cast<char*>(reply), 2, remainingUntil(deadline));
        if (reply[0] != 1) {
            throw NetworkError("SOCKS unsupported authentication version");
        }
        if (reply[1] != 0) {
            throw NetworkError("SOCKS authentication error");
        }
    } else if (reply[1] != 0) {
        throw NetworkError("SOCKS unsupported authentication method");
    }

    // CONNECT with the domain name address type
    std::string request;
    request.push_back(5);
    request.push_back(1);
    request.push_back(0);
    request.push_back(3);
    request.push_back(static_cast<char>(host.size()));
    request += host;
    request.push_back(static_cast<char>((port >> 8) & 0xFF));
    request.push_back(static_cast<char>(port & 0xFF));
    stream.writeAll(request);

    stream.readExact(reinterpret_cast<char*>(reply), 4, remainingUntil(deadline));
    if (reply[0] != 5) {
        throw NetworkError("SOCKS unsupported version");
    }
    if (reply[1] != 0) {
        static const char* messages[] = {
            "succeeded",
            "general SOCKS server failure",
            "connection not allowed by ruleset",
            "network unreachable",
            "host unreachable",
            "connection refused",
            "TTL expired",
            "command not supported",
            "address type not supported"
        };
        std::string reason = reply[1] < 9 ? messages[reply[1]] : "unknown error";
        throw NetworkError("SOCKS5 CONNECT to " + host + ":" + std::to_string(port) +
                           " failed: " + reason);
    }

    // Skip the bound address
    size_t remaining = 0;
    switch (reply[3]) {
        case 1: remaining = 4 + 2; break;
        case 4: remaining = 16 + 2; break;
        case 3: {
            char length = 0;
            stream.readExact(&length, 1, remainingUntil(deadline));
            remaining = static_cast<unsigned char>(length) + 2;
            break;
        }
        default:
            throw NetworkError("SOCKS5 reply has an unknown address type");
    }
    char discard[256 + 2];
    stream.readExact(discard, remaining, remainingUntil(deadline));

    Logger::instance().debug("SOCKS5 tunnel to {}:{} via {}:{} established",
                             host, port, proxy.host, proxy.port);
}

// -- TlsStream --

TlsStream::TlsStream(std::unique_ptr<TcpStream> tcp, SslContext ctx, SslSession ssl)
    : m_tcp(std::move(tcp))
    , m_ctx(std::move(ctx))
    , m_ssl(std::move(ssl)) {
}

TlsStream::~TlsStream() {
    close();
}

std::unique_ptr<TlsStream> TlsStream::handshake(std::unique_ptr<TcpStream> tcp,
                                                const std::string& serverName,
                                                milliseconds timeout) {
    ERR_clear_error();

    SslContext ctx(SSL_CTX_new(TLS_client_method()));
    if (!ctx) {
        throw NetworkError("TLS setup failed: " + sslErrorString());
    }
    SSL_CTX_set_verify(ctx.get(), SSL_VERIFY_NONE, nullptr);
#ifdef SSL_OP_IGNORE_UNEXPECTED_EOF
    SSL_CTX_set_options(ctx.get(), SSL_OP_IGNORE_UNEXPECTED_EOF);
#endif

    SslSession ssl(SSL_new(ctx.get()));
    if (!ssl) {
        throw NetworkError("TLS setup failed: " + sslErrorString());
    }
    if (SSL_set_fd(ssl.get(), tcp->fd()) != 1) {
        throw NetworkError("TLS setup failed: " + sslErrorString());
    }
    if (!serverName.empty() && !isIpLiteral(serverName)) {
        if (SSL_set_tlsext_host_name(ssl.get(), serverName.c_str()) != 1) {
            throw NetworkError("TLS setup failed: cannot set SNI: " + sslErrorString());
        }
    }
    SSL_set_connect_state(ssl.get());

    std::unique_ptr<TlsStream> stream(new TlsStream(std::move(tcp), std::move(ctx), std::move(ssl)));

    const auto deadline = Clock::now() + timeout;
    while (true) {
        ERR_clear_error();
        int rc = SSL_connect(stream->m_ssl.get());
        if (rc == 1) {
            break;
        }
        int error = SSL_get_error(stream->m_ssl.get(), rc);
        if (error != SSL_ERROR_WANT_READ && error != SSL_ERROR_WANT_WRITE) {
            stream->m_shutdown = true;
            throw NetworkError("TLS handshake failed: " + sslErrorString());
        }
        if (!stream->waitFor(error, remainingUntil(deadline))) {
            stream->m_shutdown = true;
            throw NetworkTimeout("TLS handshake with " + serverName + " timed out");
        }
    }

    Logger::instance().debug("TLS established with {} ({})", serverName,
                             SSL_get_version(stream->m_ssl.get()));
    return stream;
}

bool TlsStream::waitFor(int sslError, milliseconds timeout) {
    short events = sslError == SSL_ERROR_WANT_WRITE ? POLLOUT : POLLIN;
    return waitSocket(m_tcp->fd(), events, timeout);
}

std::optional<size_t> TlsStream::readSome(char* buffer, size_t length, milliseconds timeout) {
    if (!m_ssl || m_tcp->fd() < 0) {
        throw NetworkError("TLS stream is closed");
    }
    if (SSL_pending(m_ssl.get()) == 0 && !waitSocket(m_tcp->fd(), POLLIN, timeout)) {
        return std::nullopt;
    }

    ERR_clear_error();
    int n = SSL_read(m_ssl.get(), buffer, static_cast<int>(std::min<size_t>(length, INT_MAX)));
    if (n > 0) {
        return static_cast<size_t>(n);
    }

    int error = SSL_get_error(m_ssl.get(), n);
    switch (error) {
        case SSL_ERROR_WANT_READ:
        case SSL_ERROR_WANT_WRITE:
            return std::nullopt;
        case SSL_ERROR_ZERO_RETURN:
            return 0;
        case SSL_ERROR_SYSCALL:
            if (ERR_peek_error() == 0 && (n == 0 || errno == 0)) {
                return 0;
            }
            m_shutdown = true;
            throw NetworkError("TLS read failed: " + (ERR_peek_error() != 0
                ? sslErrorString() : errnoString(errno)));
        default:
            m_shutdown = true;
            throw NetworkError("TLS read failed: " + sslErrorString());
    }
}

void TlsStream::writeAll(const char* data, size_t length) {
    if (!m_ssl || m_tcp->fd() < 0) {
        throw NetworkError("TLS stream is closed");
    }

    size_t sent = 0;
    while (sent < length) {
        ERR_clear_error();
        int n = SSL_write(m_ssl.get(), data + sent,
                          static_cast<int>(std::min<size_t>(length - sent, INT_MAX)));
        if (n > 0) {
            sent += static_cast<size_t>(n);
            continue;
        }
        int error = SSL_get_error(m_ssl.get(), n);
        if (error == SSL_ERROR_WANT_READ || error == SSL_ERROR_WANT_WRITE) {
            if (!waitFor(error, m_tcp->writeTimeout())) {
                throw NetworkTimeout("TLS write timed out");
            }
            continue;
        }
        m_shutdown = true;
        throw NetworkError("TLS write failed: " + sslErrorString());
    }
}

void TlsStream::close() {
    if (m_ssl && !m_shutdown && m_tcp && m_tcp->fd() >= 0) {
        m_shutdown = true;
        ERR_clear_error();
        if (SSL_shutdown(m_ssl.get()) < 0) {
            // Peer already gone; the socket is closed below regardless
            ERR_clear_error();
        }
    }
    if (m_tcp) {
        m_tcp->close();
    }
}

// -- LineReader --

std::optional<std::string> LineReader::takeLine() {
    auto newline = m_buffer.find('\n');
    if (newline == std::string::npos) {
        return std::nullopt;
    }
    std::string line = m_buffer.substr(0, newline);
    m_buffer.erase(0, newline + 1);
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    return line;
}

std::optional<std::string> LineReader::readLine(milliseconds timeout) {
    const auto deadline = Clock::now() + timeout;
    char chunk[4096];

    while (true) {
        if (auto line = takeLine()) {
            return line;
        }
        auto remaining = remainingUntil(deadline);
        if (remaining.count() == 0) {
            return std::nullopt;
        }

        auto n = m_stream.readSome(chunk, sizeof(chunk), remaining);
        if (!n) {
            continue;
        }
        if (*n == 0) {
            throw NetworkError("Connection closed by server");
        }
        m_buffer.append(chunk, *n);
        if (m_buffer.size() > kMaxLineLength && m_buffer.find('\n') == std::string::npos) {
            throw NetworkError("IRC line exceeds " + std::to_string(kMaxLineLength) + " bytes");
        }
    }
}

} // namespace botarr::core::xdcc
