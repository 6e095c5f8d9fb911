#pragma once

/**
 * Transport.hpp
 *
 * Blocking-with-timeout byte streams used by the IRC and DCC connections:
 * plain TCP, TCP tunnelled through a SOCKS5 proxy, and TLS over either.
 */

#include <openssl/ssl.h>

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

namespace botarr::core::xdcc {

/**
 * I/O failure on a stream (refused, reset, handshake error, ...)
 */
class NetworkError : public std::runtime_error {
public:
    explicit NetworkError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * A connect, handshake or write did not finish in time
 */
class NetworkTimeout : public NetworkError {
public:
    explicit NetworkTimeout(const std::string& message) : NetworkError(message) {}
};

/**
 * Polled while blocking; returning true aborts the operation
 */
using AbortCheck = std::function<bool()>;

/**
 * Stream - bidirectional byte stream
 */
class Stream {
public:
    virtual ~Stream() = default;

    /**
     * Wait at most `timeout` for data and read what is available
     * @return Bytes read, 0 at end of stream, std::nullopt if nothing arrived
     * @throws NetworkError on I/O failure
     */
    virtual std::optional<size_t> readSome(char* buffer, size_t length,
                                           std::chrono::milliseconds timeout) = 0;

    /**
     * Write the whole buffer
     * @throws NetworkTimeout if the peer stops accepting data for too long
     * @throws NetworkError on I/O failure
     */
    virtual void writeAll(const char* data, size_t length) = 0;

    virtual void close() = 0;

    void writeAll(const std::string& data) { writeAll(data.data(), data.size()); }
};

/**
 * TcpStream - non-blocking socket driven through poll()
 */
class TcpStream : public Stream {
public:
    /**
     * Resolve and connect, trying every address returned for the host
     * @throws NetworkTimeout when `timeout` elapses first
     * @throws NetworkError when every address fails or `abort` fires
     */
    static std::unique_ptr<TcpStream> connect(const std::string& host, uint16_t port,
                                              std::chrono::milliseconds timeout,
                                              const AbortCheck& abort = nullptr);

    ~TcpStream() override;

    TcpStream(const TcpStream&) = delete;
    TcpStream& operator=(const TcpStream&) = delete;

    std::optional<size_t> readSome(char* buffer, size_t length,
                                   std::chrono::milliseconds timeout) override;
    using Stream::writeAll;
    void writeAll(const char* data, size_t length) override;
    void close() override;

    /**
     * Read exactly `length` bytes before `timeout` elapses
     * @throws NetworkTimeout, NetworkError (also on premature end of stream)
     */
    void readExact(char* buffer, size_t length, std::chrono::milliseconds timeout);

    int fd() const { return m_fd; }

    /**
     * Maximum time a single write may stall
     */
    void setWriteTimeout(std::chrono::milliseconds timeout) { m_writeTimeout = timeout; }
    std::chrono::milliseconds writeTimeout() const { return m_writeTimeout; }

private:
    explicit TcpStream(int fd);

    int m_fd{-1};
    std::chrono::milliseconds m_writeTimeout{std::chrono::seconds(30)};
};

/**
 * SOCKS5 proxy endpoint, from "socks5://[user:pass@]host:port" or "host:port"
 */
struct ProxyEndpoint {
    std::string host;
    uint16_t port{1080};
    std::string username;
    std::string password;

    static std::optional<ProxyEndpoint> parse(const std::string& url);
};

/**
 * Negotiate a SOCKS5 CONNECT to host:port on a stream already connected to
 * the proxy. Uses the domain-name address type so the proxy resolves the
 * host; offers username/password authentication when credentials are set.
 * @throws NetworkError on refusal, NetworkTimeout on a silent proxy
 */
void socks5Connect(TcpStream& stream, const ProxyEndpoint& proxy,
                   const std::string& host, uint16_t port,
                   std::chrono::milliseconds timeout);

/**
 * TlsStream - OpenSSL client session over a TcpStream
 */
class TlsStream : public Stream {
public:
    /**
     * Perform the client handshake. SNI is set to `serverName`; the peer
     * certificate is not verified (self-signed IRC servers are common).
     * @throws NetworkError, NetworkTimeout
     */
    static std::unique_ptr<TlsStream> handshake(std::unique_ptr<TcpStream> tcp,
                                                const std::string& serverName,
                                                std::chrono::milliseconds timeout);

    ~TlsStream() override;

    TlsStream(const TlsStream&) = delete;
    TlsStream& operator=(const TlsStream&) = delete;

    std::optional<size_t> readSome(char* buffer, size_t length,
                                   std::chrono::milliseconds timeout) override;
    using Stream::writeAll;
    void writeAll(const char* data, size_t length) override;
    void close() override;

private:
    struct SslCtxDeleter {
        void operator()(SSL_CTX* ctx) const {
            if (ctx) SSL_CTX_free(ctx);
        }
    };

    struct SslDeleter {
        void operator()(SSL* ssl) const {
            if (ssl) SSL_free(ssl);
        }
    };

    using SslContext = std::unique_ptr<SSL_CTX, SslCtxDeleter>;
    using SslSession = std::unique_ptr<SSL, SslDeleter>;

    TlsStream(std::unique_ptr<TcpStream> tcp, SslContext ctx, SslSession ssl);

    /**
     * Wait for the socket direction OpenSSL asked for
     * @return false on timeout
     */
    bool waitFor(int sslError, std::chrono::milliseconds timeout);

    std::unique_ptr<TcpStream> m_tcp;
    SslContext m_ctx;
    SslSession m_ssl;
    bool m_shutdown{false};
};

/**
 * LineReader - splits a stream into CRLF (or LF) terminated text lines
 */
class LineReader {
public:
    explicit LineReader(Stream& stream) : m_stream(stream) {}

    /**
     * Wait at most `timeout` for a complete line
     * @return The line without its terminator, std::nullopt on timeout
     * @throws NetworkError when the stream ends or fails
     */
    std::optional<std::string> readLine(std::chrono::milliseconds timeout);

private:
    std::optional<std::string> takeLine();

    Stream& m_stream;
    std::string m_buffer;
};

} // namespace botarr::core::xdcc
