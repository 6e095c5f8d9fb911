#pragma once

/**
 * LoopbackServer.hpp
 *
 * Scripted IRC and DCC peers on 127.0.0.1 for the session tests.
 */

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <chrono>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <optional>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

namespace botarr::test {

// 127.0.0.1 as announced in a DCC SEND
constexpr uint32_t kLoopbackAddress = 2130706433u;

/**
 * Connected peer socket with timed reads
 */
class PeerConnection {
public:
    explicit PeerConnection(int fd = -1) : m_fd(fd) {}
    ~PeerConnection() { close(); }

    PeerConnection(const PeerConnection&) = delete;
    PeerConnection& operator=(const PeerConnection&) = delete;

    PeerConnection(PeerConnection&& other) noexcept : m_fd(other.m_fd), m_buffer(std::move(other.m_buffer)) {
        other.m_fd = -1;
    }

    bool valid() const { return m_fd >= 0; }

    void close() {
        if (m_fd >= 0) {
            ::close(m_fd);
            m_fd = -1;
        }
    }

    bool send(const std::string& data) {
        size_t sent = 0;
        while (sent < data.size()) {
            ssize_t n = ::send(m_fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
            if (n <= 0) {
                return false;
            }
            sent += static_cast<size_t>(n);
        }
        return true;
    }

    bool sendLine(const std::string& line) {
        return send(line + "\r\n");
    }

    /**
     * Next CRLF terminated line, without the terminator
     */
    std::optional<std::string> readLine(std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (true) {
            auto pos = m_buffer.find('\n');
            if (pos != std::string::npos) {
                std::string line = m_buffer.substr(0, pos);
                m_buffer.erase(0, pos + 1);
                if (!line.empty() && line.back() == '\r') {
                    line.pop_back();
                }
                return line;
            }
            if (!fill(deadline)) {
                return std::nullopt;
            }
        }
    }

    /**
     * Read lines until one starts with `prefix`
     */
    std::optional<std::string> waitFor(const std::string& prefix,
                                       std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < deadline) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            auto line = readLine(remaining);
            if (!line) {
                return std::nullopt;
            }
            if (line->compare(0, prefix.size(), prefix) == 0) {
                return line;
            }
        }
        return std::nullopt;
    }

    /**
     * Read exactly `size` raw bytes
     */
    std::optional<std::string> readBytes(size_t size, std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (m_buffer.size() < size) {
            if (!fill(deadline)) {
                return std::nullopt;
            }
        }
        std::string bytes = m_buffer.substr(0, size);
        m_buffer.erase(0, size);
        return bytes;
    }

    /**
     * Read DCC acknowledgments until one equals `expected`
     * @return Last acknowledged position
     */
    uint32_t readAcksUntil(uint32_t expected, std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        uint32_t last = 0;
        while (true) {
            while (m_buffer.size() >= 4) {
                uint32_t raw;
                std::memcpy(&raw, m_buffer.data(), 4);
                m_buffer.erase(0, 4);
                last = ntohl(raw);
                if (last == expected) {
                    return last;
                }
            }
            if (!fill(deadline)) {
                return last;
            }
        }
    }

private:
    bool fill(std::chrono::steady_clock::time_point deadline) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0 || m_fd < 0) {
            return false;
        }
        pollfd pfd{m_fd, POLLIN, 0};
        if (::poll(&pfd, 1, static_cast<int>(remaining.count())) <= 0) {
            return false;
        }
        char chunk[4096];
        ssize_t n = ::recv(m_fd, chunk, sizeof(chunk), 0);
        if (n <= 0) {
            return false;
        }
        m_buffer.append(chunk, static_cast<size_t>(n));
        return true;
    }

    int m_fd;
    std::string m_buffer;
};

/**
 * Listening socket bound to an ephemeral loopback port
 */
class LoopbackListener {
public:
    LoopbackListener() {
        m_fd = ::socket(AF_INET, SOCK_STREAM, 0);
        if (m_fd < 0) {
            throw std::runtime_error("socket failed");
        }
        int yes = 1;
        ::setsockopt(m_fd, SOL_SOCKET, SO_REUSEADDR, &yes, sizeof(yes));

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        if (::bind(m_fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0 ||
            ::listen(m_fd, 4) != 0) {
            ::close(m_fd);
            throw std::runtime_error("bind/listen failed");
        }

        socklen_t len = sizeof(addr);
        ::getsockname(m_fd, reinterpret_cast<sockaddr*>(&addr), &len);
        m_port = ntohs(addr.sin_port);
    }

    ~LoopbackListener() { close(); }

    LoopbackListener(const LoopbackListener&) = delete;
    LoopbackListener& operator=(const LoopbackListener&) = delete;

    uint16_t port() const { return m_port; }

    void close() {
        if (m_fd >= 0) {
            ::close(m_fd);
            m_fd = -1;
        }
    }

    PeerConnection accept(std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
        pollfd pfd{m_fd, POLLIN, 0};
        if (::poll(&pfd, 1, static_cast<int>(timeout.count())) <= 0) {
            return PeerConnection();
        }
        return PeerConnection(::accept(m_fd, nullptr, nullptr));
    }

private:
    int m_fd{-1};
    uint16_t m_port{0};
};

/**
 * A loopback port with nothing listening on it
 */
inline uint16_t closedLoopbackPort() {
    LoopbackListener listener;
    return listener.port();
}

/**
 * Fresh directory under the system temp directory, removed on destruction
 */
class TempDir {
public:
    TempDir() {
        std::random_device rd;
        m_path = std::filesystem::temp_directory_path() /
                 ("botarr-test-" + std::to_string(rd()) + std::to_string(rd()));
        std::filesystem::create_directories(m_path);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(m_path, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return m_path; }

private:
    std::filesystem::path m_path;
};

inline std::string patternData(size_t size, char seed = 'a') {
    std::string data(size, '\0');
    for (size_t i = 0; i < size; ++i) {
        data[i] = static_cast<char>(seed + static_cast<char>(i % 26));
    }
    return data;
}

inline std::string readFile(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

inline void writeFile(const std::filesystem::path& path, const std::string& data) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out.write(data.data(), static_cast<std::streamsize>(data.size()));
}

} // namespace botarr::test
