#pragma once

/**
 * ProtocolSession.hpp
 *
 * One XDCC download attempt: connect, register, join, request the pack,
 * negotiate DCC (with resume) and receive the file.
 */

#include "PackLocator.hpp"
#include "SessionEvents.hpp"
#include "Transport.hpp"
#include "XdccSettings.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace botarr::core::xdcc {

/**
 * ProtocolSession - drives a single attempt and reports through an EventQueue.
 *
 * run() never throws. Every failure becomes exactly one Error event; a
 * cancelled session stops without further events. The queue is closed when
 * run() returns, partial files are kept for a later resume.
 */
class ProtocolSession {
public:
    enum class State {
        Idle,
        Connecting,
        Registering,
        Joining,
        JoinDelay,
        Requesting,
        AwaitingDcc,
        AwaitingAccept,
        Transferring,
        Completed,
        Failed,
        Cancelled
    };

    static constexpr std::chrono::milliseconds kCancelPollInterval{250};
    static constexpr std::chrono::milliseconds kProgressInterval{500};
    static constexpr std::chrono::seconds kDccConnectTimeout{30};
    static constexpr size_t kChunkSize = 16384;
    static constexpr int kMaxNickRetries = 3;

    ProtocolSession(PackLocator locator,
                    XdccSettings settings,
                    std::shared_ptr<EventQueue> events,
                    CancellationHandlePtr cancellation);

    ~ProtocolSession();

    ProtocolSession(const ProtocolSession&) = delete;
    ProtocolSession& operator=(const ProtocolSession&) = delete;

    /**
     * Execute the attempt on the calling thread
     */
    void run();

    State state() const { return m_state.load(); }

    static const char* stateName(State state);

private:
    struct DccStart {
        DccOffer offer;
        uint64_t offset{0};
    };

    void execute();
    void setState(State state);
    void emit(SessionEvent event);
    void checkCancelled() const;

    std::unique_ptr<Stream> openTransport(const NetworkSettings& network);
    void registerClient(const NetworkSettings& network);
    void joinChannel();
    void waitJoinDelay(int seconds);
    void requestPack();
    DccStart awaitDcc();
    void adoptResumePosition(DccStart& start, uint64_t position);
    void receiveFile(const DccStart& start);
    void quit();

    /**
     * Next server line within `timeout`, PINGs answered and server error
     * text turned into XdccError.
     * @return std::nullopt on timeout
     */
    std::optional<std::string> nextLine(std::chrono::milliseconds timeout);
    void sendLine(const std::string& line);
    void checkServerErrors(const std::string& line) const;

    std::filesystem::path targetPath(const std::string& filename) const;

private:
    PackLocator m_locator;
    XdccSettings m_settings;
    std::shared_ptr<EventQueue> m_events;
    CancellationHandlePtr m_cancellation;

    std::unique_ptr<Stream> m_stream;
    std::unique_ptr<LineReader> m_reader;
    std::string m_nickname;

    std::atomic<State> m_state{State::Idle};
};

} // namespace botarr::core::xdcc
