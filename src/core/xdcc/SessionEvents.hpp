#pragma once

/**
 * SessionEvents.hpp
 *
 * Lifecycle events of one download attempt, the bounded queue that carries
 * them from the session thread to its consumer, and the cooperative
 * cancellation handle shared by both sides.
 */

#include "Ctcp.hpp"
#include "XdccError.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <variant>

namespace botarr::core::xdcc {

namespace events {

struct Connecting {};
struct Connected {};
struct Joining { std::string channel; };
struct Joined { std::string channel; };
struct Requesting { std::string bot; uint32_t slot{0}; };
struct Offer { DccOffer offer; };
struct Progress {
    uint64_t downloaded{0};
    uint64_t total{0};
    double speed{0.0};  // bytes per second
};
struct Completed {};
struct Error {
    ErrorKind kind{ErrorKind::ConnectionFailed};
    std::string message;  // "<label>: <detail>"
};

} // namespace events

using SessionEvent = std::variant<
    events::Connecting,
    events::Connected,
    events::Joining,
    events::Joined,
    events::Requesting,
    events::Offer,
    events::Progress,
    events::Completed,
    events::Error
>;

/**
 * CancellationHandle - cooperative cancellation flag.
 *
 * Shared between the orchestrator, the driver and the running session.
 */
class CancellationHandle {
public:
    void cancel() {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_cancelled = true;
        }
        m_condition.notify_all();
    }

    bool isCancelled() const {
        return m_cancelled.load();
    }

    /**
     * Sleep for the given duration or until cancelled
     * @return true if the handle was cancelled
     */
    template<typename Rep, typename Period>
    bool waitFor(std::chrono::duration<Rep, Period> duration) {
        std::unique_lock<std::mutex> lock(m_mutex);
        return m_condition.wait_for(lock, duration, [this] { return m_cancelled.load(); });
    }

private:
    std::atomic<bool> m_cancelled{false};
    std::mutex m_mutex;
    std::condition_variable m_condition;
};

using CancellationHandlePtr = std::shared_ptr<CancellationHandle>;

/**
 * EventQueue - bounded single producer / single consumer FIFO.
 *
 * push() blocks while the queue is full; pop() returns std::nullopt on
 * timeout or once the queue is closed and drained.
 */
class EventQueue {
public:
    static constexpr size_t kDefaultCapacity = 100;

    explicit EventQueue(size_t capacity = kDefaultCapacity)
        : m_capacity(capacity == 0 ? 1 : capacity) {}

    /**
     * @return false if the queue was closed before the event could be queued
     */
    bool push(SessionEvent event) {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_notFull.wait(lock, [this] { return m_closed || m_events.size() < m_capacity; });
        if (m_closed) {
            return false;
        }
        m_events.push_back(std::move(event));
        m_notEmpty.notify_one();
        return true;
    }

    template<typename Rep, typename Period>
    std::optional<SessionEvent> pop(std::chrono::duration<Rep, Period> timeout) {
        std::unique_lock<std::mutex> lock(m_mutex);
        if (!m_notEmpty.wait_for(lock, timeout, [this] { return m_closed || !m_events.empty(); })) {
            return std::nullopt;
        }
        if (m_events.empty()) {
            return std::nullopt;
        }
        SessionEvent event = std::move(m_events.front());
        m_events.pop_front();
        m_notFull.notify_one();
        return event;
    }

    /**
     * No further pushes succeed; queued events can still be popped
     */
    void close() {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_closed = true;
        }
        m_notEmpty.notify_all();
        m_notFull.notify_all();
    }

    bool isClosed() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_closed;
    }

    /**
     * Closed and fully drained
     */
    bool isFinished() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_closed && m_events.empty();
    }

private:
    size_t m_capacity;
    std::deque<SessionEvent> m_events;
    bool m_closed{false};

    mutable std::mutex m_mutex;
    std::condition_variable m_notEmpty;
    std::condition_variable m_notFull;
};

} // namespace botarr::core::xdcc
