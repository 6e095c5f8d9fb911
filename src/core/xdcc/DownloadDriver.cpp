/**
 * DownloadDriver.cpp
 */

#include "DownloadDriver.hpp"
#include "ProtocolSession.hpp"
#include "../Logger.hpp"
#include "../../utils/StringUtils.hpp"

#include <thread>
#include <type_traits>
#include <variant>

namespace botarr::core::xdcc {

using utils::StringUtils;

namespace {

/**
 * Closes the event queue and joins the session thread, so a consumer that
 * leaves early never blocks the producer on a full queue.
 */
class SessionThreadGuard {
public:
    SessionThreadGuard(std::thread& thread, EventQueue& queue)
        : m_thread(thread), m_queue(queue) {}

    ~SessionThreadGuard() {
        m_queue.close();
        if (m_thread.joinable()) {
            m_thread.join();
        }
    }

private:
    std::thread& m_thread;
    EventQueue& m_queue;
};

} // namespace

DownloadDriver::DownloadDriver(TransferManager& manager,
                               ThreadPool& pool,
                               XdccSettings settings,
                               std::chrono::milliseconds retryDelay)
    : m_manager(manager)
    , m_pool(pool)
    , m_settings(std::move(settings))
    , m_retryDelay(retryDelay) {
}

DownloadDriver::~DownloadDriver() {
    cancelAll();

    std::unique_lock<std::mutex> lock(m_outstandingMutex);
    m_outstandingCondition.wait(lock, [this] { return m_outstanding == 0; });
}

void DownloadDriver::setCompletionHook(CompletionHook hook) {
    std::lock_guard<std::mutex> lock(m_hookMutex);
    m_completionHook = std::move(hook);
}

std::string DownloadDriver::start(const PackLocator& locator, TransferPriority priority) {
    auto created = m_manager.createTransfer(locator, priority);
    dispatch(created.id, locator, created.handle);
    return created.id;
}

bool DownloadDriver::retry(const std::string& id) {
    if (!m_manager.retryTransfer(id)) {
        Logger::instance().warn("Retry rejected for transfer {}", id);
        return false;
    }

    auto handle = m_manager.renewCancellationHandle(id);
    auto transfer = m_manager.getTransfer(id);
    if (!handle || !transfer) {
        return false;
    }

    dispatch(id, transfer->transfer.locator, handle);
    return true;
}

bool DownloadDriver::cancel(const std::string& id) {
    return m_manager.cancelTransfer(id);
}

size_t DownloadDriver::cancelAll() {
    size_t cancelled = 0;
    for (const auto& transfer : m_manager.listTransfers()) {
        if (!isTerminal(transfer.transfer.status) && m_manager.cancelTransfer(transfer.transfer.id)) {
            ++cancelled;
        }
    }

    if (cancelled > 0) {
        Logger::instance().info("Cancelled {} transfer(s)", cancelled);
    }
    return cancelled;
}

bool DownloadDriver::waitForAll(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(m_outstandingMutex);
    return m_outstandingCondition.wait_for(lock, timeout, [this] { return m_outstanding == 0; });
}

size_t DownloadDriver::outstanding() const {
    std::lock_guard<std::mutex> lock(m_outstandingMutex);
    return m_outstanding;
}

void DownloadDriver::dispatch(const std::string& id, const PackLocator& locator, CancellationHandlePtr handle) {
    TransferPriority priority = TransferPriority::Normal;
    if (auto transfer = m_manager.getTransfer(id)) {
        priority = transfer->priority;
    }

    {
        std::lock_guard<std::mutex> lock(m_outstandingMutex);
        ++m_outstanding;
    }

    try {
        m_pool.submitPriority(static_cast<int>(priority), [this, id, locator, handle]() {
            struct Finisher {
                DownloadDriver* driver;
                ~Finisher() { driver->finishAttempt(); }
            } finisher{this};

            runAttempt(id, locator, handle);
        });
    } catch (const std::runtime_error& e) {
        Logger::instance().error("Cannot schedule transfer {}: {}", id, e.what());
        finishAttempt();
        m_manager.setFailed(id, e.what(), true);
    }
}

void DownloadDriver::runAttempt(const std::string& id,
                                const PackLocator& locator,
                                const CancellationHandlePtr& handle) {
    if (handle->isCancelled()) {
        Logger::instance().debug("Skipping cancelled attempt of {}", id);
        return;
    }

    Logger::instance().info("Starting attempt for {} ({})", id, locator.toText());
    m_manager.updateStatus(id, TransferStatus::Connecting);

    auto queue = std::make_shared<EventQueue>();
    auto session = std::make_shared<ProtocolSession>(locator, m_settings, queue, handle);

    std::optional<RetryDirective> directive;
    {
        std::thread producer([session]() { session->run(); });
        SessionThreadGuard guard(producer, *queue);
        directive = consumeEvents(id, *queue, handle);
    }

    if (!directive) {
        return;
    }

    Logger::instance().info("Retrying {} in {}s", id,
                            std::chrono::duration_cast<std::chrono::seconds>(m_retryDelay).count());
    if (directive->handle->waitFor(m_retryDelay)) {
        Logger::instance().info("Retry of {} cancelled during backoff", id);
        return;
    }

    dispatch(id, directive->locator, directive->handle);
}

std::optional<RetryDirective> DownloadDriver::consumeEvents(const std::string& id,
                                                            EventQueue& queue,
                                                            const CancellationHandlePtr& handle) {
    std::optional<RetryDirective> directive;
    std::optional<std::string> filename;
    bool finished = false;

    while (true) {
        auto event = queue.pop(kEventPollInterval);
        if (!event) {
            if (queue.isFinished()) {
                break;
            }
            continue;
        }

        // A cancelled attempt is drained without touching the manager
        if (handle->isCancelled()) {
            continue;
        }

        std::visit([&](auto&& e) {
            using T = std::decay_t<decltype(e)>;

            if constexpr (std::is_same_v<T, events::Connecting>) {
                m_manager.updateStatus(id, TransferStatus::Connecting);
            } else if constexpr (std::is_same_v<T, events::Connected>) {
                Logger::instance().debug("Transfer {} connected", id);
            } else if constexpr (std::is_same_v<T, events::Joining>) {
                m_manager.updateStatus(id, TransferStatus::Joining);
            } else if constexpr (std::is_same_v<T, events::Joined>) {
                Logger::instance().debug("Transfer {} joined {}", id, e.channel);
            } else if constexpr (std::is_same_v<T, events::Requesting>) {
                m_manager.updateStatus(id, TransferStatus::Requesting);
            } else if constexpr (std::is_same_v<T, events::Offer>) {
                filename = e.offer.filename;
                m_manager.setFileInfo(id, e.offer.filename, e.offer.size);
                m_manager.updateStatus(id, TransferStatus::Downloading);
            } else if constexpr (std::is_same_v<T, events::Progress>) {
                m_manager.updateProgress(id, e.downloaded, e.speed);
            } else if constexpr (std::is_same_v<T, events::Completed>) {
                finished = true;
                m_manager.setCompleted(id);
                if (filename) {
                    runCompletionHook(id, std::filesystem::path(m_settings.downloadDirectory) /
                                          StringUtils::sanitizeFileName(*filename));
                }
            } else if constexpr (std::is_same_v<T, events::Error>) {
                finished = true;
                directive = m_manager.setFailed(id, e.message, isFatal(e.kind));
            }
        }, *event);
    }

    if (!finished && !handle->isCancelled()) {
        directive = m_manager.setFailed(id, "Session ended without a result", false);
    }
    return directive;
}

void DownloadDriver::runCompletionHook(const std::string& id, const std::filesystem::path& file) {
    CompletionHook hook;
    {
        std::lock_guard<std::mutex> lock(m_hookMutex);
        hook = m_completionHook;
    }
    if (!hook) {
        return;
    }

    try {
        hook(id, file);
    } catch (const std::exception& e) {
        Logger::instance().error("Completion hook failed for {}: {}", id, e.what());
    }
}

void DownloadDriver::finishAttempt() {
    {
        std::lock_guard<std::mutex> lock(m_outstandingMutex);
        --m_outstanding;
    }
    m_outstandingCondition.notify_all();
}

} // namespace botarr::core::xdcc
