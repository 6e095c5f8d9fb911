#include <doctest/doctest.h>
#include "core/ThreadPool.hpp"
#include "core/xdcc/DownloadDriver.hpp"
#include "support/FakeXdccBot.hpp"
#include "support/LoopbackServer.hpp"

#include <mutex>
#include <thread>

using namespace botarr::core;
using namespace botarr::core::xdcc;
using namespace botarr::test;
using namespace std::chrono_literals;

namespace {

XdccSettings driverSettings(uint16_t port, const TempDir& dir) {
    XdccSettings settings;
    settings.nickname = "botarr";
    settings.generalTimeout = std::chrono::seconds(3);
    settings.connectTimeout = std::chrono::seconds(3);
    settings.downloadDirectory = dir.path().string();

    NetworkSettings network;
    network.host = "127.0.0.1";
    network.port = port;
    network.ssl = false;
    network.joinDelay = 0;
    settings.networks["TestNet"] = network;
    return settings;
}

const PackLocator kLocator("TestNet", "#test", "Bot", 7);

} // namespace

TEST_CASE("Driver completes a transfer and runs the completion hook") {
    TempDir dir;
    FakeXdccBot::Script script;
    script.filename = "show.mkv";
    script.payload = patternData(4096);
    FakeXdccBot bot(script);

    TransferManager manager(dir.path().string());
    ThreadPool pool(2);
    DownloadDriver driver(manager, pool, driverSettings(bot.port(), dir), 0ms);

    std::mutex mutex;
    std::string hookId;
    std::filesystem::path hookFile;
    driver.setCompletionHook([&](const std::string& id, const std::filesystem::path& file) {
        std::lock_guard<std::mutex> lock(mutex);
        hookId = id;
        hookFile = file;
    });

    std::string id = driver.start(kLocator, TransferPriority::High);
    REQUIRE(driver.waitForAll(20s));
    bot.finish();

    CHECK_FALSE(manager.getTransfer(id).has_value());
    auto history = manager.getHistory();
    REQUIRE(history.size() == 1);
    CHECK(history[0].id == id);
    CHECK(history[0].status == TransferStatus::Completed);
    CHECK(history[0].filename == std::string("show.mkv"));
    CHECK(history[0].downloaded == 4096);

    {
        std::lock_guard<std::mutex> lock(mutex);
        CHECK(hookId == id);
        CHECK(hookFile == dir.path() / "show.mkv");
    }
    CHECK(readFile(dir.path() / "show.mkv") == script.payload);

    auto analytics = manager.getAnalytics();
    CHECK(analytics.successfulDownloads == 1);
    CHECK(analytics.totalBytesDownloaded == 4096);
    CHECK(driver.outstanding() == 0);
}

TEST_CASE("Driver retries retryable failures until the budget is spent") {
    TempDir dir;
    TransferManager manager(dir.path().string(), 2);
    ThreadPool pool(2);
    DownloadDriver driver(manager, pool, driverSettings(closedLoopbackPort(), dir), 0ms);

    std::string id = driver.start(kLocator);
    REQUIRE(driver.waitForAll(20s));

    CHECK_FALSE(manager.getTransfer(id).has_value());
    auto history = manager.getHistory();
    REQUIRE(history.size() == 1);
    CHECK(history[0].status == TransferStatus::Failed);
    REQUIRE(history[0].error.has_value());
    CHECK(history[0].error->rfind("Connection failed: ", 0) == 0);

    auto analytics = manager.getAnalytics();
    CHECK(analytics.totalDownloads == 1);
    CHECK(analytics.failedDownloads == 1);

    auto stats = manager.getAllBotStats();
    REQUIRE(stats.size() == 1);
    CHECK(stats[0].failedDownloads == 1);
    CHECK(stats[0].totalDownloads == 1);
}

TEST_CASE("Driver does not retry fatal failures") {
    TempDir dir;
    FakeXdccBot::Script script;
    script.invalidPack = true;
    FakeXdccBot bot(script);

    TransferManager manager(dir.path().string(), 5);
    ThreadPool pool(1);
    DownloadDriver driver(manager, pool, driverSettings(bot.port(), dir), 0ms);

    std::string id = driver.start(kLocator);
    REQUIRE(driver.waitForAll(20s));
    bot.finish();

    auto history = manager.getHistory();
    REQUIRE(history.size() == 1);
    CHECK(history[0].id == id);
    CHECK(history[0].status == TransferStatus::Failed);
    CHECK(history[0].error->rfind("Invalid pack: ", 0) == 0);
}

TEST_CASE("Cancelling during the retry backoff stops the transfer") {
    TempDir dir;
    TransferManager manager(dir.path().string(), 3);
    ThreadPool pool(1);
    DownloadDriver driver(manager, pool, driverSettings(closedLoopbackPort(), dir), 30s);

    std::string id = driver.start(kLocator);

    auto deadline = std::chrono::steady_clock::now() + 10s;
    while (std::chrono::steady_clock::now() < deadline) {
        auto transfer = manager.getTransfer(id);
        if (transfer && transfer->retryCount == 1) {
            break;
        }
        std::this_thread::sleep_for(10ms);
    }
    REQUIRE(manager.getTransfer(id)->retryCount == 1);
    CHECK(driver.outstanding() == 1);

    CHECK(driver.cancel(id));
    REQUIRE(driver.waitForAll(5s));

    auto transfer = manager.getTransfer(id);
    REQUIRE(transfer);
    CHECK(transfer->transfer.status == TransferStatus::Cancelled);
    CHECK(transfer->retryCount == 1);
    CHECK(manager.getHistory().empty());
}

TEST_CASE("cancelAll only counts transfers that are still running") {
    TempDir dir;
    FakeXdccBot::Script script;
    script.holdAfterJoin = true;
    FakeXdccBot bot(script);

    TransferManager manager(dir.path().string());
    ThreadPool pool(1);
    DownloadDriver driver(manager, pool, driverSettings(bot.port(), dir), 0ms);

    std::string id = driver.start(kLocator);

    auto deadline = std::chrono::steady_clock::now() + 10s;
    while (std::chrono::steady_clock::now() < deadline &&
           manager.getTransfer(id)->transfer.status != TransferStatus::Requesting) {
        std::this_thread::sleep_for(10ms);
    }
    REQUIRE(manager.getTransfer(id)->transfer.status == TransferStatus::Requesting);

    CHECK(driver.cancelAll() == 1);
    REQUIRE(driver.waitForAll(5s));
    CHECK(driver.cancelAll() == 0);

    CHECK(manager.getTransfer(id)->transfer.status == TransferStatus::Cancelled);
    CHECK(manager.getHistory().empty());
}

TEST_CASE("Manual retry runs a new attempt") {
    TempDir dir;
    TransferManager manager(dir.path().string(), 1);
    ThreadPool pool(1);

    FakeXdccBot::Script script;
    script.payload = patternData(100);
    FakeXdccBot bot(script);
    DownloadDriver driver(manager, pool, driverSettings(bot.port(), dir), 0ms);

    // Queued but cancelled before its attempt could run
    auto created = manager.createTransfer(kLocator);
    manager.cancelTransfer(created.id);

    CHECK(driver.retry(created.id));
    REQUIRE(driver.waitForAll(20s));
    bot.finish();

    auto history = manager.getHistory();
    REQUIRE(history.size() == 1);
    CHECK(history[0].id == created.id);
    CHECK(history[0].status == TransferStatus::Completed);

    CHECK_FALSE(driver.retry(created.id));
}
