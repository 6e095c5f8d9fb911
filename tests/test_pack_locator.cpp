#include <doctest/doctest.h>
#include "core/xdcc/PackLocator.hpp"
#include "core/xdcc/XdccError.hpp"

#include <unordered_set>

using namespace botarr::core::xdcc;

static ErrorKind parseError(const std::string& text) {
    try {
        PackLocator::parse(text);
    } catch (const XdccError& e) {
        return e.kind();
    }
    FAIL("expected XdccError for " << text);
    return ErrorKind::SearchFailed;
}

TEST_CASE("PackLocator parses the canonical form") {
    auto locator = PackLocator::parse("irc://Rizon/news/SomeBot/42");

    CHECK(locator.network() == "Rizon");
    CHECK(locator.channel() == "#news");
    CHECK(locator.bot() == "SomeBot");
    CHECK(locator.slot() == 42u);
    CHECK(locator.botKey() == "SomeBot@Rizon");
}

TEST_CASE("PackLocator accepts an explicit channel hash and a hashed slot") {
    auto locator = PackLocator::parse("irc://irc.example.org/#movies/Bot|01/#7");

    CHECK(locator.network() == "irc.example.org");
    CHECK(locator.channel() == "#movies");
    CHECK(locator.bot() == "Bot|01");
    CHECK(locator.slot() == 7u);
}

TEST_CASE("PackLocator text form round-trips") {
    const char* inputs[] = {
        "irc://Rizon/news/SomeBot/42",
        "irc://Rizon/#news/SomeBot/#42",
        "irc://SceneP2P/##double/B/0",
        "irc://net/chan/bot/4294967295",
    };

    for (const char* input : inputs) {
        CAPTURE(input);
        auto first = PackLocator::parse(input);
        auto second = PackLocator::parse(first.toText());
        CHECK(first == second);
        CHECK(second.toText() == first.toText());
    }

    CHECK(PackLocator::parse("irc://Rizon/#news/SomeBot/#42").toText() == "irc://Rizon/news/SomeBot/42");
    CHECK(PackLocator::parse("irc://SceneP2P/##double/B/0").channel() == "##double");
}

TEST_CASE("PackLocator rejects malformed input as InvalidUrl") {
    CHECK(parseError("http://Rizon/news/Bot/1") == ErrorKind::InvalidUrl);
    CHECK(parseError("Rizon/news/Bot/1") == ErrorKind::InvalidUrl);
    CHECK(parseError("irc://Rizon/news/Bot") == ErrorKind::InvalidUrl);
    CHECK(parseError("irc://Rizon/news/Bot/1/extra") == ErrorKind::InvalidUrl);
    CHECK(parseError("irc:///news/Bot/1") == ErrorKind::InvalidUrl);
    CHECK(parseError("irc://Rizon//Bot/1") == ErrorKind::InvalidUrl);
    CHECK(parseError("irc://Rizon/#/Bot/1") == ErrorKind::InvalidUrl);
    CHECK(parseError("irc://Rizon/news//1") == ErrorKind::InvalidUrl);
    CHECK(parseError("irc://Rizon/news/Bot/") == ErrorKind::InvalidUrl);
    CHECK(parseError("irc://Rizon/news/Bot/#") == ErrorKind::InvalidUrl);
    CHECK(parseError("irc://Rizon/news/Bot/-1") == ErrorKind::InvalidUrl);
    CHECK(parseError("irc://Rizon/news/Bot/12abc") == ErrorKind::InvalidUrl);
    CHECK(parseError("irc://Rizon/news/Bot/4294967296") == ErrorKind::InvalidUrl);
}

TEST_CASE("PackLocator is usable as a hash key") {
    std::unordered_set<PackLocator> set;
    set.insert(PackLocator::parse("irc://Rizon/news/Bot/1"));
    set.insert(PackLocator::parse("irc://Rizon/#news/Bot/#1"));
    set.insert(PackLocator::parse("irc://Rizon/news/Bot/2"));

    CHECK(set.size() == 2);
    CHECK(PackLocator("Rizon", "news", "Bot", 1) == PackLocator("Rizon", "#news", "Bot", 1));
    CHECK(PackLocator("Rizon", "news", "Bot", 1) != PackLocator("rizon", "news", "Bot", 1));
}

TEST_CASE("PackLocator JSON uses the full channel name") {
    auto j = PackLocator::parse("irc://Rizon/news/Bot/3").toJson();
    CHECK(j["network"] == "Rizon");
    CHECK(j["channel"] == "#news");
    CHECK(j["bot"] == "Bot");
    CHECK(j["slot"] == 3);
}

TEST_CASE("Error kinds carry their retry classification") {
    CHECK(isFatal(ErrorKind::InvalidUrl));
    CHECK(isFatal(ErrorKind::InvalidPack));
    CHECK(isFatal(ErrorKind::BotBusy));
    CHECK(isFatal(ErrorKind::ChannelJoinFailed));
    CHECK(isFatal(ErrorKind::SearchFailed));
    CHECK_FALSE(isFatal(ErrorKind::ConnectionFailed));
    CHECK_FALSE(isFatal(ErrorKind::Timeout));
    CHECK_FALSE(isFatal(ErrorKind::TransferFailed));

    XdccError error(ErrorKind::InvalidPack, "pack #9 does not exist");
    CHECK(std::string(error.what()) == "Invalid pack: pack #9 does not exist");
    CHECK(error.detail() == "pack #9 does not exist");
    CHECK(error.isFatal());
}
