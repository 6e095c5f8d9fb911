#include <doctest/doctest.h>
#include "utils/StringUtils.hpp"

#include <set>

using botarr::utils::StringUtils;

TEST_CASE("parseSize understands binary units and listing brackets") {
    CHECK(StringUtils::parseSize("1.5G") == 1610612736ULL);
    CHECK(StringUtils::parseSize("[500M]") == 524288000ULL);
    CHECK(StringUtils::parseSize("100KB") == 102400ULL);
    CHECK(StringUtils::parseSize("2 GB") == 2147483648ULL);
    CHECK(StringUtils::parseSize(" 700m ") == 734003200ULL);
    CHECK(StringUtils::parseSize("1024") == 1024ULL);

    CHECK_FALSE(StringUtils::parseSize("").has_value());
    CHECK_FALSE(StringUtils::parseSize("[]").has_value());
    CHECK_FALSE(StringUtils::parseSize("G").has_value());
    CHECK_FALSE(StringUtils::parseSize("big").has_value());
    CHECK_FALSE(StringUtils::parseSize("-1M").has_value());
}

TEST_CASE("sanitizeFileName replaces path and shell characters") {
    CHECK(StringUtils::sanitizeFileName("a/b\\c:d*e?f\"g<h>i|j") == "a_b_c_d_e_f_g_h_i_j");
    CHECK(StringUtils::sanitizeFileName("Normal File [1080p].mkv") == "Normal File [1080p].mkv");
    CHECK(StringUtils::sanitizeFileName("../../etc/passwd") == ".._.._etc_passwd");
    CHECK(StringUtils::sanitizeFileName("..") == "_..");
    CHECK(StringUtils::sanitizeFileName(".") == "_.");
    CHECK(StringUtils::sanitizeFileName("") == "_");
}

TEST_CASE("String helpers") {
    CHECK(StringUtils::trim("  \tvalue \r\n") == "value");
    CHECK(StringUtils::toLower("SceneP2P") == "scenep2p");
    CHECK(StringUtils::equalsIgnoreCase("#Chan", "#chan"));
    const std::vector<std::string> parts = StringUtils::split("a/b//c", '/');
    REQUIRE(parts.size() == 4);
    CHECK(parts[2].empty());
    CHECK(StringUtils::join(parts, "|") == "a|b||c");
    CHECK(StringUtils::replaceAll("a-b-c", "-", "+") == "a+b+c");
    CHECK(StringUtils::startsWith("irc://net", "irc://"));
    CHECK(StringUtils::endsWith("file.mkv", ".mkv"));
    CHECK(StringUtils::contains("** Invalid Pack Number", "Invalid Pack"));
}

TEST_CASE("formatBytes and formatTimestamp") {
    CHECK(StringUtils::formatBytes(512) == "512 B");
    CHECK(StringUtils::formatBytes(1536) == "1.5 KB");
    CHECK(StringUtils::formatBytes(1073741824ULL) == "1.0 GB");

    CHECK(StringUtils::formatTimestamp(std::chrono::system_clock::time_point{}) == "1970-01-01T00:00:00Z");
}

TEST_CASE("generateUUID produces distinct version 4 identifiers") {
    std::set<std::string> seen;
    for (int i = 0; i < 100; ++i) {
        std::string id = StringUtils::generateUUID();
        REQUIRE(id.size() == 36);
        CHECK(id[8] == '-');
        CHECK(id[13] == '-');
        CHECK(id[14] == '4');
        CHECK(id[18] == '-');
        CHECK(id[23] == '-');
        seen.insert(id);
    }
    CHECK(seen.size() == 100);
}
