// Botarr - String Utilities
// String manipulation, parsing and formatting

#pragma once

#include <string>
#include <vector>
#include <optional>
#include <chrono>
#include <cstdint>

namespace botarr::utils {

/**
 * @brief String manipulation utilities
 */
class StringUtils {
public:
    // Trimming
    static std::string trim(const std::string& str);

    // Case conversion
    static std::string toLower(const std::string& str);
    static std::string toUpper(const std::string& str);
    static bool equalsIgnoreCase(const std::string& a, const std::string& b);

    // Splitting and joining
    static std::vector<std::string> split(const std::string& str, char delimiter);
    static std::string join(const std::vector<std::string>& parts, const std::string& separator);

    // Search and replace
    static std::string replaceAll(const std::string& str, const std::string& from, const std::string& to);
    static bool contains(const std::string& str, const std::string& substr);
    static bool startsWith(const std::string& str, const std::string& prefix);
    static bool endsWith(const std::string& str, const std::string& suffix);

    // Formatting
    static std::string formatBytes(uint64_t bytes);
    static std::string formatTimestamp(std::chrono::system_clock::time_point time,
                                       const std::string& format = "%Y-%m-%dT%H:%M:%SZ");

    // UUID (version 4, random)
    static std::string generateUUID();

    // Decimal text of a random number in [0, below)
    static std::string randomNumber(uint32_t below);

    /**
     * Replace characters that are unsafe in file names (/ \ : * ? " < > |)
     * with an underscore. Empty, "." and ".." get a leading underscore.
     */
    static std::string sanitizeFileName(const std::string& name);

    /**
     * Parse a human readable size such as "1.5G", "[500M]" or "100KB"
     * (binary multiples, case-insensitive, optional brackets).
     * @return Size in bytes, or std::nullopt for empty or malformed input
     */
    static std::optional<uint64_t> parseSize(const std::string& str);
};

} // namespace botarr::utils
