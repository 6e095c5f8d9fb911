/**
 * StringUtils.cpp
 *
 * String manipulation and formatting utilities.
 */

#include "StringUtils.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <random>
#include <sstream>

namespace botarr::utils {

// -- Trimming --

std::string StringUtils::trim(const std::string& str) {
    auto start = str.find_first_not_of(" \t\n\r\f\v");
    if (start == std::string::npos) return "";
    auto end = str.find_last_not_of(" \t\n\r\f\v");
    return str.substr(start, end - start + 1);
}

// -- Case conversion --

std::string StringUtils::toLower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string StringUtils::toUpper(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return result;
}

bool StringUtils::equalsIgnoreCase(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

// -- Split/Join --

std::vector<std::string> StringUtils::split(const std::string& str, char delimiter) {
    std::vector<std::string> parts;
    size_t prev = 0, pos = 0;
    while ((pos = str.find(delimiter, prev)) != std::string::npos) {
        parts.push_back(str.substr(prev, pos - prev));
        prev = pos + 1;
    }
    parts.push_back(str.substr(prev));
    return parts;
}

std::string StringUtils::join(const std::vector<std::string>& parts, const std::string& separator) {
    if (parts.empty()) return "";
    std::string result = parts[0];
    for (size_t i = 1; i < parts.size(); ++i) result += separator + parts[i];
    return result;
}

// -- Search/Replace --

std::string StringUtils::replaceAll(const std::string& str, const std::string& from, const std::string& to) {
    if (from.empty()) return str;
    std::string result = str;
    size_t pos = 0;
    while ((pos = result.find(from, pos)) != std::string::npos) {
        result.replace(pos, from.size(), to);
        pos += to.size();
    }
    return result;
}

bool StringUtils::contains(const std::string& str, const std::string& substr) {
    return str.find(substr) != std::string::npos;
}

bool StringUtils::startsWith(const std::string& str, const std::string& prefix) {
    return str.size() >= prefix.size() && str.compare(0, prefix.size(), prefix) == 0;
}

bool StringUtils::endsWith(const std::string& str, const std::string& suffix) {
    return str.size() >= suffix.size() &&
           str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// -- Formatting --

std::string StringUtils::formatBytes(uint64_t bytes) {
    static const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    double value = static_cast<double>(bytes);
    int unit = 0;
    while (value >= 1024.0 && unit < 4) {
        value /= 1024.0;
        ++unit;
    }
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(unit == 0 ? 0 : 1) << value << " " << units[unit];
    return oss.str();
}

std::string StringUtils::formatTimestamp(std::chrono::system_clock::time_point time,
                                         const std::string& format) {
    std::time_t t = std::chrono::system_clock::to_time_t(time);
    std::tm tm{};
#ifdef _WIN32
    gmtime_s(&tm, &t);
#else
    gmtime_r(&t, &tm);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tm, format.c_str());
    return oss.str();
}

// -- UUID --

std::string StringUtils::generateUUID() {
    static thread_local std::mt19937_64 rng{std::random_device{}()};
    std::uniform_int_distribution<uint64_t> dist;

    uint64_t hi = dist(rng);
    uint64_t lo = dist(rng);

    // Version 4, RFC 4122 variant
    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    std::ostringstream oss;
    oss << std::hex << std::setfill('0')
        << std::setw(8) << (hi >> 32) << '-'
        << std::setw(4) << ((hi >> 16) & 0xFFFF) << '-'
        << std::setw(4) << (hi & 0xFFFF) << '-'
        << std::setw(4) << (lo >> 48) << '-'
        << std::setw(12) << (lo & 0xFFFFFFFFFFFFULL);
    return oss.str();
}

std::string StringUtils::randomNumber(uint32_t below) {
    static thread_local std::mt19937 rng{std::random_device{}()};
    std::uniform_int_distribution<uint32_t> dist(0, below > 0 ? below - 1 : 0);
    return std::to_string(dist(rng));
}

// -- File names --

std::string StringUtils::sanitizeFileName(const std::string& name) {
    std::string result = name;
    for (char& c : result) {
        switch (c) {
            case '/': case '\\': case ':': case '*': case '?':
            case '"': case '<': case '>': case '|':
                c = '_';
                break;
            default:
                break;
        }
    }
    // Never resolve to the directory itself or its parent
    if (result.empty() || result == "." || result == "..") {
        result = "_" + result;
    }
    return result;
}

// -- Parsing --

std::optional<uint64_t> StringUtils::parseSize(const std::string& str) {
    std::string s = trim(str);
    if (!s.empty() && s.front() == '[') s.erase(0, 1);
    if (!s.empty() && s.back() == ']') s.pop_back();
    s = toUpper(trim(s));
    if (s.empty()) {
        return std::nullopt;
    }

    uint64_t multiplier = 1;
    if (endsWith(s, "B") && s.size() > 1 &&
        (s[s.size() - 2] == 'G' || s[s.size() - 2] == 'M' || s[s.size() - 2] == 'K')) {
        s.pop_back();
    }
    switch (s.back()) {
        case 'G': multiplier = 1024ULL * 1024 * 1024; s.pop_back(); break;
        case 'M': multiplier = 1024ULL * 1024; s.pop_back(); break;
        case 'K': multiplier = 1024ULL; s.pop_back(); break;
        default: break;
    }

    s = trim(s);
    if (s.empty()) {
        return std::nullopt;
    }

    try {
        size_t consumed = 0;
        double value = std::stod(s, &consumed);
        if (consumed != s.size() || value < 0.0) {
            return std::nullopt;
        }
        return static_cast<uint64_t>(value * static_cast<double>(multiplier));
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

} // namespace botarr::utils
