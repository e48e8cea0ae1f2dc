#pragma once

#include "common.h"
#include <string>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <optional>
#include <sstream>
#include <vector>

namespace viva {

/**
 * @brief String, encoding and time utility functions
 */
namespace utils {

/**
 * @brief Trim whitespace from both ends of a string
 * @param str String to trim (modified in place)
 * @return Reference to the trimmed string
 */
inline std::string& trim(std::string& str) {
    str.erase(0, str.find_first_not_of(" \t\n\r"));
    str.erase(str.find_last_not_of(" \t\n\r") + 1);
    return str;
}

/**
 * @brief Trim whitespace from both ends of a string (returns copy)
 */
inline std::string trim_copy(const std::string& str) {
    std::string result = str;
    trim(result);
    return result;
}

/**
 * @brief Normalize string to lowercase (modified in place)
 */
inline std::string& normalize(std::string& str) {
    std::transform(str.begin(), str.end(), str.begin(),
                  [](unsigned char c) { return std::tolower(c); });
    return str;
}

/**
 * @brief Normalize string to lowercase (returns copy)
 */
inline std::string normalize_copy(const std::string& str) {
    std::string result = str;
    normalize(result);
    return result;
}

/**
 * @brief Check if string is empty or contains only whitespace
 */
inline bool is_empty_or_whitespace(const std::string& str) {
    return str.find_first_not_of(" \t\n\r") == std::string::npos;
}

/**
 * @brief Count whitespace-separated words
 */
inline size_t word_count(const std::string& str) {
    std::istringstream iss(str);
    size_t count = 0;
    std::string word;
    while (iss >> word) {
        ++count;
    }
    return count;
}

/**
 * @brief First max_chars characters of str (whole string when shorter)
 */
inline std::string truncate(const std::string& str, size_t max_chars) {
    return str.size() <= max_chars ? str : str.substr(0, max_chars);
}

/**
 * @brief Truncate for log lines, appending "..." when cut
 */
inline std::string preview(const std::string& str, size_t max_chars = 50) {
    return str.size() <= max_chars ? str : str.substr(0, max_chars) + "...";
}

/**
 * @brief Round to a fixed number of decimal places
 */
inline double round_to(double value, int decimals) {
    double scale = std::pow(10.0, decimals);
    return std::round(value * scale) / scale;
}

/**
 * @brief Local wall-clock time in ISO 8601 form (seconds precision)
 */
inline std::string iso_timestamp(std::time_t t = std::time(nullptr)) {
    std::tm tm_buf{};
    localtime_r(&t, &tm_buf);
    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S");
    return oss.str();
}

/**
 * @brief Standard base64 encoding (with padding)
 */
inline std::string base64_encode(const uint8_t* data, size_t len) {
    static const char alphabet[] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
    std::string out;
    out.reserve(((len + 2) / 3) * 4);
    size_t i = 0;
    while (i + 2 < len) {
        uint32_t n = (static_cast<uint32_t>(data[i]) << 16) |
                     (static_cast<uint32_t>(data[i + 1]) << 8) |
                     static_cast<uint32_t>(data[i + 2]);
        out += alphabet[(n >> 18) & 0x3F];
        out += alphabet[(n >> 12) & 0x3F];
        out += alphabet[(n >> 6) & 0x3F];
        out += alphabet[n & 0x3F];
        i += 3;
    }
    size_t rest = len - i;
    if (rest == 1) {
        uint32_t n = static_cast<uint32_t>(data[i]) << 16;
        out += alphabet[(n >> 18) & 0x3F];
        out += alphabet[(n >> 12) & 0x3F];
        out += "==";
    } else if (rest == 2) {
        uint32_t n = (static_cast<uint32_t>(data[i]) << 16) |
                     (static_cast<uint32_t>(data[i + 1]) << 8);
        out += alphabet[(n >> 18) & 0x3F];
        out += alphabet[(n >> 12) & 0x3F];
        out += alphabet[(n >> 6) & 0x3F];
        out += '=';
    }
    return out;
}

inline std::string base64_encode(const ByteBuffer& bytes) {
    return base64_encode(bytes.data(), bytes.size());
}

/**
 * @brief Decode standard base64; whitespace is skipped
 * @return Decoded bytes, or nullopt on an invalid character or bad padding
 */
inline std::optional<ByteBuffer> base64_decode(const std::string& encoded) {
    auto value_of = [](char c) -> int {
        if (c >= 'A' && c <= 'Z') return c - 'A';
        if (c >= 'a' && c <= 'z') return c - 'a' + 26;
        if (c >= '0' && c <= '9') return c - '0' + 52;
        if (c == '+' || c == '-') return 62;
        if (c == '/' || c == '_') return 63;
        return -1;
    };

    ByteBuffer out;
    out.reserve(encoded.size() * 3 / 4);
    uint32_t acc = 0;
    int bits = 0;
    size_t padding = 0;
    for (char c : encoded) {
        if (std::isspace(static_cast<unsigned char>(c))) continue;
        if (c == '=') {
            ++padding;
            continue;
        }
        if (padding > 0) return std::nullopt;  // data after padding
        int v = value_of(c);
        if (v < 0) return std::nullopt;
        acc = (acc << 6) | static_cast<uint32_t>(v);
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            out.push_back(static_cast<uint8_t>((acc >> bits) & 0xFF));
        }
    }
    if (padding > 2 || bits >= 6) return std::nullopt;
    return out;
}

} // namespace utils

} // namespace viva
