/**
 * @file params.cpp
 * @brief Parameter parsing implementation
 */

#include "common/params.hpp"

#include <array>
#include <cctype>
#include <charconv>

namespace bulkstream {

namespace {

std::string_view trim(std::string_view text) noexcept {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }
    return text;
}

bool iequals(std::string_view a, std::string_view b) noexcept {
    if (a.size() != b.size()) {
        return false;
    }
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

constexpr std::array<std::string_view, 7> kFalseWords = {
    "0", "no", "false", "off", "null", "undefined", "nan",
};

}  // namespace

std::optional<uint64_t> try_parse_uint(std::string_view text) noexcept {
    text = trim(text);
    if (text.empty() || text.front() == '-' || text.front() == '+') {
        return std::nullopt;
    }

    uint64_t value = 0;
    const char* first = text.data();
    const char* last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc() || ptr != last) {
        return std::nullopt;
    }
    return value;
}

uint64_t parse_uint(std::string_view text, uint64_t fallback) noexcept {
    return try_parse_uint(text).value_or(fallback);
}

bool parse_bool(std::string_view text) noexcept {
    text = trim(text);
    if (text.empty()) {
        return false;
    }
    for (auto word : kFalseWords) {
        if (iequals(text, word)) {
            return false;
        }
    }
    return true;
}

}  // namespace bulkstream
