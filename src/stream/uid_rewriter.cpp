/**
 * @file uid_rewriter.cpp
 * @brief UUID token scanner and rewriter
 */

#include "stream/uid_rewriter.hpp"

#include <array>
#include <cctype>

namespace bulkstream {

namespace {

// Hex digit counts of the five hyphen-separated groups
constexpr std::array<size_t, 5> kGroupLengths = {8, 4, 4, 4, 12};

bool is_word_char(char c) noexcept {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

bool is_hex(char c) noexcept {
  return std::isxdigit(static_cast<unsigned char>(c)) != 0;
}

/// Length of a "<letter><digits>-" segment at the start of text, or 0
size_t prefix_segment(std::string_view text, char letter) noexcept {
  if (text.size() < 3 || text[0] != letter) {
    return 0;
  }
  size_t i = 1;
  while (i < text.size() && std::isdigit(static_cast<unsigned char>(text[i]))) {
    ++i;
  }
  if (i == 1 || i >= text.size() || text[i] != '-') {
    return 0;
  }
  return i + 1;
}

} // namespace

bool is_uid_at(std::string_view text, size_t pos) noexcept {
  if (pos + kUidLength > text.size()) {
    return false;
  }
  if (pos > 0 && is_word_char(text[pos - 1])) {
    return false;
  }

  size_t i = pos;
  for (size_t group = 0; group < kGroupLengths.size(); ++group) {
    if (group > 0) {
      if (text[i] != '-') {
        return false;
      }
      ++i;
    }
    for (size_t n = 0; n < kGroupLengths[group]; ++n, ++i) {
      if (!is_hex(text[i])) {
        return false;
      }
    }
  }

  return i == text.size() || !is_word_char(text[i]);
}

std::string rewrite_uids(std::string_view document, std::string_view prefix) {
  if (prefix.empty()) {
    return std::string(document);
  }

  std::string out;
  out.reserve(document.size() + document.size() / 8);

  size_t pos = 0;
  while (pos < document.size()) {
    if (is_uid_at(document, pos)) {
      out.append(prefix);
      out.push_back('-');
      out.append(document.substr(pos, kUidLength));
      pos += kUidLength;
    } else {
      out.push_back(document[pos]);
      ++pos;
    }
  }
  return out;
}

size_t count_uids(std::string_view document) noexcept {
  size_t count = 0;
  size_t pos = 0;
  while (pos < document.size()) {
    if (is_uid_at(document, pos)) {
      ++count;
      pos += kUidLength;
    } else {
      ++pos;
    }
  }
  return count;
}

std::string_view strip_uid_prefix(std::string_view token) noexcept {
  std::string_view rest = token;
  rest.remove_prefix(prefix_segment(rest, 'p'));
  rest.remove_prefix(prefix_segment(rest, 'o'));
  return is_uid_at(rest, 0) ? rest : token;
}

} // namespace bulkstream
