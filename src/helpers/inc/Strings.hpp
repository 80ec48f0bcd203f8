#ifndef CPUFETCH_HELPERS_STRINGS_HPP
#define CPUFETCH_HELPERS_STRINGS_HPP
/**
 * @file Strings.hpp
 * @brief String helpers shared by the field extractors and the CLI.
 *
 * Text sources (/proc/cpuinfo, lscpu, PowerShell reports) are all line oriented
 * "key: value" formats. These helpers work on std::string_view so extractors can
 * scan a whole report without copying each line.
 *
 * @note No allocation except where a std::string is returned.
 */

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace cpufetch {
namespace helpers {
namespace strings {

/* ----------------------------- Character Classes ----------------------------- */

/// True for space, tab, carriage return and newline.
[[nodiscard]] constexpr bool isSpace(char c) noexcept {
  return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

/// ASCII lowercase; other bytes pass through.
[[nodiscard]] constexpr char toLowerAscii(char c) noexcept {
  return (c >= 'A' && c <= 'Z') ? static_cast<char>(c + ('a' - 'A')) : c;
}

/* ----------------------------- Trimming ----------------------------- */

/**
 * @brief Strip leading and trailing whitespace.
 * @param text Input view.
 * @return Sub-view of text without surrounding whitespace (may be empty).
 */
[[nodiscard]] inline std::string_view trim(std::string_view text) noexcept {
  std::size_t begin = 0;
  while (begin < text.size() && isSpace(text[begin])) {
    ++begin;
  }
  std::size_t end = text.size();
  while (end > begin && isSpace(text[end - 1])) {
    --end;
  }
  return text.substr(begin, end - begin);
}

/* ----------------------------- Comparison ----------------------------- */

/**
 * @brief Check if text starts with prefix.
 */
[[nodiscard]] inline bool startsWith(std::string_view text, std::string_view prefix) noexcept {
  return text.size() >= prefix.size() && text.compare(0, prefix.size(), prefix) == 0;
}

/**
 * @brief Case-insensitive (ASCII) equality.
 */
[[nodiscard]] inline bool equalsIgnoreCase(std::string_view a, std::string_view b) noexcept {
  if (a.size() != b.size()) {
    return false;
  }
  for (std::size_t i = 0; i < a.size(); ++i) {
    if (toLowerAscii(a[i]) != toLowerAscii(b[i])) {
      return false;
    }
  }
  return true;
}

/**
 * @brief Case-insensitive (ASCII) substring search.
 * @param haystack Text to search.
 * @param needle Fragment to look for; an empty needle never matches.
 * @return true if needle occurs anywhere in haystack.
 */
[[nodiscard]] inline bool containsIgnoreCase(std::string_view haystack,
                                             std::string_view needle) noexcept {
  if (needle.empty() || needle.size() > haystack.size()) {
    return false;
  }

  for (std::size_t i = 0; i <= haystack.size() - needle.size(); ++i) {
    bool match = true;
    for (std::size_t j = 0; j < needle.size(); ++j) {
      if (toLowerAscii(haystack[i + j]) != toLowerAscii(needle[j])) {
        match = false;
        break;
      }
    }
    if (match) {
      return true;
    }
  }
  return false;
}

/* ----------------------------- Conversion ----------------------------- */

/**
 * @brief Lowercase copy of text (ASCII only).
 */
[[nodiscard]] inline std::string toLower(std::string_view text) {
  std::string out(text);
  for (char& c : out) {
    c = toLowerAscii(c);
  }
  return out;
}

/* ----------------------------- Splitting ----------------------------- */

/**
 * @brief Split a "key<sep>value" line at the first separator.
 * @param line Input line.
 * @param sep Separator character (':' for /proc/cpuinfo and lscpu).
 * @param key Output: trimmed key.
 * @param value Output: trimmed value (may be empty).
 * @return false if the separator is missing or the key is empty.
 */
[[nodiscard]] inline bool splitKeyValue(std::string_view line, char sep, std::string_view& key,
                                        std::string_view& value) noexcept {
  const std::size_t POS = line.find(sep);
  if (POS == std::string_view::npos) {
    return false;
  }
  key = trim(line.substr(0, POS));
  value = trim(line.substr(POS + 1));
  return !key.empty();
}

/**
 * @brief Split text into tokens separated by any of the delimiter characters.
 * @param text Input text.
 * @param delimiters Delimiter set; whitespace is always trimmed from tokens.
 * @return Non-empty tokens in source order.
 */
[[nodiscard]] inline std::vector<std::string> splitTokens(std::string_view text,
                                                          std::string_view delimiters = " \t") {
  std::vector<std::string> tokens;
  std::size_t start = 0;
  while (start <= text.size()) {
    const std::size_t END = text.find_first_of(delimiters, start);
    const std::string_view TOKEN =
        trim(text.substr(start, END == std::string_view::npos ? text.size() - start : END - start));
    if (!TOKEN.empty()) {
      tokens.emplace_back(TOKEN);
    }
    if (END == std::string_view::npos) {
      break;
    }
    start = END + 1;
  }
  return tokens;
}

/**
 * @brief Split text into lines (LF or CRLF), keeping empty lines.
 * @note Views point into text; text must outlive the result.
 */
[[nodiscard]] inline std::vector<std::string_view> splitLines(std::string_view text) {
  std::vector<std::string_view> lines;
  std::size_t start = 0;
  while (start < text.size()) {
    std::size_t end = text.find('\n', start);
    if (end == std::string_view::npos) {
      end = text.size();
    }
    std::string_view line = text.substr(start, end - start);
    if (!line.empty() && line.back() == '\r') {
      line.remove_suffix(1);
    }
    lines.push_back(line);
    start = end + 1;
  }
  return lines;
}

} // namespace strings
} // namespace helpers
} // namespace cpufetch

#endif // CPUFETCH_HELPERS_STRINGS_HPP
