/**
 * @file FieldParsers.cpp
 * @brief Scalar parsers for cache sizes, counts, frequencies and CPU lists.
 */

#include "src/cpu/inc/FieldParsers.hpp"
#include "src/helpers/inc/Strings.hpp"

#include <cmath>   // std::llround, std::isfinite
#include <cstdlib> // std::strtod, std::strtol
#include <limits>  // std::numeric_limits
#include <string>  // std::string

namespace cpufetch {

namespace cpu {

using cpufetch::helpers::strings::equalsIgnoreCase;
using cpufetch::helpers::strings::trim;

namespace {

constexpr long long MAX_KB = std::numeric_limits<std::uint32_t>::max();

/// True if c is an ASCII digit.
constexpr bool isDigit(char c) noexcept { return c >= '0' && c <= '9'; }

/// Length of the leading "digits[.digits]" run of text; 0 if none.
std::size_t numberPrefixLength(std::string_view text) noexcept {
  std::size_t i = 0;
  bool sawDigit = false;
  while (i < text.size() && isDigit(text[i])) {
    ++i;
    sawDigit = true;
  }
  if (i < text.size() && text[i] == '.') {
    std::size_t j = i + 1;
    while (j < text.size() && isDigit(text[j])) {
      ++j;
      sawDigit = true;
    }
    i = j;
  }
  return sawDigit ? i : 0;
}

/// KB multiplier for a unit suffix, 0 if the suffix is not recognized.
long long suffixMultiplier(std::string_view suffix) noexcept {
  if (suffix.empty() || equalsIgnoreCase(suffix, "K") || equalsIgnoreCase(suffix, "KB") ||
      equalsIgnoreCase(suffix, "KiB")) {
    return 1;
  }
  if (equalsIgnoreCase(suffix, "M") || equalsIgnoreCase(suffix, "MB") ||
      equalsIgnoreCase(suffix, "MiB")) {
    return 1024;
  }
  if (equalsIgnoreCase(suffix, "G") || equalsIgnoreCase(suffix, "GB") ||
      equalsIgnoreCase(suffix, "GiB")) {
    return 1024LL * 1024LL;
  }
  return 0;
}

} // namespace

/* ----------------------------- Numbers ----------------------------- */

std::optional<std::uint32_t> parseUnsigned(std::string_view text) noexcept {
  const std::string_view DIGITS = trim(text);
  if (DIGITS.empty() || DIGITS.size() > 10) {
    return std::nullopt;
  }

  unsigned long long value = 0;
  for (const char C : DIGITS) {
    if (!isDigit(C)) {
      return std::nullopt;
    }
    value = value * 10ULL + static_cast<unsigned long long>(C - '0');
  }
  if (value > std::numeric_limits<std::uint32_t>::max()) {
    return std::nullopt;
  }
  return static_cast<std::uint32_t>(value);
}

std::optional<int> parseSigned(std::string_view text) noexcept {
  const std::string_view TRIMMED = trim(text);
  if (TRIMMED.empty()) {
    return std::nullopt;
  }
  const bool NEGATIVE = TRIMMED.front() == '-';
  const auto MAGNITUDE = parseUnsigned(NEGATIVE ? TRIMMED.substr(1) : TRIMMED);
  if (!MAGNITUDE || *MAGNITUDE > static_cast<std::uint32_t>(std::numeric_limits<int>::max())) {
    return std::nullopt;
  }
  const int VALUE = static_cast<int>(*MAGNITUDE);
  return NEGATIVE ? -VALUE : VALUE;
}

std::optional<double> parseDecimal(std::string_view text) noexcept {
  const std::string_view TRIMMED = trim(text);
  const std::size_t LEN = numberPrefixLength(TRIMMED);
  if (LEN == 0 || LEN != TRIMMED.size()) {
    return std::nullopt;
  }

  const std::string NUM(TRIMMED);
  char* endPtr = nullptr;
  const double VALUE = std::strtod(NUM.c_str(), &endPtr);
  if (endPtr == NUM.c_str() || !std::isfinite(VALUE)) {
    return std::nullopt;
  }
  return VALUE;
}

/* ----------------------------- Cache Sizes ----------------------------- */

std::optional<std::uint32_t> parseCacheSizeKb(std::string_view text) noexcept {
  const std::string_view TRIMMED = trim(text);
  const std::size_t LEN = numberPrefixLength(TRIMMED);
  if (LEN == 0) {
    return std::nullopt;
  }

  const long long MULT = suffixMultiplier(trim(TRIMMED.substr(LEN)));
  if (MULT == 0) {
    return std::nullopt;
  }

  const auto VALUE = parseDecimal(TRIMMED.substr(0, LEN));
  if (!VALUE) {
    return std::nullopt;
  }

  const double KB = *VALUE * static_cast<double>(MULT);
  if (KB > static_cast<double>(MAX_KB)) {
    return std::nullopt;
  }
  return static_cast<std::uint32_t>(std::llround(KB));
}

std::optional<std::uint32_t> bytesToKb(std::string_view bytes) noexcept {
  const std::string_view TRIMMED = trim(bytes);
  if (TRIMMED.empty() || TRIMMED.size() > 20) {
    return std::nullopt;
  }

  unsigned long long value = 0;
  for (const char C : TRIMMED) {
    if (!isDigit(C)) {
      return std::nullopt;
    }
    value = value * 10ULL + static_cast<unsigned long long>(C - '0');
  }

  const unsigned long long KB = value / 1024ULL;
  if (KB == 0 || KB > static_cast<unsigned long long>(MAX_KB)) {
    return std::nullopt;
  }
  return static_cast<std::uint32_t>(KB);
}

/* ----------------------------- Cache Identity ----------------------------- */

std::optional<CacheLevel> toCacheLevel(int level) noexcept {
  switch (level) {
  case 1:
    return CacheLevel::L1;
  case 2:
    return CacheLevel::L2;
  case 3:
    return CacheLevel::L3;
  default:
    return std::nullopt;
  }
}

std::optional<CacheType> parseCacheType(std::string_view text) noexcept {
  const std::string_view NAME = trim(text);
  if (equalsIgnoreCase(NAME, "Data")) {
    return CacheType::DATA;
  }
  if (equalsIgnoreCase(NAME, "Instruction")) {
    return CacheType::INSTRUCTION;
  }
  if (equalsIgnoreCase(NAME, "Unified")) {
    return CacheType::UNIFIED;
  }
  return std::nullopt;
}

/* ----------------------------- CPU Lists ----------------------------- */

std::optional<std::uint32_t> countCpuList(std::string_view text) noexcept {
  const std::string LIST(trim(text));
  if (LIST.empty()) {
    return std::nullopt;
  }

  std::uint32_t count = 0;
  const char* ptr = LIST.c_str();

  while (*ptr != '\0') {
    while (*ptr == ' ' || *ptr == ',' || *ptr == '\t') {
      ++ptr;
    }
    if (*ptr == '\0') {
      break;
    }

    char* endPtr = nullptr;
    const long START = std::strtol(ptr, &endPtr, 10);
    if (endPtr == ptr || START < 0) {
      return std::nullopt;
    }
    ptr = endPtr;

    long end = START;
    if (*ptr == '-') {
      ++ptr;
      end = std::strtol(ptr, &endPtr, 10);
      if (endPtr == ptr || end < START) {
        return std::nullopt;
      }
      ptr = endPtr;
    }

    if (*ptr != '\0' && *ptr != ',' && *ptr != ' ' && *ptr != '\t') {
      return std::nullopt;
    }

    count += static_cast<std::uint32_t>(end - START + 1);
  }

  if (count == 0) {
    return std::nullopt;
  }
  return count;
}

} // namespace cpu

} // namespace cpufetch
