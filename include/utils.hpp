#ifndef UTILS_HPP
#define UTILS_HPP

#include <cctype>
#include <cstdint>
#include <limits>
#include <string>
#include <string_view>
#include <vector>

namespace sparqlkit {

struct IntegerCoercion {
  int64_t value = 0;
  // false when the text had anything besides an optionally signed integer
  // surrounded by whitespace
  bool exact = false;
};

/**
 * @brief Lenient integer conversion
 *
 * Skips leading whitespace, reads an optional sign and as many decimal
 * digits as follow. Whatever comes after is ignored; text without leading
 * digits converts to 0. Values out of range saturate.
 *
 *   "10" -> 10, "  7 rows" -> 7, "-3" -> -3, "abc" -> 0, "" -> 0
 */
inline IntegerCoercion coerce_integer(std::string_view text) {
  IntegerCoercion result;
  size_t i = 0;
  while (i < text.size() && std::isspace(static_cast<unsigned char>(text[i]))) {
    ++i;
  }

  bool negative = false;
  if (i < text.size() && (text[i] == '+' || text[i] == '-')) {
    negative = text[i] == '-';
    ++i;
  }

  const size_t digits_start = i;
  // accumulate as a negative number so INT64_MIN fits
  int64_t acc = 0;
  bool overflow = false;
  constexpr int64_t min = std::numeric_limits<int64_t>::min();
  while (i < text.size() && std::isdigit(static_cast<unsigned char>(text[i]))) {
    const int digit = text[i] - '0';
    if (!overflow) {
      if (acc < (min + digit) / 10) {
        overflow = true;
      } else {
        acc = acc * 10 - digit;
      }
    }
    ++i;
  }

  if (i == digits_start) {
    return result;
  }

  if (overflow) {
    result.value = negative ? min : std::numeric_limits<int64_t>::max();
  } else if (negative) {
    result.value = acc;
  } else if (acc == min) {
    overflow = true;
    result.value = std::numeric_limits<int64_t>::max();
  } else {
    result.value = -acc;
  }

  while (i < text.size() && std::isspace(static_cast<unsigned char>(text[i]))) {
    ++i;
  }
  result.exact = !overflow && i == text.size();
  return result;
}

inline std::string to_upper(std::string_view text) {
  std::string out(text);
  for (auto& c : out) {
    c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  }
  return out;
}

inline std::string to_lower(std::string_view text) {
  std::string out(text);
  for (auto& c : out) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return out;
}

inline std::string join(const std::vector<std::string>& parts,
                        std::string_view separator) {
  std::string out;
  for (size_t i = 0; i < parts.size(); ++i) {
    if (i > 0) out += separator;
    out += parts[i];
  }
  return out;
}

}  // namespace sparqlkit

#endif  // UTILS_HPP
