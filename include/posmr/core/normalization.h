#pragma once

#include <cstddef>
#include <set>
#include <string>
#include <string_view>

namespace posmr::core {

// Deterministic label normalization.
// Case folding is Unicode NFKC_Casefold (ICU), so "ĐIỆN MÁY" and "điện máy"
// normalize to the same bytes. Pure-ASCII input takes a byte path with
// identical output. Whitespace handling and word boundaries stay ASCII.
//
// - Whitespace: space, tab, CR, LF, VT, FF (NFKC maps NBSP to a space first)
// - No locale dependence, no undefined behavior on negative chars

inline bool is_ascii_space(const char ch) {
  return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r' || ch == '\v' || ch == '\f';
}

inline bool is_ascii_alnum(const char ch) {
  return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') || (ch >= '0' && ch <= '9');
}

inline char ascii_lower(const char ch) {
  if (ch >= 'A' && ch <= 'Z') {
    constexpr char kCaseOffset = 'a' - 'A';
    return static_cast<char>(ch + kCaseOffset);
  }
  return ch;
}

// utf8_length counts code points, i.e. bytes that are not continuation bytes.
inline std::size_t utf8_length(const std::string_view input) {
  std::size_t count = 0;
  for (const char ch : input) {
    if ((static_cast<unsigned char>(ch) & 0xC0U) != 0x80U) {
      ++count;
    }
  }
  return count;
}

// fold_case applies NFKC_Casefold. Invalid UTF-8 sequences become U+FFFD.
// Throws std::runtime_error if the ICU normalization data is unavailable.
std::string fold_case(std::string_view input);

// normalize_label case-folds, trims and collapses internal whitespace runs to
// a single space. Empty input yields an empty string.
std::string normalize_label(std::string_view input);

// normalize_model_token case-folds and drops every code point that is not a
// letter or digit, so "SM-A556 5G" and "sm a5565g" compare equal.
std::string normalize_model_token(std::string_view input);

// tokenize_label splits the normalized label on spaces and keeps tokens longer
// than min_length_exclusive code points. Short tokens ("a", "q1", "2") are not
// discriminative for store names.
inline std::set<std::string> tokenize_label(const std::string_view input,
                                            const std::size_t min_length_exclusive = 2) {
  const std::string normalized = normalize_label(input);

  std::set<std::string> tokens;
  std::size_t start = 0;
  while (start < normalized.size()) {
    std::size_t end = normalized.find(' ', start);
    if (end == std::string::npos) {
      end = normalized.size();
    }
    const std::string_view token(normalized.data() + start, end - start);
    if (utf8_length(token) > min_length_exclusive) {
      tokens.emplace(token);
    }
    start = end + 1;
  }

  return tokens;
}

// split_words splits the normalized label on spaces without any length filter.
inline std::set<std::string> split_words(const std::string_view input) {
  return tokenize_label(input, 0);
}

// trim removes leading and trailing ASCII whitespace.
inline std::string trim(const std::string_view input) {
  std::size_t start = 0;
  while (start < input.size() && is_ascii_space(input[start])) {
    ++start;
  }
  std::size_t end = input.size();
  while (end > start && is_ascii_space(input[end - 1])) {
    --end;
  }
  return std::string{input.substr(start, end - start)};
}

// jaccard returns |a ∩ b| / |a ∪ b|, or 0.0 when both sets are empty.
inline double jaccard(const std::set<std::string>& a, const std::set<std::string>& b) {
  if (a.empty() && b.empty()) {
    return 0.0;
  }
  std::size_t shared = 0;
  for (const auto& token : a) {
    if (b.count(token) > 0) {
      ++shared;
    }
  }
  const std::size_t union_size = a.size() + b.size() - shared;
  return static_cast<double>(shared) / static_cast<double>(union_size);
}

// contains_whole_word reports whether needle occurs in haystack delimited by
// word boundaries (start/end of string or a byte outside [A-Za-z0-9_]).
inline bool contains_whole_word(const std::string_view haystack, const std::string_view needle) {
  if (needle.empty() || needle.size() > haystack.size()) {
    return false;
  }
  const auto is_word = [](const char ch) { return is_ascii_alnum(ch) || ch == '_'; };

  std::size_t pos = haystack.find(needle);
  while (pos != std::string_view::npos) {
    const std::size_t after = pos + needle.size();
    // A boundary only exists where a word byte meets a non-word byte.
    const bool left_ok = pos == 0 || !is_word(haystack[pos - 1]) || !is_word(needle.front());
    const bool right_ok =
        after == haystack.size() || !is_word(haystack[after]) || !is_word(needle.back());
    if (left_ok && right_ok) {
      return true;
    }
    pos = haystack.find(needle, pos + 1);
  }
  return false;
}

// ends_with_digit reports whether the trimmed label ends in 0-9.
inline bool ends_with_digit(const std::string_view label) {
  std::size_t end = label.size();
  while (end > 0 && is_ascii_space(label[end - 1])) {
    --end;
  }
  return end > 0 && label[end - 1] >= '0' && label[end - 1] <= '9';
}

}  // namespace posmr::core
