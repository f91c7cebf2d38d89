#include "posmr/core/normalization.h"

#include <unicode/normalizer2.h>
#include <unicode/stringpiece.h>
#include <unicode/uchar.h>
#include <unicode/unistr.h>
#include <unicode/utf16.h>

#include <stdexcept>
#include <string>

namespace posmr::core {

namespace {

bool is_ascii(const std::string_view input) {
  for (const char ch : input) {
    if ((static_cast<unsigned char>(ch) & 0x80U) != 0) {
      return false;
    }
  }
  return true;
}

const icu::Normalizer2& case_folder() {
  UErrorCode status = U_ZERO_ERROR;
  const icu::Normalizer2* folder = icu::Normalizer2::getNFKCCasefoldInstance(status);
  if (U_FAILURE(status) || folder == nullptr) {
    throw std::runtime_error(std::string("NFKC_Casefold data unavailable: ") +
                             u_errorName(status));
  }
  return *folder;
}

icu::UnicodeString to_unicode(const std::string_view input) {
  return icu::UnicodeString::fromUTF8(
      icu::StringPiece(input.data(), static_cast<int32_t>(input.size())));
}

}  // namespace

std::string fold_case(const std::string_view input) {
  if (is_ascii(input)) {
    std::string result;
    result.reserve(input.size());
    for (const char ch : input) {
      result.push_back(ascii_lower(ch));
    }
    return result;
  }

  UErrorCode status = U_ZERO_ERROR;
  const icu::UnicodeString folded = case_folder().normalize(to_unicode(input), status);
  if (U_FAILURE(status)) {
    throw std::runtime_error(std::string("case folding failed: ") + u_errorName(status));
  }
  std::string result;
  folded.toUTF8String(result);
  return result;
}

std::string normalize_label(const std::string_view input) {
  const std::string folded = fold_case(input);

  std::string result;
  result.reserve(folded.size());

  bool pending_space = false;
  for (const char ch : folded) {
    if (is_ascii_space(ch)) {
      pending_space = !result.empty();
      continue;
    }
    if (pending_space) {
      result.push_back(' ');
      pending_space = false;
    }
    result.push_back(ch);
  }

  return result;
}

std::string normalize_model_token(const std::string_view input) {
  const std::string folded = fold_case(input);

  std::string result;
  if (is_ascii(folded)) {
    result.reserve(folded.size());
    for (const char ch : folded) {
      if (is_ascii_alnum(ch)) {
        result.push_back(ch);
      }
    }
    return result;
  }

  const icu::UnicodeString source = to_unicode(folded);
  icu::UnicodeString kept;
  for (int32_t i = 0; i < source.length();) {
    const UChar32 cp = source.char32At(i);
    if (u_isalnum(cp)) {
      kept.append(cp);
    }
    i += U16_LENGTH(cp);
  }
  kept.toUTF8String(result);
  return result;
}

}  // namespace posmr::core
