#pragma once

#include <cstdint>
#include <string>
#include <string_view>

// Component a piece of text is being escaped for. Each value selects one
// allow-list in PercentCodec::RequiresEncoding().
enum class UrlToken {
  kScheme,
  kUsername,
  kPassword,
  kHost,
  kPort,
  kPath,
  kPathUri,  // stricter variant for URI consumers
  kQuery,
  kQueryReEncode,
  kQueryEncoded,
  kQueryUri,  // stricter variant for URI consumers
  kFragment,
  kFragmentUri  // stricter variant for URI consumers
};

namespace PercentCodec {

/// Returns `input` with the following transformations:
///  - TAB, LF, FF and CR are dropped when `already_encoded` is set.
///  - '+' becomes "%2B" when `plus_is_space` and the input is not encoded.
///  - characters outside the allow-list of `token` are percent-encoded.
///  - control characters, and non-ASCII code points when `ascii_only`, are
///    percent-encoded as their UTF-8 bytes.
///  - a '%' is kept when `already_encoded`, unless `strict` and it does not
///    start a valid escape; otherwise it becomes "%25".
std::string Encode(std::string_view input, UrlToken token,
                   bool already_encoded, bool strict, bool plus_is_space,
                   bool ascii_only);

/// Decodes "%XX" escapes (and '+' when `plus_is_space`). Malformed escapes are
/// kept literally; ill-formed UTF-8 in the result becomes U+FFFD.
std::string Decode(std::string_view encoded, bool plus_is_space);

/// Decodes only the escapes whose byte is an unreserved character
/// (ALPHA / DIGIT / "-" / "." / "_" / "~").
std::string DecodeUnreserved(std::string_view input);

/// True if input[pos..] begins with '%' followed by two hex digits.
bool IsPercentEncoded(std::string_view input, size_t pos);

bool RequiresEncoding(char32_t c, UrlToken token);

int DecodeHexDigit(char c);

/// `text.size()` as the int32_t length ICU functions take. Throws
/// std::invalid_argument for text of 2 GiB or more.
int32_t IcuLength(std::string_view text);

bool IsUnreserved(char32_t c);

}  // namespace PercentCodec
