#include "PercentCodec.hpp"

#include <cstdint>
#include <limits>
#include <stdexcept>

#include <unicode/unistr.h>
#include <unicode/utf8.h>

namespace {

constexpr char kHexDigits[] = "0123456789ABCDEF";

inline bool IsAlpha(char32_t c) {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

inline bool IsDigit(char32_t c) {
  return c >= '0' && c <= '9';
}

// sub-delims from RFC 3986 section 2.2
inline bool IsSubDelimiter(char32_t c) {
  switch (c) {
    case '!':
    case '$':
    case '&':
    case '\'':
    case '(':
    case ')':
    case '*':
    case '+':
    case ',':
    case ';':
    case '=':
      return true;
    default:
      return false;
  }
}

bool IsValidUsernameOrPasswordChar(char32_t c) {
  switch (c) {
    case ' ':
    case '"':
    case ':':
    case ';':
    case '<':
    case '=':
    case '>':
    case '@':
    case '[':
    case ']':
    case '^':
    case '`':
    case '{':
    case '}':
    case '|':
    case '/':
    case '\\':
    case '?':
    case '#':
      return false;
    default:
      return true;
  }
}

bool IsValidPathSegmentChar(char32_t c) {
  switch (c) {
    case ' ':
    case '"':
    case '<':
    case '>':
    case '^':
    case '`':
    case '{':
    case '}':
    case '|':
    case '/':
    case '\\':
    case '?':
    case '#':
      return false;
    default:
      return true;
  }
}

bool IsValidUriPathSegmentChar(char32_t c) {
  return c != '[' && c != ']';
}

bool IsValidEncodedQueryChar(char32_t c) {
  switch (c) {
    case ' ':
    case '"':
    case '<':
    case '>':
    case '\'':
    case '#':
      return false;
    default:
      return true;
  }
}

bool IsValidQueryComponentChar(char32_t c) {
  switch (c) {
    case ' ':
    case '!':
    case '"':
    case '#':
    case '$':
    case '\'':
    case '&':
    case '(':
    case ')':
    case ',':
    case '/':
    case ':':
    case ';':
    case '<':
    case '=':
    case '>':
    case '?':
    case '@':
    case '[':
    case ']':
    case '\\':
    case '^':
    case '`':
    case '{':
    case '|':
    case '}':
    case '~':
      return false;
    default:
      return true;
  }
}

bool IsValidQueryComponentReEncodeChar(char32_t c) {
  switch (c) {
    case ' ':
    case '"':
    case '#':
    case '\'':
    case '&':
    case '<':
    case '=':
    case '>':
      return false;
    default:
      return true;
  }
}

bool IsValidUriQueryComponentChar(char32_t c) {
  switch (c) {
    case '\\':
    case '^':
    case '`':
    case '{':
    case '}':
    case '|':
      return false;
    default:
      return true;
  }
}

bool IsValidUriFragmentChar(char32_t c) {
  switch (c) {
    case ' ':
    case '"':
    case '#':
    case '<':
    case '>':
    case '\\':
    case '^':
    case '`':
    case '{':
    case '}':
    case '|':
      return false;
    default:
      return true;
  }
}

// `c` is negative for an ill-formed UTF-8 sequence; those bytes are always
// escaped.
bool MustEscape(std::string_view input, int32_t pos, UChar32 c,
                UrlToken token, bool already_encoded, bool strict,
                bool ascii_only) {
  if (c < 0 || c < 0x20 || c == 0x7f || (c >= 0x80 && ascii_only))
    return true;
  if (PercentCodec::RequiresEncoding(static_cast<char32_t>(c), token))
    return true;
  return c == '%' &&
         (!already_encoded ||
          (strict && !PercentCodec::IsPercentEncoded(input, pos)));
}

void AppendEscaped(std::string& out, std::string_view bytes) {
  for (unsigned char b : bytes) {
    out += '%';
    out += kHexDigits[(b >> 4) & 0xf];
    out += kHexDigits[b & 0xf];
  }
}

}  // namespace

namespace PercentCodec {

std::string Encode(std::string_view input, UrlToken token,
                   bool already_encoded, bool strict, bool plus_is_space,
                   bool ascii_only) {
  const auto* s = reinterpret_cast<const uint8_t*>(input.data());
  const int32_t length = IcuLength(input);

  int32_t slow_start = -1;
  for (int32_t i = 0; i < length;) {
    const int32_t start = i;
    UChar32 c;
    U8_NEXT(s, i, length, c);
    if ((c == '+' && plus_is_space) ||
        MustEscape(input, start, c, token, already_encoded, strict,
                   ascii_only)) {
      slow_start = start;
      break;
    }
  }

  // Fast path: nothing in the input needs encoding.
  if (slow_start < 0)
    return std::string(input);

  std::string out;
  out.reserve(input.size() + 16);
  out.append(input.substr(0, slow_start));

  for (int32_t i = slow_start; i < length;) {
    const int32_t start = i;
    UChar32 c;
    U8_NEXT(s, i, length, c);
    const auto bytes = input.substr(start, i - start);

    if (already_encoded &&
        (c == '\t' || c == '\n' || c == '\f' || c == '\r')) {
      continue;
    }

    if (c == '+' && plus_is_space) {
      // ' ' may be written as '+' or "%20", so a literal '+' must be escaped
      out += already_encoded ? "+" : "%2B";
    } else if (MustEscape(input, start, c, token, already_encoded, strict,
                          ascii_only)) {
      AppendEscaped(out, bytes);
    } else {
      out.append(bytes);
    }
  }
  return out;
}

std::string Decode(std::string_view encoded, bool plus_is_space) {
  size_t first = std::string_view::npos;
  for (size_t i = 0; i < encoded.size(); ++i) {
    if (encoded[i] == '%' || (encoded[i] == '+' && plus_is_space)) {
      first = i;
      break;
    }
  }
  if (first == std::string_view::npos)
    return std::string(encoded);

  std::string bytes;
  bytes.reserve(encoded.size());
  bytes.append(encoded.substr(0, first));

  // '%' and '+' are ASCII, so scanning bytes never splits a code point.
  for (size_t i = first; i < encoded.size(); ++i) {
    const char c = encoded[i];
    if (c == '%' && i + 2 < encoded.size()) {
      int d1 = DecodeHexDigit(encoded[i + 1]);
      int d2 = DecodeHexDigit(encoded[i + 2]);
      if (d1 != -1 && d2 != -1) {
        bytes += static_cast<char>((d1 << 4) + d2);
        i += 2;
        continue;
      }
    } else if (c == '+' && plus_is_space) {
      bytes += ' ';
      continue;
    }
    bytes += c;
  }

  // Escapes may have produced partial sequences; ICU substitutes U+FFFD.
  std::string out;
  icu::UnicodeString::fromUTF8(
    icu::StringPiece(bytes.data(), IcuLength(bytes)))
    .toUTF8String(out);
  return out;
}

std::string DecodeUnreserved(std::string_view input) {
  std::string out;
  out.reserve(input.size());
  for (size_t i = 0; i < input.size(); ++i) {
    if (input[i] == '%' && i + 2 < input.size()) {
      int d1 = DecodeHexDigit(input[i + 1]);
      int d2 = DecodeHexDigit(input[i + 2]);
      if (d1 != -1 && d2 != -1) {
        const char32_t decoded = static_cast<char32_t>((d1 << 4) | d2);
        if (IsUnreserved(decoded)) {
          out += static_cast<char>(decoded);
          i += 2;
          continue;
        }
      }
    }
    out += input[i];
  }
  return out;
}

bool IsPercentEncoded(std::string_view input, size_t pos) {
  return pos + 2 < input.size() && input[pos] == '%' &&
         DecodeHexDigit(input[pos + 1]) != -1 &&
         DecodeHexDigit(input[pos + 2]) != -1;
}

bool RequiresEncoding(char32_t c, UrlToken token) {
  switch (token) {
    case UrlToken::kScheme:
      return !IsAlpha(c) && !IsDigit(c) && c != '+' && c != '-' && c != '.';
    case UrlToken::kUsername:
    case UrlToken::kPassword:
      return !IsValidUsernameOrPasswordChar(c);
    case UrlToken::kHost:
      return !IsUnreserved(c) && !IsSubDelimiter(c);
    case UrlToken::kPort:
      return !IsDigit(c);
    case UrlToken::kPath:
      return !IsValidPathSegmentChar(c);
    case UrlToken::kPathUri:
      return !IsValidUriPathSegmentChar(c);
    case UrlToken::kQuery:
      return !IsValidQueryComponentChar(c);
    case UrlToken::kQueryReEncode:
      return !IsValidQueryComponentReEncodeChar(c);
    case UrlToken::kQueryEncoded:
      return !IsValidEncodedQueryChar(c);
    case UrlToken::kQueryUri:
      return !IsValidUriQueryComponentChar(c);
    case UrlToken::kFragment:
      return false;
    case UrlToken::kFragmentUri:
      return !IsValidUriFragmentChar(c);
  }
  return true;
}

int32_t IcuLength(std::string_view text) {
  if (text.size() >
      static_cast<size_t>(std::numeric_limits<int32_t>::max())) {
    throw std::invalid_argument("text too long: " +
                                std::to_string(text.size()) + " bytes");
  }
  return static_cast<int32_t>(text.size());
}

int DecodeHexDigit(char c) {
  if (c >= '0' && c <= '9')
    return c - '0';
  if (c >= 'a' && c <= 'f')
    return c - 'a' + 10;
  if (c >= 'A' && c <= 'F')
    return c - 'A' + 10;
  return -1;
}

bool IsUnreserved(char32_t c) {
  return IsAlpha(c) || IsDigit(c) || c == '-' || c == '.' || c == '_' ||
         c == '~';
}

}  // namespace PercentCodec
