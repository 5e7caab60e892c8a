#include "HostCanonicalizer.hpp"
#include "Logger.hpp"
#include "PercentCodec.hpp"

#include <cctype>
#include <memory>
#include <sstream>
#include <vector>

#include <unicode/uidna.h>

namespace {

constexpr size_t kMaxIdnaInput = 64 * 1024;

// Hyphen placement is only a STD3 concern; names like "-foo" are still hosts.
constexpr uint32_t kIgnoredIdnaErrors = UIDNA_ERROR_LEADING_HYPHEN |
                                        UIDNA_ERROR_TRAILING_HYPHEN |
                                        UIDNA_ERROR_HYPHEN_3_4;

using IdnaPtr = std::unique_ptr<UIDNA, decltype(&uidna_close)>;

// The UTS #46 instance is immutable once opened and safe to share.
const UIDNA* SharedIdna() {
  static const IdnaPtr idna = [] {
    UErrorCode status = U_ZERO_ERROR;
    IdnaPtr p(uidna_openUTS46(UIDNA_NONTRANSITIONAL_TO_ASCII, &status),
              &uidna_close);
    if (U_FAILURE(status)) {
      logr::error << "uidna_openUTS46 failed: " << u_errorName(status);
      p.reset();
    }
    return p;
  }();
  return idna.get();
}

std::optional<std::array<uint8_t, 4>> ParseDottedQuad(std::string_view text) {
  std::array<uint8_t, 4> octets{};
  size_t count = 0;
  size_t pos = 0;
  while (true) {
    size_t dot = text.find('.', pos);
    std::string_view part = text.substr(
      pos, dot == std::string_view::npos ? std::string_view::npos : dot - pos);

    if (count == 4 || part.empty() || part.size() > 3)
      return std::nullopt;
    // Leading zeros are ambiguous (octal or decimal), so they are refused.
    if (part.size() > 1 && part[0] == '0')
      return std::nullopt;
    int value = 0;
    for (char c : part) {
      if (c < '0' || c > '9')
        return std::nullopt;
      value = value * 10 + (c - '0');
    }
    if (value > 255)
      return std::nullopt;
    octets[count++] = static_cast<uint8_t>(value);

    if (dot == std::string_view::npos)
      break;
    pos = dot + 1;
  }
  if (count != 4)
    return std::nullopt;
  return octets;
}

}  // namespace

namespace HostCanonicalizer {

std::optional<std::string> Canonicalize(std::string_view host) {
  if (host.empty())
    return std::nullopt;

  if (host.find(':') != std::string_view::npos) {
    std::string_view inner = host;
    if (inner.size() >= 2 && inner.front() == '[' && inner.back() == ']')
      inner = inner.substr(1, inner.size() - 2);
    // A zone ID never changes the address.
    if (auto percent = inner.find('%'); percent != std::string_view::npos)
      inner = inner.substr(0, percent);
    auto address = ParseIPv6(inner);
    if (!address)
      return std::nullopt;
    return IPv6ToString(*address);
  }

  auto ascii = ToAscii(PercentCodec::DecodeUnreserved(host));
  if (!ascii || ascii->empty() || *ascii == ".")
    return std::nullopt;

  if (ascii->back() == '.')
    ascii->pop_back();

  // a last label starting with a digit can only be an IPv4 address
  const auto dot = ascii->rfind('.');
  const size_t last_label = dot == std::string::npos ? 0 : dot + 1;
  if (last_label < ascii->size() &&
      std::isdigit(static_cast<unsigned char>((*ascii)[last_label]))) {
    return CheckIPv4(*ascii);
  }
  return CheckDns(*ascii);
}

std::optional<std::string> ToAscii(std::string_view host) {
  const UIDNA* idna = SharedIdna();
  if (idna == nullptr)
    return std::nullopt;

  // the output buffer must also fit ICU's int32_t lengths
  if (host.size() > kMaxIdnaInput) {
    IF_DEBUG {
      logr::debug << "host too long for IDNA: " << host.size() << " bytes";
    }
    return std::nullopt;
  }

  std::vector<char> dest(host.size() * 2 + 64);
  while (true) {
    UErrorCode status = U_ZERO_ERROR;
    UIDNAInfo info = UIDNA_INFO_INITIALIZER;
    int32_t length = uidna_nameToASCII_UTF8(
      idna, host.data(), static_cast<int32_t>(host.size()), dest.data(),
      static_cast<int32_t>(dest.size()), &info, &status);
    if (status == U_BUFFER_OVERFLOW_ERROR) {
      dest.resize(static_cast<size_t>(length) + 1);
      continue;
    }
    if (U_FAILURE(status)) {
      IF_DEBUG {
        logr::debug << "IDNA rejected host '" << host
                    << "': " << u_errorName(status);
      }
      return std::nullopt;
    }
    if ((info.errors & ~kIgnoredIdnaErrors) != 0) {
      IF_DEBUG {
        logr::debug << "IDNA rejected host '" << host << "' (errors 0x"
                    << std::hex << info.errors << std::dec << ")";
      }
      return std::nullopt;
    }
    return std::string(dest.data(), static_cast<size_t>(length));
  }
}

std::optional<std::string> CheckDns(std::string_view host) {
  std::string out;
  out.reserve(host.size());
  size_t last_dot = std::string_view::npos;
  for (size_t i = 0; i < host.size(); ++i) {
    const char c = host[i];
    const bool allowable = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                           (c >= '0' && c <= '9') || c == '-' || c == '.';
    if (!allowable)
      return std::nullopt;
    if (c == '.') {
      // no empty labels, including a leading one
      if (i == 0 || last_dot == i - 1)
        return std::nullopt;
      last_dot = i;
    }
    out += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return out;
}

std::optional<std::string> CheckIPv4(std::string_view host) {
  auto octets = ParseDottedQuad(host);
  if (!octets)
    return std::nullopt;
  std::ostringstream oss;
  oss << static_cast<int>((*octets)[0]) << '.' << static_cast<int>((*octets)[1])
      << '.' << static_cast<int>((*octets)[2]) << '.'
      << static_cast<int>((*octets)[3]);
  return oss.str();
}

std::optional<std::array<uint16_t, 8>> ParseIPv6(std::string_view text) {
  if (text.empty())
    return std::nullopt;

  std::array<uint16_t, 8> groups{};
  int count = 0;
  int compress = -1;
  size_t group_start = 0;
  size_t i = 0;

  while (i < text.size()) {
    if (count == 8)
      return std::nullopt;  // too many groups

    if (text.compare(i, 2, "::") == 0) {
      if (compress != -1)
        return std::nullopt;  // a second "::"
      i += 2;
      compress = count;
      if (i == text.size())
        break;
    } else if (count != 0) {
      if (text[i] == ':') {
        ++i;
      } else if (text[i] == '.') {
        // The previous group was really the start of a dotted-quad tail.
        auto quad = ParseDottedQuad(text.substr(group_start));
        if (!quad || count + 1 > 8)
          return std::nullopt;
        --count;
        groups[count++] = static_cast<uint16_t>(((*quad)[0] << 8) | (*quad)[1]);
        groups[count++] = static_cast<uint16_t>(((*quad)[2] << 8) | (*quad)[3]);
        i = text.size();
        break;
      } else {
        return std::nullopt;
      }
    }

    group_start = i;
    unsigned value = 0;
    while (i < text.size()) {
      int hex = PercentCodec::DecodeHexDigit(text[i]);
      if (hex == -1)
        break;
      value = (value << 4) | static_cast<unsigned>(hex);
      ++i;
    }
    const size_t length = i - group_start;
    if (length == 0 || length > 4)
      return std::nullopt;
    groups[count++] = static_cast<uint16_t>(value);
  }

  if (count != 8) {
    if (compress == -1)
      return std::nullopt;
    // Slide the groups after "::" to the end and zero the gap.
    const int tail = count - compress;
    for (int k = 1; k <= tail; ++k) {
      groups[8 - k] = groups[count - k];
      groups[count - k] = 0;
    }
  } else if (compress != -1) {
    return std::nullopt;  // "::" must stand for at least one group
  }
  return groups;
}

std::string IPv6ToString(const std::array<uint16_t, 8>& address) {
  int best_start = -1;
  int best_length = 0;
  for (int i = 0; i < 8;) {
    if (address[i] != 0) {
      ++i;
      continue;
    }
    int j = i;
    while (j < 8 && address[j] == 0)
      ++j;
    // strictly longer, so the left-most run wins a tie
    if (j - i >= 2 && j - i > best_length) {
      best_start = i;
      best_length = j - i;
    }
    i = j;
  }

  std::ostringstream oss;
  oss << std::hex;
  bool need_colon = false;
  for (int i = 0; i < 8;) {
    if (i == best_start) {
      oss << "::";
      need_colon = false;
      i += best_length;
      continue;
    }
    if (need_colon)
      oss << ':';
    oss << address[i];
    need_colon = true;
    ++i;
  }
  return oss.str();
}

}  // namespace HostCanonicalizer
