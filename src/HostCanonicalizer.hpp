#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace HostCanonicalizer {

/// Returns the canonical form of `host`, or std::nullopt if it is not a
/// valid DNS name, IPv4 literal or IPv6 literal. Accepted inputs include
/// internationalized names (converted to punycode), "[...]" bracketed IPv6
/// with an optional "%zone" suffix, and trailing-dot names.
///
///   "WWW.Example.COM."         -> "www.example.com"
///   "[2001:DB8:0:0:1::1%eth0]" -> "2001:db8::1:0:0:1"
std::optional<std::string> Canonicalize(std::string_view host);

/// IDNA ToASCII (UTS #46, nontransitional) of an already unescaped name.
std::optional<std::string> ToAscii(std::string_view host);

std::optional<std::string> CheckDns(std::string_view host);

std::optional<std::string> CheckIPv4(std::string_view host);

/// Parses the inside of an IPv6 literal (no brackets, no zone) into eight
/// 16-bit groups.
std::optional<std::array<uint16_t, 8>> ParseIPv6(std::string_view text);

/// RFC 5952 text of an address: lowercase hex, no leading zeros, longest run
/// of two or more zero groups written as "::" (left-most run on ties).
std::string IPv6ToString(const std::array<uint16_t, 8>& address);

}  // namespace HostCanonicalizer
