#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include "QueryString.hpp"
#include "UrlPath.hpp"

// An immutable http or https URL in canonical form. Two HttpUrls are equal
// when their canonical strings are equal, so differently escaped spellings of
// the same decoded content are different values.
class HttpUrl {
 public:
  static constexpr std::string_view kHttp = "http";
  static constexpr std::string_view kHttps = "https";

  class Builder;

  /// Returns the URL for `url`, or std::nullopt if it is not a well-formed
  /// http or https URL.
  static std::optional<HttpUrl> Parse(std::string_view url);

  /// Like Parse() but throws std::invalid_argument describing the problem.
  static HttpUrl Get(std::string_view url);

  static int DefaultPort(std::string_view scheme);

  /// Either "http" or "https".
  const std::string& GetScheme() const {
    return scheme_;
  }
  bool IsHttps() const {
    return scheme_ == kHttps;
  }

  const std::string& GetUsername() const {
    return username_;
  }
  std::string GetEncodedUsername() const;

  const std::string& GetPassword() const {
    return password_;
  }
  std::string GetEncodedPassword() const;

  /// A lowercase DNS name, a dotted IPv4 address, an IPv6 address without
  /// brackets, or a punycode IDN like "xn--n3h.net".
  const std::string& GetHost() const {
    return host_;
  }
  bool HostIsIPv4() const;
  bool HostIsIPv6() const;

  /// The explicit port, or 80/443 for the scheme.
  int GetPort() const {
    return port_;
  }

  /// Number of '/' in the path; 3 for "http://host/a/b/c". Always >= 1.
  size_t GetPathSize() const {
    return path_segments_.size();
  }
  std::string GetEncodedPath() const;
  std::vector<std::string> GetEncodedPathSegments() const;
  const std::vector<std::string>& GetPathSegments() const {
    return path_segments_;
  }

  /// std::nullopt when there is no '?', "" for "http://host/?".
  std::optional<std::string> GetEncodedQuery() const;
  std::optional<std::string> GetQuery() const;
  size_t GetQuerySize() const;
  /// Value of the first parameter named `name`; std::nullopt if there is no
  /// such parameter or it has no value.
  std::optional<std::string> GetQueryParameter(std::string_view name) const;
  /// Distinct names in order of first appearance.
  std::vector<std::string> GetQueryParameterNames() const;
  std::vector<std::optional<std::string>> GetQueryParameterValues(
    std::string_view name) const;
  /// Throws std::out_of_range if `index` >= GetQuerySize().
  const std::string& GetQueryParameterName(size_t index) const;
  const std::optional<std::string>& GetQueryParameterValue(
    size_t index) const;

  std::optional<std::string> GetEncodedFragment() const;
  const std::optional<std::string>& GetFragment() const {
    return fragment_;
  }

  /// This URL without username, password, query and fragment, and with its
  /// path replaced by "/...": "http://user:pw@host/a?b" -> "http://host/...".
  /// Suitable for logs.
  HttpUrl Redact() const;

  /// The URL reached by following `link` from this URL, or std::nullopt if
  /// the result is not well-formed.
  std::optional<HttpUrl> Resolve(std::string_view link) const;

  Builder NewBuilder() const;
  std::optional<Builder> NewBuilder(std::string_view link) const;

  const std::string& ToString() const {
    return url_;
  }
  const char* c_str() const {
    return url_.c_str();
  }

  /// The URL re-escaped for consumers with a strict RFC 2396 grammar:
  /// '[', ']', '|' and friends escaped, bad escapes like "%xx" written as
  /// "%25xx", non-ASCII escaped outside the fragment, and C1 controls and
  /// Unicode whitespace removed from the fragment.
  std::string ToUriString() const;

  /// Hex SHA-256 of the canonical string.
  std::string GetSha256() const;
  /// First eight bytes of the SHA-256 digest.
  std::uint64_t GetID() const noexcept;

  bool operator==(const HttpUrl& other) const {
    return url_ == other.url_;
  }
  bool operator!=(const HttpUrl& other) const {
    return !(*this == other);
  }
  bool operator<(const HttpUrl& other) const {
    return url_ < other.url_;
  }

 private:
  explicit HttpUrl(const Builder& builder);

  std::string scheme_;
  std::string username_;
  std::string password_;
  std::string host_;
  int port_;
  std::vector<std::string> path_segments_;
  std::optional<QueryParams> query_;
  std::optional<std::string> fragment_;
  std::string url_;
};

// Accumulates encoded URL components. Setters taking raw text escape it;
// the Encoded variants keep existing escapes and only escape what the
// component cannot hold.
class HttpUrl::Builder {
 public:
  Builder();

  /// "http" or "https", any case.
  Builder& SetScheme(std::string_view scheme);

  /// A hostname, IDN, IPv4 address or IPv6 address (brackets optional).
  Builder& SetHost(std::string_view host);

  Builder& SetPort(int port);

  Builder& SetUsername(std::string_view username);
  Builder& SetEncodedUsername(std::string_view encoded_username);
  Builder& SetPassword(std::string_view password);
  Builder& SetEncodedPassword(std::string_view encoded_password);

  Builder& AddPathSegment(std::string_view segment);
  Builder& AddEncodedPathSegment(std::string_view encoded_segment);
  /// Adds segments separated by '/' (or '\').
  Builder& AddPathSegments(std::string_view segments);
  Builder& AddEncodedPathSegments(std::string_view encoded_segments);
  /// Throws std::invalid_argument for "." and "..", std::out_of_range for a
  /// bad index.
  Builder& SetPathSegment(size_t index, std::string_view segment);
  Builder& SetEncodedPathSegment(size_t index,
                                 std::string_view encoded_segment);
  Builder& RemovePathSegment(size_t index);
  /// Replaces the whole path; must start with '/'.
  Builder& SetEncodedPath(std::string_view encoded_path);

  Builder& SetQuery(const std::optional<std::string>& query);
  Builder& SetEncodedQuery(const std::optional<std::string>& encoded_query);
  Builder& AddQueryParameter(std::string_view name,
                             const std::optional<std::string>& value);
  Builder& AddEncodedQueryParameter(
    std::string_view encoded_name,
    const std::optional<std::string>& encoded_value);
  Builder& SetQueryParameter(std::string_view name,
                             const std::optional<std::string>& value);
  Builder& SetEncodedQueryParameter(
    std::string_view encoded_name,
    const std::optional<std::string>& encoded_value);
  Builder& RemoveAllQueryParameters(std::string_view name);
  Builder& RemoveAllEncodedQueryParameters(std::string_view encoded_name);

  Builder& SetFragment(const std::optional<std::string>& fragment);
  Builder& SetEncodedFragment(
    const std::optional<std::string>& encoded_fragment);

  /// Replaces every component with those parsed from `input`, resolved
  /// against `base` when that is not null. Throws std::invalid_argument if
  /// the input is not a valid URL, leaving the builder unchanged.
  Builder& Parse(const HttpUrl* base, std::string_view input);

  /// Re-escapes every component for a strict URI grammar.
  Builder& ReEncodeForUri();

  /// Throws std::logic_error if the scheme or host is missing.
  HttpUrl Build() const;

  const std::string& ToString() const;

 private:
  friend class HttpUrl;

  void ParseComponents(const HttpUrl* base, std::string_view input);
  int EffectivePort() const;
  void RemoveAllCanonicalQueryParameters(const std::string& canonical_name);
  void Changed() {
    url_.reset();
  }

  std::string scheme_;
  std::string host_;
  std::string encoded_username_;
  std::string encoded_password_;
  int port_ = -1;
  PathSegments encoded_path_segments_;
  std::optional<QueryParams> encoded_query_;
  std::optional<std::string> encoded_fragment_;

  mutable std::optional<std::string> url_;
};

inline std::ostream& operator<<(std::ostream& os, const HttpUrl& u) {
  os << u.ToString();
  return os;
}

// allow HttpUrl as an unordered_{map,set} key directly.
namespace std {
template <>
struct hash<HttpUrl> {
  size_t operator()(const HttpUrl& u) const noexcept {
    return static_cast<size_t>(u.GetID());
  }
};
}  // namespace std
