#include "HostCanonicalizer.hpp"
#include "HttpUrl.hpp"
#include "Logger.hpp"
#include "PercentCodec.hpp"

#include <algorithm>
#include <stdexcept>

#include <unicode/uchar.h>
#include <unicode/utf8.h>

namespace {

inline bool IsAsciiWhitespace(char c) {
  return c == '\t' || c == '\n' || c == '\f' || c == '\r' || c == ' ';
}

size_t SkipLeadingWhitespace(std::string_view input) {
  size_t i = 0;
  while (i < input.size() && IsAsciiWhitespace(input[i]))
    ++i;
  return i;
}

size_t SkipTrailingWhitespace(std::string_view input, size_t pos,
                              size_t limit) {
  while (limit > pos && IsAsciiWhitespace(input[limit - 1]))
    --limit;
  return limit;
}

// Offset of the ':' ending a scheme at input[pos], or npos if there is none.
size_t SchemeDelimiterOffset(std::string_view input, size_t pos,
                             size_t limit) {
  if (limit - pos < 2)
    return std::string_view::npos;

  const char c0 = input[pos];
  if ((c0 < 'a' || c0 > 'z') && (c0 < 'A' || c0 > 'Z'))
    return std::string_view::npos;

  for (size_t i = pos + 1; i < limit; ++i) {
    const char c = input[i];
    if ((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
        (c >= '0' && c <= '9') || c == '+' || c == '-' || c == '.') {
      continue;
    }
    return c == ':' ? i : std::string_view::npos;
  }
  return std::string_view::npos;
}

bool StartsWithIgnoreCase(std::string_view input, size_t pos,
                          std::string_view prefix) {
  if (input.size() - pos < prefix.size())
    return false;
  for (size_t i = 0; i < prefix.size(); ++i) {
    char c = input[pos + i];
    if (c >= 'A' && c <= 'Z')
      c = static_cast<char>(c - 'A' + 'a');
    if (c != prefix[i])
      return false;
  }
  return true;
}

size_t SlashCount(std::string_view input, size_t pos, size_t limit) {
  size_t count = 0;
  while (pos < limit && (input[pos] == '/' || input[pos] == '\\')) {
    ++count;
    ++pos;
  }
  return count;
}

size_t DelimiterOffset(std::string_view input, size_t pos, size_t limit,
                       std::string_view delimiters) {
  for (size_t i = pos; i < limit; ++i) {
    if (delimiters.find(input[i]) != std::string_view::npos)
      return i;
  }
  return limit;
}

// Finds the ':' before a port, skipping over a bracketed IPv6 literal.
size_t PortColonOffset(std::string_view input, size_t pos, size_t limit) {
  for (size_t i = pos; i < limit; ++i) {
    if (input[i] == '[') {
      while (++i < limit) {
        if (input[i] == ']')
          break;
      }
      if (i == limit)
        break;
    } else if (input[i] == ':') {
      return i;
    }
  }
  return limit;
}

// Digits of input[pos, limit) as a port, ignoring everything else. Returns -1
// when there are no digits or the value is outside 1..65535.
int ParsePort(std::string_view input, size_t pos, size_t limit) {
  long value = 0;
  bool has_digits = false;
  for (size_t i = pos; i < limit; ++i) {
    const char c = input[i];
    if (c < '0' || c > '9')
      continue;
    has_digits = true;
    value = value * 10 + (c - '0');
    if (value > 65535)
      return -1;
  }
  if (!has_digits || value == 0)
    return -1;
  return static_cast<int>(value);
}

// Removes C1 controls and Unicode whitespace, which strict URI parsers
// reject even when escaped text around them is fine.
std::string StripUriIllegal(const std::string& text) {
  const auto* s = reinterpret_cast<const uint8_t*>(text.data());
  const int32_t length = PercentCodec::IcuLength(text);

  std::string out;
  out.reserve(text.size());
  for (int32_t i = 0; i < length;) {
    const int32_t start = i;
    UChar32 c;
    U8_NEXT(s, i, length, c);
    if (c >= 0x80 && (c <= 0x9f || u_isWhitespace(c)))
      continue;
    out.append(text, start, i - start);
  }
  return out;
}

std::string EncodeQueryComponent(std::string_view text) {
  return PercentCodec::Encode(text, UrlToken::kQuery, false, false, true,
                              true);
}

std::string ReEncodeQueryComponent(std::string_view text) {
  return PercentCodec::Encode(text, UrlToken::kQueryReEncode, true, false,
                              true, true);
}

}  // namespace

HttpUrl::Builder::Builder() : encoded_path_segments_{std::string()} {
}

HttpUrl::Builder& HttpUrl::Builder::SetScheme(std::string_view scheme) {
  if (StartsWithIgnoreCase(scheme, 0, kHttp) && scheme.size() == kHttp.size())
    scheme_ = kHttp;
  else if (StartsWithIgnoreCase(scheme, 0, kHttps) &&
           scheme.size() == kHttps.size())
    scheme_ = kHttps;
  else
    throw std::invalid_argument("unexpected scheme: " + std::string(scheme));
  Changed();
  return *this;
}

HttpUrl::Builder& HttpUrl::Builder::SetHost(std::string_view host) {
  auto canonical = HostCanonicalizer::Canonicalize(host);
  if (!canonical)
    throw std::invalid_argument("unexpected host: " + std::string(host));
  host_ = std::move(*canonical);
  Changed();
  return *this;
}

HttpUrl::Builder& HttpUrl::Builder::SetPort(int port) {
  if (port <= 0 || port > 65535)
    throw std::invalid_argument("unexpected port: " + std::to_string(port));
  port_ = port;
  Changed();
  return *this;
}

HttpUrl::Builder& HttpUrl::Builder::SetUsername(std::string_view username) {
  encoded_username_ = PercentCodec::Encode(username, UrlToken::kUsername,
                                           false, false, false, true);
  Changed();
  return *this;
}

HttpUrl::Builder& HttpUrl::Builder::SetEncodedUsername(
  std::string_view encoded_username) {
  encoded_username_ = PercentCodec::Encode(
    encoded_username, UrlToken::kUsername, true, false, false, true);
  Changed();
  return *this;
}

HttpUrl::Builder& HttpUrl::Builder::SetPassword(std::string_view password) {
  encoded_password_ = PercentCodec::Encode(password, UrlToken::kPassword,
                                           false, false, false, true);
  Changed();
  return *this;
}

HttpUrl::Builder& HttpUrl::Builder::SetEncodedPassword(
  std::string_view encoded_password) {
  encoded_password_ = PercentCodec::Encode(
    encoded_password, UrlToken::kPassword, true, false, false, true);
  Changed();
  return *this;
}

HttpUrl::Builder& HttpUrl::Builder::AddPathSegment(std::string_view segment) {
  UrlPath::Push(encoded_path_segments_, segment, false, false);
  Changed();
  return *this;
}

HttpUrl::Builder& HttpUrl::Builder::AddEncodedPathSegment(
  std::string_view encoded_segment) {
  UrlPath::Push(encoded_path_segments_, encoded_segment, false, true);
  Changed();
  return *this;
}

HttpUrl::Builder& HttpUrl::Builder::AddPathSegments(
  std::string_view segments) {
  UrlPath::AddSegments(encoded_path_segments_, segments, false);
  Changed();
  return *this;
}

HttpUrl::Builder& HttpUrl::Builder::AddEncodedPathSegments(
  std::string_view encoded_segments) {
  UrlPath::AddSegments(encoded_path_segments_, encoded_segments, true);
  Changed();
  return *this;
}

HttpUrl::Builder& HttpUrl::Builder::SetPathSegment(size_t index,
                                                   std::string_view segment) {
  std::string canonical = PercentCodec::Encode(segment, UrlToken::kPath,
                                               false, false, false, true);
  if (UrlPath::IsDot(canonical) || UrlPath::IsDotDot(canonical))
    throw std::invalid_argument("unexpected path segment: " +
                                std::string(segment));
  encoded_path_segments_.at(index) = std::move(canonical);
  Changed();
  return *this;
}

HttpUrl::Builder& HttpUrl::Builder::SetEncodedPathSegment(
  size_t index, std::string_view encoded_segment) {
  std::string canonical = PercentCodec::Encode(
    encoded_segment, UrlToken::kPath, true, false, false, true);
  if (UrlPath::IsDot(canonical) || UrlPath::IsDotDot(canonical))
    throw std::invalid_argument("unexpected path segment: " +
                                std::string(encoded_segment));
  encoded_path_segments_.at(index) = std::move(canonical);
  Changed();
  return *this;
}

HttpUrl::Builder& HttpUrl::Builder::RemovePathSegment(size_t index) {
  if (index >= encoded_path_segments_.size())
    throw std::out_of_range("path segment index out of range: " +
                            std::to_string(index));
  encoded_path_segments_.erase(encoded_path_segments_.begin() + index);
  if (encoded_path_segments_.empty())
    encoded_path_segments_.emplace_back();  // always leave at least one '/'
  Changed();
  return *this;
}

HttpUrl::Builder& HttpUrl::Builder::SetEncodedPath(
  std::string_view encoded_path) {
  if (encoded_path.empty() || encoded_path[0] != '/')
    throw std::invalid_argument("unexpected encodedPath: " +
                                std::string(encoded_path));
  UrlPath::Resolve(encoded_path_segments_, encoded_path);
  Changed();
  return *this;
}

HttpUrl::Builder& HttpUrl::Builder::SetQuery(
  const std::optional<std::string>& query) {
  if (query) {
    encoded_query_ = QueryString::Parse(PercentCodec::Encode(
      *query, UrlToken::kQueryEncoded, false, false, true, true));
  } else {
    encoded_query_.reset();
  }
  Changed();
  return *this;
}

HttpUrl::Builder& HttpUrl::Builder::SetEncodedQuery(
  const std::optional<std::string>& encoded_query) {
  if (encoded_query) {
    encoded_query_ = QueryString::Parse(PercentCodec::Encode(
      *encoded_query, UrlToken::kQueryEncoded, true, false, true, true));
  } else {
    encoded_query_.reset();
  }
  Changed();
  return *this;
}

HttpUrl::Builder& HttpUrl::Builder::AddQueryParameter(
  std::string_view name, const std::optional<std::string>& value) {
  if (name.empty())
    throw std::invalid_argument("queryParameterName must not be empty.");
  if (!encoded_query_)
    encoded_query_.emplace();

  std::optional<std::string> encoded_value;
  if (value)
    encoded_value = EncodeQueryComponent(*value);
  encoded_query_->emplace_back(EncodeQueryComponent(name),
                               std::move(encoded_value));
  Changed();
  return *this;
}

HttpUrl::Builder& HttpUrl::Builder::AddEncodedQueryParameter(
  std::string_view encoded_name,
  const std::optional<std::string>& encoded_value) {
  if (encoded_name.empty())
    throw std::invalid_argument("queryParameterName must not be empty.");
  if (!encoded_query_)
    encoded_query_.emplace();

  std::optional<std::string> value;
  if (encoded_value)
    value = ReEncodeQueryComponent(*encoded_value);
  encoded_query_->emplace_back(ReEncodeQueryComponent(encoded_name),
                               std::move(value));
  Changed();
  return *this;
}

HttpUrl::Builder& HttpUrl::Builder::SetQueryParameter(
  std::string_view name, const std::optional<std::string>& value) {
  RemoveAllQueryParameters(name);
  return AddQueryParameter(name, value);
}

HttpUrl::Builder& HttpUrl::Builder::SetEncodedQueryParameter(
  std::string_view encoded_name,
  const std::optional<std::string>& encoded_value) {
  RemoveAllEncodedQueryParameters(encoded_name);
  return AddEncodedQueryParameter(encoded_name, encoded_value);
}

HttpUrl::Builder& HttpUrl::Builder::RemoveAllQueryParameters(
  std::string_view name) {
  if (name.empty())
    throw std::invalid_argument("queryParameterName must not be empty.");
  if (encoded_query_)
    RemoveAllCanonicalQueryParameters(EncodeQueryComponent(name));
  return *this;
}

HttpUrl::Builder& HttpUrl::Builder::RemoveAllEncodedQueryParameters(
  std::string_view encoded_name) {
  if (encoded_name.empty())
    throw std::invalid_argument("queryParameterName must not be empty.");
  if (encoded_query_)
    RemoveAllCanonicalQueryParameters(ReEncodeQueryComponent(encoded_name));
  return *this;
}

void HttpUrl::Builder::RemoveAllCanonicalQueryParameters(
  const std::string& canonical_name) {
  auto& params = *encoded_query_;
  const size_t before = params.size();
  params.erase(std::remove_if(params.begin(), params.end(),
                              [&](const auto& param) {
                                return param.first == canonical_name;
                              }),
               params.end());
  // removing the last parameter also removes the '?'
  if (params.size() != before && params.empty())
    encoded_query_.reset();
  Changed();
}

HttpUrl::Builder& HttpUrl::Builder::SetFragment(
  const std::optional<std::string>& fragment) {
  if (fragment) {
    encoded_fragment_ = PercentCodec::Encode(*fragment, UrlToken::kFragment,
                                             false, false, false, false);
  } else {
    encoded_fragment_.reset();
  }
  Changed();
  return *this;
}

HttpUrl::Builder& HttpUrl::Builder::SetEncodedFragment(
  const std::optional<std::string>& encoded_fragment) {
  if (encoded_fragment) {
    encoded_fragment_ = PercentCodec::Encode(
      *encoded_fragment, UrlToken::kFragment, true, false, false, false);
  } else {
    encoded_fragment_.reset();
  }
  Changed();
  return *this;
}

HttpUrl::Builder& HttpUrl::Builder::Parse(const HttpUrl* base,
                                          std::string_view input) {
  // a failed parse leaves this builder untouched, and nothing set before
  // the call leaks into the result
  Builder parsed;
  parsed.ParseComponents(base, input);
  *this = std::move(parsed);

  IF_DEBUG {
    logr::debug << "parsed \"" << input << "\" as " << ToString();
  }
  return *this;
}

// Expects a default-constructed builder.
void HttpUrl::Builder::ParseComponents(const HttpUrl* base,
                                       std::string_view input) {
  size_t pos = SkipLeadingWhitespace(input);
  const size_t limit = SkipTrailingWhitespace(input, pos, input.size());

  // Scheme.
  const size_t scheme_delimiter = SchemeDelimiterOffset(input, pos, limit);
  if (scheme_delimiter != std::string_view::npos) {
    if (StartsWithIgnoreCase(input, pos, "https:")) {
      scheme_ = kHttps;
      pos += 6;
    } else if (StartsWithIgnoreCase(input, pos, "http:")) {
      scheme_ = kHttp;
      pos += 5;
    } else {
      throw std::invalid_argument(
        "Expected URL scheme 'http' or 'https' but was '" +
        std::string(input.substr(0, scheme_delimiter)) + "'");
    }
  } else if (base != nullptr) {
    scheme_ = base->scheme_;
  } else {
    throw std::invalid_argument(
      "Expected URL scheme 'http' or 'https' but no colon was found");
  }

  // Authority: [username[:password]@]host[:port]
  const size_t slash_count = SlashCount(input, pos, limit);
  if (slash_count >= 2 || base == nullptr || base->scheme_ != scheme_) {
    bool has_username = false;
    bool has_password = false;
    pos += slash_count;
    while (true) {
      const size_t delimiter = DelimiterOffset(input, pos, limit, "@/\\?#");
      if (delimiter != limit && input[delimiter] == '@') {
        // userinfo; the last '@' ends it and earlier ones are kept as "%40"
        if (!has_password) {
          const size_t colon = DelimiterOffset(input, pos, delimiter, ":");
          std::string username =
            PercentCodec::Encode(input.substr(pos, colon - pos),
                                 UrlToken::kUsername, true, false, false, true);
          encoded_username_ = has_username
                                ? encoded_username_ + "%40" + username
                                : std::move(username);
          if (colon != delimiter) {
            has_password = true;
            encoded_password_ = PercentCodec::Encode(
              input.substr(colon + 1, delimiter - colon - 1),
              UrlToken::kPassword, true, false, false, true);
          }
          has_username = true;
        } else {
          encoded_password_ +=
            "%40" + PercentCodec::Encode(input.substr(pos, delimiter - pos),
                                         UrlToken::kPassword, true, false,
                                         false, true);
        }
        pos = delimiter + 1;
        continue;
      }

      const size_t port_colon = PortColonOffset(input, pos, delimiter);
      const std::string_view raw_host = input.substr(pos, port_colon - pos);
      if (port_colon + 1 < delimiter) {
        port_ = ParsePort(input, port_colon + 1, delimiter);
        if (port_ == -1) {
          throw std::invalid_argument(
            "Invalid URL port: \"" +
            std::string(
              input.substr(port_colon + 1, delimiter - port_colon - 1)) +
            "\"");
        }
      } else {
        port_ = DefaultPort(scheme_);
      }

      auto host = HostCanonicalizer::Canonicalize(raw_host);
      if (!host) {
        throw std::invalid_argument("Invalid URL host: \"" +
                                    std::string(raw_host) + "\"");
      }
      host_ = std::move(*host);
      pos = delimiter;
      break;
    }
  } else {
    // Relative reference: inherit the authority and path, and the query
    // when the reference is empty or only a fragment.
    encoded_username_ = base->GetEncodedUsername();
    encoded_password_ = base->GetEncodedPassword();
    host_ = base->host_;
    port_ = base->port_;
    encoded_path_segments_ = base->GetEncodedPathSegments();
    if (pos == limit || input[pos] == '#') {
      if (auto query = base->GetEncodedQuery())
        encoded_query_ = QueryString::Parse(*query);
      else
        encoded_query_.reset();
    }
  }

  // Path.
  const size_t path_delimiter = DelimiterOffset(input, pos, limit, "?#");
  UrlPath::Resolve(encoded_path_segments_,
                   input.substr(pos, path_delimiter - pos));
  pos = path_delimiter;

  // Query.
  if (pos < limit && input[pos] == '?') {
    const size_t query_delimiter = DelimiterOffset(input, pos, limit, "#");
    encoded_query_ = QueryString::Parse(PercentCodec::Encode(
      input.substr(pos + 1, query_delimiter - pos - 1),
      UrlToken::kQueryEncoded, true, false, true, true));
    pos = query_delimiter;
  }

  // Fragment.
  if (pos < limit && input[pos] == '#') {
    encoded_fragment_ =
      PercentCodec::Encode(input.substr(pos + 1, limit - pos - 1),
                           UrlToken::kFragment, true, false, false, false);
  }
}

HttpUrl::Builder& HttpUrl::Builder::ReEncodeForUri() {
  for (auto& segment : encoded_path_segments_) {
    segment = PercentCodec::Encode(segment, UrlToken::kPathUri, true, true,
                                   false, true);
  }

  if (encoded_query_) {
    for (auto& [name, value] : *encoded_query_) {
      name = PercentCodec::Encode(name, UrlToken::kQueryUri, true, true, true,
                                  true);
      if (value) {
        *value = PercentCodec::Encode(*value, UrlToken::kQueryUri, true, true,
                                      true, true);
      }
    }
  }

  if (encoded_fragment_) {
    encoded_fragment_ = StripUriIllegal(PercentCodec::Encode(
      *encoded_fragment_, UrlToken::kFragmentUri, true, true, false, false));
  }

  Changed();
  return *this;
}

int HttpUrl::Builder::EffectivePort() const {
  return port_ != -1 ? port_ : DefaultPort(scheme_);
}

HttpUrl HttpUrl::Builder::Build() const {
  if (scheme_.empty())
    throw std::logic_error("scheme == null");
  if (host_.empty())
    throw std::logic_error("host == null");
  return HttpUrl(*this);
}

const std::string& HttpUrl::Builder::ToString() const {
  if (url_)
    return *url_;

  std::string result;
  if (!scheme_.empty()) {
    result += scheme_;
    result += "://";
  }

  if (!encoded_username_.empty() || !encoded_password_.empty()) {
    result += encoded_username_;
    if (!encoded_password_.empty()) {
      result += ':';
      result += encoded_password_;
    }
    result += '@';
  }

  if (!host_.empty()) {
    if (host_.find(':') != std::string::npos) {
      result += '[';
      result += host_;
      result += ']';
    } else {
      result += host_;
    }
  }

  if (port_ != -1 && (scheme_.empty() || port_ != DefaultPort(scheme_))) {
    result += ':';
    result += std::to_string(port_);
  }

  result += UrlPath::Join(encoded_path_segments_);

  if (encoded_query_) {
    result += '?';
    QueryString::Write(result, *encoded_query_);
  }

  if (encoded_fragment_) {
    result += '#';
    result += *encoded_fragment_;
  }

  url_ = std::move(result);
  return *url_;
}
