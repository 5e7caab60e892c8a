#include "HttpUrl.hpp"
#include "HostCanonicalizer.hpp"
#include "Logger.hpp"
#include "PercentCodec.hpp"

#include <algorithm>
#include <iomanip>
#include <openssl/sha.h>
#include <sstream>
#include <stdexcept>

namespace {

// First offset in url[pos, url.size()) of any of `delimiters`.
size_t DelimiterOffset(const std::string& url, size_t pos,
                       std::string_view delimiters) {
  size_t i = url.find_first_of(delimiters.data(), pos, delimiters.size());
  return i == std::string::npos ? url.size() : i;
}

}  // namespace

std::optional<HttpUrl> HttpUrl::Parse(std::string_view url) {
  try {
    return Builder().Parse(nullptr, url).Build();
  } catch (const std::invalid_argument& e) {
    IF_DEBUG {
      logr::debug << "HttpUrl::Parse rejected \"" << url << "\": " << e.what();
    }
    return std::nullopt;
  }
}

HttpUrl HttpUrl::Get(std::string_view url) {
  return Builder().Parse(nullptr, url).Build();
}

int HttpUrl::DefaultPort(std::string_view scheme) {
  if (scheme == kHttp)
    return 80;
  if (scheme == kHttps)
    return 443;
  return -1;
}

HttpUrl::HttpUrl(const Builder& builder)
    : scheme_{builder.scheme_},
      username_{PercentCodec::Decode(builder.encoded_username_, false)},
      password_{PercentCodec::Decode(builder.encoded_password_, false)},
      host_{builder.host_},
      port_{builder.EffectivePort()},
      url_{builder.ToString()} {
  path_segments_.reserve(builder.encoded_path_segments_.size());
  for (const auto& segment : builder.encoded_path_segments_) {
    path_segments_.push_back(PercentCodec::Decode(segment, false));
  }

  if (builder.encoded_query_) {
    QueryParams decoded;
    decoded.reserve(builder.encoded_query_->size());
    for (const auto& [name, value] : *builder.encoded_query_) {
      std::optional<std::string> decoded_value;
      if (value)
        decoded_value = PercentCodec::Decode(*value, true);
      decoded.emplace_back(PercentCodec::Decode(name, true),
                           std::move(decoded_value));
    }
    query_ = std::move(decoded);
  }

  if (builder.encoded_fragment_)
    fragment_ = PercentCodec::Decode(*builder.encoded_fragment_, false);
}

std::string HttpUrl::GetEncodedUsername() const {
  if (username_.empty())
    return {};
  const size_t start = scheme_.size() + 3;  // "://"
  const size_t end = DelimiterOffset(url_, start, ":@");
  return url_.substr(start, end - start);
}

std::string HttpUrl::GetEncodedPassword() const {
  if (password_.empty())
    return {};
  const size_t start = url_.find(':', scheme_.size() + 3) + 1;
  const size_t end = url_.find('@');
  return url_.substr(start, end - start);
}

bool HttpUrl::HostIsIPv4() const {
  if (host_.empty() || HostIsIPv6())
    return false;
  return std::all_of(host_.begin(), host_.end(), [](char c) {
    return c == '.' || (c >= '0' && c <= '9');
  });
}

bool HttpUrl::HostIsIPv6() const {
  return host_.find(':') != std::string::npos;
}

std::string HttpUrl::GetEncodedPath() const {
  const size_t start = url_.find('/', scheme_.size() + 3);
  const size_t end = DelimiterOffset(url_, start, "?#");
  return url_.substr(start, end - start);
}

std::vector<std::string> HttpUrl::GetEncodedPathSegments() const {
  std::vector<std::string> segments;
  size_t pos = url_.find('/', scheme_.size() + 3);
  const size_t end = DelimiterOffset(url_, pos, "?#");
  while (pos < end) {
    ++pos;  // '/'
    const size_t segment_end = std::min(url_.find('/', pos), end);
    segments.push_back(url_.substr(pos, segment_end - pos));
    pos = segment_end;
  }
  return segments;
}

std::optional<std::string> HttpUrl::GetEncodedQuery() const {
  if (!query_)
    return std::nullopt;
  const size_t start = url_.find('?') + 1;
  const size_t end = DelimiterOffset(url_, start, "#");
  return url_.substr(start, end - start);
}

std::optional<std::string> HttpUrl::GetQuery() const {
  if (!query_)
    return std::nullopt;
  return QueryString::ToString(*query_);
}

size_t HttpUrl::GetQuerySize() const {
  return query_ ? query_->size() : 0;
}

std::optional<std::string> HttpUrl::GetQueryParameter(
  std::string_view name) const {
  if (!query_)
    return std::nullopt;
  for (const auto& [n, value] : *query_) {
    if (n == name)
      return value;
  }
  return std::nullopt;
}

std::vector<std::string> HttpUrl::GetQueryParameterNames() const {
  std::vector<std::string> names;
  if (!query_)
    return names;
  for (const auto& param : *query_) {
    if (std::find(names.begin(), names.end(), param.first) == names.end())
      names.push_back(param.first);
  }
  return names;
}

std::vector<std::optional<std::string>> HttpUrl::GetQueryParameterValues(
  std::string_view name) const {
  std::vector<std::optional<std::string>> values;
  if (!query_)
    return values;
  for (const auto& [n, value] : *query_) {
    if (n == name)
      values.push_back(value);
  }
  return values;
}

const std::string& HttpUrl::GetQueryParameterName(size_t index) const {
  if (!query_ || index >= query_->size())
    throw std::out_of_range("query parameter index out of range: " +
                            std::to_string(index));
  return (*query_)[index].first;
}

const std::optional<std::string>& HttpUrl::GetQueryParameterValue(
  size_t index) const {
  if (!query_ || index >= query_->size())
    throw std::out_of_range("query parameter index out of range: " +
                            std::to_string(index));
  return (*query_)[index].second;
}

std::optional<std::string> HttpUrl::GetEncodedFragment() const {
  if (!fragment_)
    return std::nullopt;
  return url_.substr(url_.find('#') + 1);
}

HttpUrl HttpUrl::Redact() const {
  return NewBuilder()
    .SetEncodedUsername("")
    .SetEncodedPassword("")
    .SetEncodedPath("/...")
    .SetEncodedQuery(std::nullopt)
    .SetEncodedFragment(std::nullopt)
    .Build();
}

std::optional<HttpUrl> HttpUrl::Resolve(std::string_view link) const {
  auto builder = NewBuilder(link);
  if (!builder)
    return std::nullopt;
  return builder->Build();
}

HttpUrl::Builder HttpUrl::NewBuilder() const {
  Builder builder;
  builder.scheme_ = scheme_;
  builder.encoded_username_ = GetEncodedUsername();
  builder.encoded_password_ = GetEncodedPassword();
  builder.host_ = host_;
  builder.port_ = port_ != DefaultPort(scheme_) ? port_ : -1;
  builder.encoded_path_segments_ = GetEncodedPathSegments();
  if (auto query = GetEncodedQuery())
    builder.encoded_query_ = QueryString::Parse(*query);
  builder.encoded_fragment_ = GetEncodedFragment();
  return builder;
}

std::optional<HttpUrl::Builder> HttpUrl::NewBuilder(
  std::string_view link) const {
  try {
    Builder builder;
    builder.Parse(this, link);
    return builder;
  } catch (const std::invalid_argument& e) {
    IF_DEBUG {
      logr::debug << "cannot resolve \"" << link << "\" against " << url_
                  << ": " << e.what();
    }
    return std::nullopt;
  }
}

std::string HttpUrl::ToUriString() const {
  return NewBuilder().ReEncodeForUri().ToString();
}

std::string HttpUrl::GetSha256() const {
  unsigned char hash[SHA256_DIGEST_LENGTH];
  SHA256((const unsigned char*)url_.c_str(), url_.size(), hash);
  std::ostringstream oss;
  for (auto byte : hash) {
    oss << std::hex << std::setw(2) << std::setfill('0') << (int)byte;
  }
  return oss.str();
}

std::uint64_t HttpUrl::GetID() const noexcept {
  unsigned char hash[SHA256_DIGEST_LENGTH];
  SHA256((const unsigned char*)url_.c_str(), url_.size(), hash);
  std::uint64_t id = 0;
  for (int i = 0; i < 8; ++i) {
    id = (id << 8) | hash[i];
  }
  return id;
}
