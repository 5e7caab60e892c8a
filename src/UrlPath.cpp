#include "UrlPath.hpp"
#include "PercentCodec.hpp"

namespace {

bool EqualsIgnoreCase(std::string_view a, std::string_view b) {
  if (a.size() != b.size())
    return false;
  for (size_t i = 0; i < a.size(); ++i) {
    char x = a[i];
    char y = b[i];
    if (x >= 'A' && x <= 'Z')
      x = static_cast<char>(x - 'A' + 'a');
    if (y >= 'A' && y <= 'Z')
      y = static_cast<char>(y - 'A' + 'a');
    if (x != y)
      return false;
  }
  return true;
}

}  // namespace

namespace UrlPath {

bool IsDot(std::string_view segment) {
  return segment == "." || EqualsIgnoreCase(segment, "%2e");
}

bool IsDotDot(std::string_view segment) {
  return segment == ".." || EqualsIgnoreCase(segment, "%2e.") ||
         EqualsIgnoreCase(segment, ".%2e") ||
         EqualsIgnoreCase(segment, "%2e%2e");
}

size_t SegmentDelimiterOffset(std::string_view input, size_t pos,
                              size_t limit) {
  for (size_t i = pos; i < limit; ++i) {
    if (input[i] == '/' || input[i] == '\\')
      return i;
  }
  return limit;
}

void Push(PathSegments& segments, std::string_view segment,
          bool add_trailing_slash, bool already_encoded) {
  std::string encoded = PercentCodec::Encode(segment, UrlToken::kPath,
                                             already_encoded, false, false,
                                             true);
  if (IsDot(encoded))
    return;
  if (IsDotDot(encoded)) {
    Pop(segments);
    return;
  }
  if (segments.back().empty()) {
    segments.back() = std::move(encoded);
  } else {
    segments.push_back(std::move(encoded));
  }
  if (add_trailing_slash)
    segments.emplace_back();
}

// "/a/b/c/" is {"a","b","c",""} and pops to {"a","b",""}; "/a/b/c" is
// {"a","b","c"} and pops to the same.
void Pop(PathSegments& segments) {
  std::string removed = std::move(segments.back());
  segments.pop_back();

  if (removed.empty() && !segments.empty()) {
    segments.back().clear();
  } else {
    segments.emplace_back();
  }
}

void Resolve(PathSegments& segments, std::string_view reference) {
  if (reference.empty())
    return;

  size_t pos = 0;
  const size_t limit = reference.size();
  if (reference[0] == '/' || reference[0] == '\\') {
    segments.assign(1, std::string());
    ++pos;
  } else {
    segments.back().clear();
  }

  while (pos < limit) {
    size_t end = SegmentDelimiterOffset(reference, pos, limit);
    const bool has_trailing_slash = end < limit;
    Push(segments, reference.substr(pos, end - pos), has_trailing_slash, true);
    pos = has_trailing_slash ? end + 1 : end;
  }
}

void AddSegments(PathSegments& segments, std::string_view segments_text,
                 bool already_encoded) {
  size_t offset = 0;
  do {
    size_t end =
      SegmentDelimiterOffset(segments_text, offset, segments_text.size());
    const bool add_trailing_slash = end < segments_text.size();
    Push(segments, segments_text.substr(offset, end - offset),
         add_trailing_slash, already_encoded);
    offset = end + 1;
  } while (offset <= segments_text.size());
}

std::string Join(const PathSegments& segments) {
  std::string out;
  for (const auto& segment : segments) {
    out += '/';
    out += segment;
  }
  return out;
}

}  // namespace UrlPath
