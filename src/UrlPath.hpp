#pragma once

#include <string>
#include <string_view>
#include <vector>

// Encoded path segments. Never empty; {"a", "b", ""} is the path "/a/b/".
using PathSegments = std::vector<std::string>;

namespace UrlPath {

/// "." or its escaped form "%2e".
bool IsDot(std::string_view segment);

/// ".." or any of its escaped forms (".%2e", "%2e.", "%2e%2e", any case).
bool IsDotDot(std::string_view segment);

/// Offset of the next '/' or '\' in input[pos, limit), or limit.
size_t SegmentDelimiterOffset(std::string_view input, size_t pos,
                              size_t limit);

/// Encodes `segment` for the path and appends it, applying dot-segment rules.
/// An empty last segment is overwritten instead of leaving "//".
void Push(PathSegments& segments, std::string_view segment,
          bool add_trailing_slash, bool already_encoded);

/// Removes the last segment, leaving the path ending in '/'. Popping the root
/// keeps the root.
void Pop(PathSegments& segments);

/// Resolves the path reference `reference` against `segments` in place.
/// An empty reference keeps the base path, one starting with '/' or '\'
/// replaces it, anything else replaces the last segment.
void Resolve(PathSegments& segments, std::string_view reference);

/// Appends the slash-delimited `segments_text` like a relative reference
/// that never discards the current last segment.
void AddSegments(PathSegments& segments, std::string_view segments_text,
                 bool already_encoded);

/// "/" + segments joined with "/".
std::string Join(const PathSegments& segments);

}  // namespace UrlPath
