#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

// Ordered query parameters. A value is std::nullopt when its name had no '='.
using QueryParams =
  std::vector<std::pair<std::string, std::optional<std::string>>>;

namespace QueryString {

/// Cuts `encoded_query` into names and values, so that
/// "subject=math&easy&problem=5-2=3" becomes
/// {("subject","math"), ("easy",nullopt), ("problem","5-2=3")}.
/// An empty string is a single pair with an empty name and no value.
QueryParams Parse(std::string_view encoded_query);

/// Joins pairs with '&', writing '=' only for pairs that have a value.
void Write(std::string& out, const QueryParams& params);

std::string ToString(const QueryParams& params);

}  // namespace QueryString
