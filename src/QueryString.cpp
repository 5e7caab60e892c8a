#include "QueryString.hpp"

namespace QueryString {

QueryParams Parse(std::string_view encoded_query) {
  QueryParams params;
  size_t pos = 0;
  while (pos <= encoded_query.size()) {
    size_t amp = encoded_query.find('&', pos);
    if (amp == std::string_view::npos)
      amp = encoded_query.size();

    size_t eq = encoded_query.find('=', pos);
    if (eq == std::string_view::npos || eq > amp) {
      params.emplace_back(std::string(encoded_query.substr(pos, amp - pos)),
                          std::nullopt);
    } else {
      params.emplace_back(
        std::string(encoded_query.substr(pos, eq - pos)),
        std::string(encoded_query.substr(eq + 1, amp - eq - 1)));
    }
    pos = amp + 1;
  }
  return params;
}

void Write(std::string& out, const QueryParams& params) {
  bool first = true;
  for (const auto& [name, value] : params) {
    if (!first)
      out += '&';
    first = false;
    out += name;
    if (value.has_value()) {
      out += '=';
      out += *value;
    }
  }
}

std::string ToString(const QueryParams& params) {
  std::string out;
  Write(out, params);
  return out;
}

}  // namespace QueryString
