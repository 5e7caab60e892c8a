#pragma once

#include <nlohmann/json.hpp>
#include "HttpUrl.hpp"

namespace UrlReport {

/// Decoded components of `url` as a JSON object. Absent query and fragment
/// are null; query parameters are [name, value] pairs with a null value for
/// names without '='.
nlohmann::json ToJson(const HttpUrl& url);

}  // namespace UrlReport
