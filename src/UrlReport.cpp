#include "UrlReport.hpp"

using json = nlohmann::json;

namespace UrlReport {

json ToJson(const HttpUrl& url) {
  json j;
  j["url"] = url.ToString();
  j["scheme"] = url.GetScheme();
  j["username"] = url.GetUsername();
  j["password"] = url.GetPassword();
  j["host"] = url.GetHost();
  j["port"] = url.GetPort();
  j["path"] = url.GetEncodedPath();
  j["pathSegments"] = url.GetPathSegments();

  if (auto query = url.GetQuery()) {
    j["query"] = *query;
    json params = json::array();
    for (size_t i = 0; i < url.GetQuerySize(); ++i) {
      const auto& value = url.GetQueryParameterValue(i);
      params.push_back(
        json::array({url.GetQueryParameterName(i),
                     value ? json(*value) : json(nullptr)}));
    }
    j["queryParameters"] = std::move(params);
  } else {
    j["query"] = nullptr;
    j["queryParameters"] = json::array();
  }

  if (const auto& fragment = url.GetFragment())
    j["fragment"] = *fragment;
  else
    j["fragment"] = nullptr;

  j["sha256"] = url.GetSha256();
  return j;
}

}  // namespace UrlReport
