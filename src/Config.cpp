#include "Config.hpp"

#include <cstdlib>  // for std::getenv
#include <fstream>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <vector>

using json = nlohmann::json;

namespace {

bool ReadBool(const json& j, const char* key, bool fallback) {
  auto it = j.find(key);
  if (it == j.end())
    return fallback;
  if (!it->is_boolean())
    throw std::runtime_error(std::string("\"") + key + "\" must be a boolean");
  return it->get<bool>();
}

std::optional<std::string> ReadString(const json& j, const char* key) {
  auto it = j.find(key);
  if (it == j.end())
    return std::nullopt;
  if (!it->is_string())
    throw std::runtime_error(std::string("\"") + key + "\" must be a string");
  return it->get<std::string>();
}

}  // namespace

Config::Config() : config_file_{FindConfigFile()} {
  if (config_file_.empty()) {
    IF_DEBUG {
      logr::debug << "no urltool conf.json found, using defaults";
    }
    return;
  }
  Load();
}

Config::Config(const std::filesystem::path& conf_file)
    : config_file_{conf_file} {
  if (config_file_.empty() || !std::filesystem::exists(config_file_)) {
    throw std::runtime_error("urltool config not found: " +
                             config_file_.string());
  }
  Load();
}

std::filesystem::path Config::FindConfigFile() {
  std::vector<std::filesystem::path> dirs;
  if (const char* h = std::getenv("HOME")) {
    dirs.push_back(std::filesystem::path{h} / ".config" / "urltool");
  }
  dirs.push_back(std::filesystem::current_path() / "urltool");
  dirs.push_back(std::filesystem::path{"/etc"} / "urltool");

  for (auto const& dir : dirs) {
    std::error_code ec;
    if (std::filesystem::exists(dir / "conf.json", ec)) {
      return dir / "conf.json";
    }
  }
  return {};
}

void Config::Load() {
  std::ifstream in{config_file_};
  if (!in.is_open()) {
    throw std::runtime_error("Failed to open " + config_file_.string());
  }

  try {
    json j;
    in >> j;
    if (!j.is_object())
      throw std::runtime_error("top level must be an object");

    if (auto base = ReadString(j, "base_url")) {
      base_url_ = HttpUrl::Get(*base);
    }

    if (auto output = ReadString(j, "output")) {
      if (*output == "text")
        output_format_ = OutputFormat::kText;
      else if (*output == "json")
        output_format_ = OutputFormat::kJson;
      else
        throw std::runtime_error("\"output\" must be \"text\" or \"json\"");
    }

    strict_uri_ = ReadBool(j, "strict_uri", strict_uri_);
    redact_ = ReadBool(j, "redact", redact_);
    unique_ = ReadBool(j, "unique", unique_);

    if (auto level = ReadString(j, "log_level")) {
      log_level_ = logr::ParseLevel(*level);
      if (!log_level_)
        throw std::runtime_error("unknown \"log_level\": " + *level);
    }
  } catch (const std::exception& ex) {
    throw std::runtime_error("Error parsing " + config_file_.string() + ": " +
                             ex.what());
  }

  IF_INFO {
    logr::info << "loaded " << config_file_.string();
  }
}

const std::filesystem::path& Config::GetConfigFile() const {
  return config_file_;
}

const std::optional<HttpUrl>& Config::GetBaseUrl() const {
  return base_url_;
}

void Config::SetBaseUrl(const HttpUrl& base) {
  base_url_ = base;
}

OutputFormat Config::GetOutputFormat() const {
  return output_format_;
}

void Config::SetOutputFormat(OutputFormat format) {
  output_format_ = format;
}

bool Config::GetStrictUri() const {
  return strict_uri_;
}

void Config::SetStrictUri(bool strict) {
  strict_uri_ = strict;
}

bool Config::GetRedact() const {
  return redact_;
}

void Config::SetRedact(bool redact) {
  redact_ = redact;
}

bool Config::GetUnique() const {
  return unique_;
}

void Config::SetUnique(bool unique) {
  unique_ = unique;
}

const std::optional<logr::Level>& Config::GetLogLevel() const {
  return log_level_;
}
