#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include "HttpUrl.hpp"
#include "Logger.hpp"

enum class OutputFormat { kText, kJson };

// urltool settings from conf.json. Every key is optional:
//
//   {
//     "base_url": "https://example.com/docs/",
//     "output": "json",
//     "strict_uri": false,
//     "redact": true,
//     "unique": false,
//     "log_level": "info"
//   }
class Config {
 public:
  // Loads the first conf.json found in the search path, or defaults.
  Config();
  // Throws std::runtime_error if the file is missing or invalid.
  Config(const std::filesystem::path& conf_file);

  Config(const Config& conf) = default;

  /// $HOME/.config/urltool, ./urltool, /etc/urltool; empty if none has a
  /// conf.json.
  static std::filesystem::path FindConfigFile();

  const std::filesystem::path& GetConfigFile() const;

  const std::optional<HttpUrl>& GetBaseUrl() const;
  void SetBaseUrl(const HttpUrl& base);

  OutputFormat GetOutputFormat() const;
  void SetOutputFormat(OutputFormat format);

  bool GetStrictUri() const;
  void SetStrictUri(bool strict);

  bool GetRedact() const;
  void SetRedact(bool redact);

  bool GetUnique() const;
  void SetUnique(bool unique);

  const std::optional<logr::Level>& GetLogLevel() const;

 private:
  void Load();

  std::filesystem::path config_file_;
  std::optional<HttpUrl> base_url_;
  OutputFormat output_format_ = OutputFormat::kText;
  bool strict_uri_ = false;
  bool redact_ = false;
  bool unique_ = false;
  std::optional<logr::Level> log_level_;
};
