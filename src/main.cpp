#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "Config.hpp"
#include "HttpUrl.hpp"
#include "Logger.hpp"
#include "UrlList.hpp"
#include "UrlReport.hpp"

namespace {

constexpr const char* kUsage =
  "usage: urltool [--base URL] [--json] [--uri] [--redact] [--unique]\n"
  "               [--config FILE] [--log-level LEVEL] [URL | @file]...\n"
  "\n"
  "Prints the canonical form of each http/https URL, one per line.\n"
  "With no URL arguments, URLs are read from standard input.\n"
  "\n"
  "  --base URL         resolve inputs as links relative to URL\n"
  "  --json             print each URL's components as a JSON object\n"
  "  --uri              print the strict RFC 2396 form\n"
  "  --redact           drop userinfo, path, query and fragment\n"
  "  --unique           sort and de-duplicate the output\n"
  "  --config FILE      read settings from FILE instead of conf.json\n"
  "  --log-level LEVEL  debug, info, warning, error or none\n";

struct Options {
  std::optional<std::string> base;
  std::optional<std::string> config_file;
  std::optional<logr::Level> log_level;
  bool json = false;
  bool uri = false;
  bool redact = false;
  bool unique = false;
  std::vector<std::string> inputs;
};

// Returns std::nullopt after printing usage if the arguments are invalid.
std::optional<Options> ParseArgs(int argc, char* argv[]) {
  Options opts;
  for (int i = 1; i < argc; ++i) {
    std::string_view arg = argv[i];
    auto value = [&]() -> std::optional<std::string> {
      if (i + 1 >= argc) {
        logr::error << arg << " needs a value";
        return std::nullopt;
      }
      return std::string(argv[++i]);
    };

    if (arg == "--json") {
      opts.json = true;
    } else if (arg == "--uri") {
      opts.uri = true;
    } else if (arg == "--redact") {
      opts.redact = true;
    } else if (arg == "--unique") {
      opts.unique = true;
    } else if (arg == "--base") {
      if (!(opts.base = value()))
        return std::nullopt;
    } else if (arg == "--config") {
      if (!(opts.config_file = value()))
        return std::nullopt;
    } else if (arg == "--log-level") {
      auto level = value();
      if (!level)
        return std::nullopt;
      opts.log_level = logr::ParseLevel(*level);
      if (!opts.log_level) {
        logr::error << "unknown log level: " << *level;
        return std::nullopt;
      }
    } else if (arg == "--") {
      for (++i; i < argc; ++i)
        opts.inputs.emplace_back(argv[i]);
    } else if (arg.size() > 1 && arg[0] == '-' && arg[1] == '-') {
      logr::error << "unknown option: " << arg;
      return std::nullopt;
    } else {
      opts.inputs.emplace_back(arg);
    }
  }
  return opts;
}

void Print(const HttpUrl& url, const Config& conf) {
  if (conf.GetOutputFormat() == OutputFormat::kJson) {
    auto j = UrlReport::ToJson(url);
    if (conf.GetStrictUri())
      j["uri"] = url.ToUriString();
    std::cout << j.dump() << '\n';
  } else if (conf.GetStrictUri()) {
    std::cout << url.ToUriString() << '\n';
  } else {
    std::cout << url << '\n';
  }
}

}  // namespace

int main(int argc, char* argv[]) {
  for (int i = 1; i < argc; ++i) {
    std::string_view arg = argv[i];
    if (arg == "-h" || arg == "--help") {
      std::cout << kUsage;
      return 0;
    }
  }

  auto opts = ParseArgs(argc, argv);
  if (!opts) {
    std::cerr << kUsage;
    return 2;
  }

  std::optional<Config> conf;
  try {
    conf = opts->config_file ? Config(*opts->config_file) : Config();
  } catch (const std::exception& e) {
    logr::error << e.what();
    return 2;
  }

  if (opts->log_level)
    logr::SetLevel(*opts->log_level);
  else if (conf->GetLogLevel())
    logr::SetLevel(*conf->GetLogLevel());

  // command-line flags win over conf.json
  if (opts->base) {
    try {
      conf->SetBaseUrl(HttpUrl::Get(*opts->base));
    } catch (const std::invalid_argument& e) {
      logr::error << "invalid --base: " << e.what();
      return 2;
    }
  }
  if (opts->json)
    conf->SetOutputFormat(OutputFormat::kJson);
  if (opts->uri)
    conf->SetStrictUri(true);
  if (opts->redact)
    conf->SetRedact(true);
  if (opts->unique)
    conf->SetUnique(true);

  if (const auto& base = conf->GetBaseUrl()) {
    IF_INFO {
      logr::info << "base: " << base->Redact();
    }
  }

  UrlList list(conf->GetBaseUrl());
  bool failed = false;

  if (opts->inputs.empty()) {
    list.LoadFromStream(std::cin);
  }
  for (const auto& input : opts->inputs) {
    if (input.size() > 1 && input[0] == '@') {
      try {
        list.LoadFromFile(input.substr(1));
      } catch (const std::runtime_error& e) {
        logr::error << e.what();
        failed = true;
      }
    } else {
      list.Add(input);
    }
  }

  const auto& urls = conf->GetUnique() ? list.GetUnique() : list.GetURLs();
  for (const auto& url : urls) {
    Print(conf->GetRedact() ? url.Redact() : url, *conf);
  }
  std::cout.flush();

  if (list.GetRejectedCount() > 0) {
    IF_INFO {
      logr::info << list.GetRejectedCount() << " input(s) rejected";
    }
    failed = true;
  }
  return failed ? 1 : 0;
}
