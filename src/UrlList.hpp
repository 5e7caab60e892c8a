#pragma once

#include <filesystem>
#include <istream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include "HttpUrl.hpp"

// URLs read one per line, each resolved against an optional base. Lines that
// do not produce a valid http/https URL are counted and logged, not kept.
class UrlList {
 public:
  UrlList() = default;
  explicit UrlList(const std::optional<HttpUrl>& base);

  /// Returns false if `line` was rejected. Blank lines are ignored and
  /// return true.
  bool Add(std::string_view line);

  void LoadFromStream(std::istream& in);

  /// Throws std::runtime_error if the file cannot be opened.
  void LoadFromFile(const std::filesystem::path& filename);

  const std::vector<HttpUrl>& GetURLs() const;

  /// Accepted URLs sorted by canonical string, duplicates removed.
  std::vector<HttpUrl> GetUnique() const;

  size_t GetRejectedCount() const;
  const std::vector<std::string>& GetRejected() const;

 private:
  std::optional<HttpUrl> base_;
  std::vector<HttpUrl> urls_;
  std::vector<std::string> rejected_;
};
