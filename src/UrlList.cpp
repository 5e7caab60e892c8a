#include "UrlList.hpp"
#include "Logger.hpp"

#include <algorithm>
#include <fstream>
#include <stdexcept>

namespace {

bool IsBlank(std::string_view line) {
  return std::all_of(line.begin(), line.end(), [](char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f';
  });
}

}  // namespace

UrlList::UrlList(const std::optional<HttpUrl>& base) : base_{base} {
}

bool UrlList::Add(std::string_view line) {
  if (IsBlank(line))
    return true;

  try {
    HttpUrl url = HttpUrl::Builder()
                    .Parse(base_ ? &*base_ : nullptr, line)
                    .Build();
    urls_.push_back(std::move(url));
    return true;
  } catch (const std::invalid_argument& ex) {
    logr::warning << "rejected \"" << line << "\": " << ex.what();
    rejected_.emplace_back(line);
    return false;
  }
}

void UrlList::LoadFromStream(std::istream& in) {
  std::string line;
  while (std::getline(in, line)) {
    Add(line);
  }
}

void UrlList::LoadFromFile(const std::filesystem::path& filename) {
  std::ifstream infile(filename);
  if (!infile) {
    throw std::runtime_error("UrlList: cannot open " + filename.string());
  }
  IF_INFO {
    logr::info << "FILE: " << filename.string();
  }
  LoadFromStream(infile);
}

const std::vector<HttpUrl>& UrlList::GetURLs() const {
  return urls_;
}

std::vector<HttpUrl> UrlList::GetUnique() const {
  std::vector<HttpUrl> unique = urls_;
  std::sort(unique.begin(), unique.end());
  unique.erase(std::unique(unique.begin(), unique.end()), unique.end());
  return unique;
}

size_t UrlList::GetRejectedCount() const {
  return rejected_.size();
}

const std::vector<std::string>& UrlList::GetRejected() const {
  return rejected_;
}
