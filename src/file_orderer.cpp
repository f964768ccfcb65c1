#include "file_orderer.hpp"

#include <algorithm>
#include <limits>
#include <regex>
#include <utility>

namespace {

std::uint64_t parse_track(const std::string& digits) {
  constexpr auto kMax = std::numeric_limits<std::uint64_t>::max();
  std::uint64_t value = 0;
  for(char c : digits) {
    const auto digit = static_cast<std::uint64_t>(c - '0');
    if(value > (kMax - digit) / 10) return kMax;
    value = value * 10 + digit;
  }
  return value;
}

} // namespace

SortKey extract_sort_key(const std::string& filename) {
  static const std::regex kTrackOf("track_([0-9]+)_of_");
  static const std::regex kDelimited("_([0-9]+)_");

  SortKey key;
  std::smatch match;
  if(std::regex_search(filename, match, kTrackOf) ||
     std::regex_search(filename, match, kDelimited)) {
    key.track = parse_track(match[1].str());
  } else {
    key.text = filename;
  }
  return key;
}

bool sort_key_less(const SortKey& lhs, const SortKey& rhs) {
  if(lhs.numeric() != rhs.numeric()) return lhs.numeric();
  if(lhs.numeric()) return *lhs.track < *rhs.track;
  return lhs.text < rhs.text;
}

std::vector<std::filesystem::path> discover_files(const std::filesystem::path& source,
                                                  std::error_code& ec) {
  namespace fs = std::filesystem;
  std::vector<fs::path> files;
  ec.clear();
  fs::recursive_directory_iterator it(source, ec);
  if(ec) return files;
  for(; !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
    std::error_code entry_ec;
    if(it->is_regular_file(entry_ec)) {
      files.push_back(it->path());
    }
  }
  if(ec) {
    files.clear();
    return files;
  }
  std::sort(files.begin(), files.end());
  return files;
}

std::vector<std::filesystem::path> compute_order(const std::vector<std::filesystem::path>& files) {
  std::vector<std::pair<SortKey, std::filesystem::path>> keyed;
  keyed.reserve(files.size());
  for(const auto& file : files) {
    keyed.emplace_back(extract_sort_key(file.filename().string()), file);
  }
  std::stable_sort(keyed.begin(), keyed.end(),
                   [](const auto& a, const auto& b){ return sort_key_less(a.first, b.first); });

  std::vector<std::filesystem::path> ordered;
  ordered.reserve(keyed.size());
  for(auto& entry : keyed) {
    ordered.push_back(std::move(entry.second));
  }
  return ordered;
}
