#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

// Track number pulled out of a filename, or the filename itself when there
// is none. Numeric keys sort before text keys.
struct SortKey {
  std::optional<std::uint64_t> track;
  std::string text;

  bool numeric() const { return track.has_value(); }
};

SortKey extract_sort_key(const std::string& filename);
bool sort_key_less(const SortKey& lhs, const SortKey& rhs);

// Regular files under source, recursively, in lexical path order.
std::vector<std::filesystem::path> discover_files(const std::filesystem::path& source,
                                                  std::error_code& ec);

// Stable: files with equal keys keep their input order.
std::vector<std::filesystem::path> compute_order(const std::vector<std::filesystem::path>& files);
