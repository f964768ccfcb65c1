#include "volume.hpp"

#include <cerrno>
#include <fstream>

namespace fs = std::filesystem;

bool LocalVolume::is_directory(const fs::path& path) const {
  std::error_code ec;
  return fs::is_directory(path, ec);
}

std::optional<std::uintmax_t> LocalVolume::file_size(const fs::path& path) const {
  std::error_code ec;
  if(!fs::is_regular_file(path, ec)) return std::nullopt;
  auto size = fs::file_size(path, ec);
  if(ec) return std::nullopt;
  return size;
}

bool LocalVolume::create_directories(const fs::path& path, std::error_code& ec) {
  ec.clear();
  fs::create_directories(path, ec);
  if(ec) return false;
  // create_directories reports success without creating anything when the
  // path already exists, so confirm it is a directory we can use.
  if(!fs::is_directory(path, ec)) {
    if(!ec) ec = std::make_error_code(std::errc::not_a_directory);
    return false;
  }
  return true;
}

bool LocalVolume::write_marker(const fs::path& path, std::error_code& ec) {
  ec.clear();
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if(!out) {
    ec = std::error_code(errno != 0 ? errno : EIO, std::generic_category());
    return false;
  }
  out.put('\0');
  out.close();
  if(!out) {
    ec = std::make_error_code(std::errc::io_error);
    return false;
  }
  return true;
}

bool LocalVolume::remove(const fs::path& path, std::error_code& ec) {
  ec.clear();
  fs::remove(path, ec);
  return !ec;
}

bool LocalVolume::remove_all(const fs::path& path, std::error_code& ec) {
  ec.clear();
  auto removed = fs::remove_all(path, ec);
  if(removed == static_cast<std::uintmax_t>(-1)) return false;
  return !ec;
}

bool LocalVolume::copy_file(const fs::path& from, const fs::path& to, std::error_code& ec) {
  ec.clear();
  fs::copy_file(from, to, fs::copy_options::overwrite_existing, ec);
  return !ec;
}

std::vector<std::string> LocalVolume::list_directories(const fs::path& path, std::error_code& ec) const {
  std::vector<std::string> names;
  ec.clear();
  fs::directory_iterator it(path, ec);
  if(ec) return names;
  for(; !ec && it != fs::directory_iterator(); it.increment(ec)) {
    std::error_code entry_ec;
    if(it->is_directory(entry_ec)) {
      names.push_back(it->path().filename().string());
    }
  }
  if(ec) names.clear();
  return names;
}
