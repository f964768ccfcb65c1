#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

// Filesystem operations on the removable device. Nothing here throws: a
// vanished device shows up as a false return or a populated error_code.
class Volume {
public:
  virtual ~Volume() = default;

  virtual bool is_directory(const std::filesystem::path& path) const = 0;
  virtual std::optional<std::uintmax_t> file_size(const std::filesystem::path& path) const = 0;

  virtual bool create_directories(const std::filesystem::path& path, std::error_code& ec) = 0;
  virtual bool write_marker(const std::filesystem::path& path, std::error_code& ec) = 0;
  virtual bool remove(const std::filesystem::path& path, std::error_code& ec) = 0;
  virtual bool remove_all(const std::filesystem::path& path, std::error_code& ec) = 0;

  // Copies from a local source onto the device, overwriting any existing file.
  virtual bool copy_file(const std::filesystem::path& from,
                         const std::filesystem::path& to,
                         std::error_code& ec) = 0;

  // Names of the immediate subdirectories of path, unsorted.
  virtual std::vector<std::string> list_directories(const std::filesystem::path& path,
                                                    std::error_code& ec) const = 0;
};

class LocalVolume : public Volume {
public:
  bool is_directory(const std::filesystem::path& path) const override;
  std::optional<std::uintmax_t> file_size(const std::filesystem::path& path) const override;

  bool create_directories(const std::filesystem::path& path, std::error_code& ec) override;
  bool write_marker(const std::filesystem::path& path, std::error_code& ec) override;
  bool remove(const std::filesystem::path& path, std::error_code& ec) override;
  bool remove_all(const std::filesystem::path& path, std::error_code& ec) override;
  bool copy_file(const std::filesystem::path& from,
                 const std::filesystem::path& to,
                 std::error_code& ec) override;
  std::vector<std::string> list_directories(const std::filesystem::path& path,
                                            std::error_code& ec) const override;
};
