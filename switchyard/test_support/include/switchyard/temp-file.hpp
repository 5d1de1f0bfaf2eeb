#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace switchyard::test {

// Unique directory under the system temp directory, removed with its content on destruction.
class ScopedTempDir {
 public:
  explicit ScopedTempDir(std::string_view prefix = "switchyard-dir-");

  ScopedTempDir(const ScopedTempDir&) = delete;
  ScopedTempDir& operator=(const ScopedTempDir&) = delete;
  ScopedTempDir(ScopedTempDir&& other) noexcept;
  ScopedTempDir& operator=(ScopedTempDir&& other) noexcept;

  ~ScopedTempDir();

  [[nodiscard]] const std::filesystem::path& dirPath() const noexcept { return _dir; }

 private:
  void cleanup() noexcept;

  std::filesystem::path _dir;
};

// File 'relativePath' created with 'content' inside an existing ScopedTempDir, intermediate directories
// included. Only the file is removed on destruction, the directory belongs to the ScopedTempDir.
class ScopedTempFile {
 public:
  ScopedTempFile(const ScopedTempDir& dir, std::string_view relativePath, std::string_view content);

  ScopedTempFile(const ScopedTempFile&) = delete;
  ScopedTempFile& operator=(const ScopedTempFile&) = delete;
  ScopedTempFile(ScopedTempFile&& other) noexcept;
  ScopedTempFile& operator=(ScopedTempFile&& other) noexcept;

  ~ScopedTempFile();

  [[nodiscard]] const std::filesystem::path& filePath() const noexcept { return _path; }

  [[nodiscard]] const std::string& content() const noexcept { return _content; }

 private:
  void cleanup() noexcept;

  std::filesystem::path _path;
  std::string _content;
};

}  // namespace switchyard::test
