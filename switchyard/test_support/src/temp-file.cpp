#include "switchyard/temp-file.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <ios>
#include <random>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include "switchyard/log.hpp"

namespace switchyard::test {

namespace {

std::string ToHex(uint64_t value) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string out(16, '0');
  for (auto it = out.rbegin(); it != out.rend(); ++it, value >>= 4U) {
    *it = kHex[value & 0xFU];
  }
  return out;
}

std::mt19937_64& Rng() {
  thread_local std::mt19937_64 engine = [] {
    std::random_device rd;
    const auto now = static_cast<uint64_t>(std::chrono::steady_clock::now().time_since_epoch().count());
    std::seed_seq seq{static_cast<uint64_t>(rd()), now};
    return std::mt19937_64(seq);
  }();
  return engine;
}

}  // namespace

ScopedTempDir::ScopedTempDir(std::string_view prefix) {
  const auto base = std::filesystem::temp_directory_path();
  std::uniform_int_distribution<uint64_t> dist;
  for (int attempt = 0; attempt < 100; ++attempt) {
    auto candidate = base / (std::string(prefix) + ToHex(dist(Rng())));
    std::error_code ec;
    if (std::filesystem::create_directory(candidate, ec)) {
      _dir = std::move(candidate);
      return;
    }
  }
  throw std::runtime_error("ScopedTempDir: failed to create a temporary directory");
}

ScopedTempDir::ScopedTempDir(ScopedTempDir&& other) noexcept : _dir(std::move(other._dir)) { other._dir.clear(); }

ScopedTempDir& ScopedTempDir::operator=(ScopedTempDir&& other) noexcept {
  if (this != &other) {
    cleanup();
    _dir = std::move(other._dir);
    other._dir.clear();
  }
  return *this;
}

ScopedTempDir::~ScopedTempDir() { cleanup(); }

void ScopedTempDir::cleanup() noexcept {
  if (_dir.empty()) {
    return;
  }
  std::error_code ec;
  std::filesystem::remove_all(_dir, ec);
  if (ec) {
    log::error("ScopedTempDir: unable to remove {}: {}", _dir.string(), ec.message());
  }
  _dir.clear();
}

ScopedTempFile::ScopedTempFile(const ScopedTempDir& dir, std::string_view relativePath, std::string_view content)
    : _path(dir.dirPath() / relativePath), _content(content) {
  std::filesystem::create_directories(_path.parent_path());
  std::ofstream ofs(_path, std::ios::binary | std::ios::trunc);
  ofs.write(_content.data(), static_cast<std::streamsize>(_content.size()));
  if (!ofs) {
    throw std::runtime_error("ScopedTempFile: unable to write " + _path.string());
  }
}

ScopedTempFile::ScopedTempFile(ScopedTempFile&& other) noexcept
    : _path(std::move(other._path)), _content(std::move(other._content)) {
  other._path.clear();
}

ScopedTempFile& ScopedTempFile::operator=(ScopedTempFile&& other) noexcept {
  if (this != &other) {
    cleanup();
    _path = std::move(other._path);
    _content = std::move(other._content);
    other._path.clear();
  }
  return *this;
}

ScopedTempFile::~ScopedTempFile() { cleanup(); }

void ScopedTempFile::cleanup() noexcept {
  if (_path.empty()) {
    return;
  }
  std::error_code ec;
  if (!std::filesystem::remove(_path, ec) && ec) {
    log::error("ScopedTempFile: unable to remove {}: {}", _path.string(), ec.message());
  }
  _path.clear();
}

}  // namespace switchyard::test
