#ifndef LOGARCHIVE_CORE_FS_UTILS_HPP_
#define LOGARCHIVE_CORE_FS_UTILS_HPP_

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <system_error>
#include <utility>

namespace logarchive::core {

// Sibling temp name used while an output is being written:
// `<final-name>.tmp.<steady-tick>.<counter>`.
inline std::filesystem::path BuildAtomicTempPath(const std::filesystem::path& output_path) {
  static std::atomic<std::uint64_t> counter{0};
  const auto tick = std::chrono::steady_clock::now().time_since_epoch().count();
  const std::uint64_t suffix = counter.fetch_add(1U, std::memory_order_relaxed);
  return output_path.string() + ".tmp." + std::to_string(tick) + "." + std::to_string(suffix);
}

inline bool EnsureParentDirectory(const std::filesystem::path& output_path, std::string& error) {
  if (output_path.empty()) {
    error = "output path cannot be empty";
    return false;
  }

  const std::filesystem::path parent_dir = output_path.parent_path();
  if (parent_dir.empty()) {
    return true;
  }

  std::error_code ec;
  std::filesystem::create_directories(parent_dir, ec);
  if (ec) {
    error = "failed to create output directory '" + parent_dir.string() + "': " + ec.message();
    return false;
  }

  return true;
}

// Absolute, lexically normalised form of `path`. Does not touch the
// filesystem, so it works for paths that do not exist yet.
inline std::filesystem::path NormalizePath(const std::filesystem::path& path) {
  std::error_code ec;
  std::filesystem::path absolute = std::filesystem::absolute(path, ec);
  if (ec) {
    absolute = path;
  }
  absolute = absolute.lexically_normal();
  if (!absolute.has_filename() && absolute.has_parent_path() &&
      absolute != absolute.root_path()) {
    absolute = absolute.parent_path();
  }
  return absolute;
}

// Like NormalizePath, but symlinks in the existing prefix of `path` are
// resolved, so two spellings of the same directory compare equal. The
// missing tail, if any, is kept lexically.
inline std::filesystem::path ResolvePhysicalPath(const std::filesystem::path& path) {
  std::error_code ec;
  const std::filesystem::path resolved =
      std::filesystem::weakly_canonical(NormalizePath(path), ec);
  if (ec) {
    return NormalizePath(path);
  }
  return NormalizePath(resolved);
}

// True when `path` equals `dir` or lies somewhere below it. Both arguments
// are expected in NormalizePath form.
inline bool IsPathUnder(const std::filesystem::path& path, const std::filesystem::path& dir) {
  auto path_it = path.begin();
  for (auto dir_it = dir.begin(); dir_it != dir.end(); ++dir_it, ++path_it) {
    if (path_it == path.end() || *path_it != *dir_it) {
      return false;
    }
  }
  return true;
}

// Owns a temporary output file until it is published. Destruction without a
// successful Publish() removes the file, so every early return and every
// error path leaves no temp artifact behind.
class ScopedTempFile {
public:
  ScopedTempFile() = default;
  explicit ScopedTempFile(std::filesystem::path path) : path_(std::move(path)) {}

  ~ScopedTempFile() {
    Discard();
  }

  ScopedTempFile(const ScopedTempFile&) = delete;
  ScopedTempFile& operator=(const ScopedTempFile&) = delete;

  const std::filesystem::path& Path() const {
    return path_;
  }

  bool Owned() const {
    return !path_.empty();
  }

  // Renames the temp file onto `final_path`. rename(2) replaces an existing
  // target atomically within one filesystem.
  bool Publish(const std::filesystem::path& final_path, std::string& error) {
    if (path_.empty()) {
      error = "no temporary file to publish for '" + final_path.string() + "'";
      return false;
    }

    std::error_code ec;
    std::filesystem::rename(path_, final_path, ec);
    if (ec) {
      error = "failed to publish '" + final_path.string() + "': " + ec.message();
      return false;
    }
    path_.clear();
    return true;
  }

  // Gives up ownership without touching the file.
  void Release() {
    path_.clear();
  }

  void Discard() {
    if (path_.empty()) {
      return;
    }
    std::error_code ec;
    std::filesystem::remove(path_, ec);
    path_.clear();
  }

private:
  std::filesystem::path path_;
};

} // namespace logarchive::core

#endif // LOGARCHIVE_CORE_FS_UTILS_HPP_
