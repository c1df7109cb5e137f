#pragma once

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

namespace decorr::util {
namespace fs = std::filesystem;

inline fs::path make_tmp_path(const fs::path& out_path) {
  fs::path tmp = out_path;
  tmp += ".tmp";
  return tmp;
}

// Rename the finished temporary over the target so a reader never sees a
// half-written table.
inline void atomic_rename_over(const fs::path& tmp_path, const fs::path& out_path) {
  std::error_code ec;
  fs::rename(tmp_path, out_path, ec);
  if (!ec) return;

  // Some filesystems refuse to rename over an existing path.
  fs::remove(out_path, ec);
  ec.clear();
  fs::rename(tmp_path, out_path, ec);
  if (ec) {
    throw std::runtime_error("atomic rename failed: '" + tmp_path.string() + "' -> '" + out_path.string() + "' (" + ec.message() + ")");
  }
}

template <typename WriteFn>
inline void atomic_write_text(const fs::path& out_path, WriteFn&& fn) {
  if (out_path.has_parent_path()) {
    std::error_code ec;
    fs::create_directories(out_path.parent_path(), ec);
    if (ec) {
      throw std::runtime_error("failed to create output directory: " + out_path.parent_path().string() + " (" + ec.message() + ")");
    }
  }
  const fs::path tmp = make_tmp_path(out_path);
  {
    std::ofstream ofs(tmp);
    if (!ofs) throw std::runtime_error("failed to open temp file for atomic write: " + tmp.string());
    fn(ofs);
    ofs.flush();
    if (!ofs) throw std::runtime_error("failed while writing temp file: " + tmp.string());
  }
  atomic_rename_over(tmp, out_path);
}

} // namespace decorr::util
