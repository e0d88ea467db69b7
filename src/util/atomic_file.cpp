#include "util/atomic_file.hpp"

#include <atomic>
#include <chrono>
#include <sstream>
#include <system_error>

#ifdef _WIN32
#include <windows.h>
#endif

namespace dappvault::util {

namespace {

std::atomic<std::uint64_t> g_temp_counter{0};

std::filesystem::path MakeTempPath(const std::filesystem::path& target) {
  const auto nonce = g_temp_counter.fetch_add(1, std::memory_order_relaxed);
  const auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  return target.parent_path() /
         (target.filename().string() + ".tmp." + std::to_string(now) + "." +
          std::to_string(nonce));
}

bool ReplaceFile(const std::filesystem::path& from, const std::filesystem::path& to,
                 std::string* error) {
#ifdef _WIN32
  if (!MoveFileExW(from.wstring().c_str(), to.wstring().c_str(),
                   MOVEFILE_REPLACE_EXISTING | MOVEFILE_WRITE_THROUGH)) {
    if (error) {
      *error = "MoveFileExW failed";
    }
    return false;
  }
  return true;
#else
  std::error_code ec;
  std::filesystem::rename(from, to, ec);
  if (ec) {
    if (error) {
      *error = "rename failed: " + ec.message();
    }
    return false;
  }
  return true;
#endif
}

void RemoveQuietly(const std::filesystem::path& path) {
  std::error_code ec;
  std::filesystem::remove(path, ec);
}

}  // namespace

bool AtomicWriteFile(const std::filesystem::path& path,
                     const std::function<bool(std::ofstream&)>& writer,
                     std::string* error, bool owner_only) {
  const auto parent = path.parent_path();
  if (!parent.empty()) {
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) {
      if (error) {
        *error = "create_directories failed: " + ec.message();
      }
      return false;
    }
  }

  const auto tmp_path = MakeTempPath(path);
  {
    std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
      if (error) {
        *error = "failed to open temp file for write: " + tmp_path.string();
      }
      return false;
    }
#ifndef _WIN32
    if (owner_only) {
      std::error_code ec;
      std::filesystem::permissions(tmp_path,
                                   std::filesystem::perms::owner_read |
                                       std::filesystem::perms::owner_write,
                                   std::filesystem::perm_options::replace, ec);
      if (ec) {
        out.close();
        RemoveQuietly(tmp_path);
        if (error) {
          *error = "chmod failed: " + ec.message();
        }
        return false;
      }
    }
#else
    (void)owner_only;
#endif
    if (!writer(out)) {
      out.close();
      RemoveQuietly(tmp_path);
      if (error && error->empty()) {
        *error = "writer failed";
      }
      return false;
    }
    out.flush();
    if (!out.good()) {
      out.close();
      RemoveQuietly(tmp_path);
      if (error) {
        *error = "flush failed";
      }
      return false;
    }
  }

  if (!ReplaceFile(tmp_path, path, error)) {
    RemoveQuietly(tmp_path);
    return false;
  }
  return true;
}

bool AtomicWriteFileText(const std::filesystem::path& path, std::string_view text,
                         std::string* error, bool owner_only) {
  return AtomicWriteFile(
      path,
      [&](std::ofstream& out) -> bool {
        out.write(text.data(), static_cast<std::streamsize>(text.size()));
        return out.good();
      },
      error, owner_only);
}

bool ReadFileText(const std::filesystem::path& path, std::string* out,
                  std::string* error, bool* missing) {
  if (missing) {
    *missing = false;
  }
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    if (missing) {
      *missing = true;
    }
    if (error) {
      *error = "file not found: " + path.string();
    }
    return false;
  }
  std::ifstream in(path, std::ios::binary);
  if (!in.is_open()) {
    if (error) {
      *error = "failed to open " + path.string();
    }
    return false;
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  if (in.bad()) {
    if (error) {
      *error = "failed to read " + path.string();
    }
    return false;
  }
  *out = buffer.str();
  return true;
}

}  // namespace dappvault::util
