#pragma once

#include <filesystem>
#include <fstream>
#include <functional>
#include <string>
#include <string_view>

namespace dappvault::util {

// Atomically replace `path` by writing to a temp file in the same directory and
// renaming it into place. The writer must write the full contents to the stream
// and return true on success. When `owner_only` is set the file is created
// with mode 0600 (ignored on Windows).
bool AtomicWriteFile(const std::filesystem::path& path,
                     const std::function<bool(std::ofstream&)>& writer,
                     std::string* error = nullptr,
                     bool owner_only = false);

bool AtomicWriteFileText(const std::filesystem::path& path, std::string_view text,
                         std::string* error = nullptr, bool owner_only = false);

// Reads the whole file. Returns false when it cannot be opened or read; a
// missing file is reported through `missing` so callers can treat it as empty
// state rather than corruption.
bool ReadFileText(const std::filesystem::path& path, std::string* out,
                  std::string* error = nullptr, bool* missing = nullptr);

}  // namespace dappvault::util
