#pragma once
#include <filesystem>
#include <set>
#include <string>
#include <system_error>
#include <vector>
#include "model/Status.hpp"

namespace snapwatch::collectors {

// Filenames only, ordered, so set differences come out sorted.
using FileSet = std::set<std::string>;

// True if the lower-cased final suffix of name is one of exts (".jpg" style, lower-case).
[[nodiscard]] auto has_accepted_extension(const std::string& name,
                                          const std::vector<std::string>& exts) -> bool;

// Regular files in dir whose extension is accepted. On failure ec is set and
// the partial result must not be used.
[[nodiscard]] auto scan_directory(const std::filesystem::path& dir,
                                  const std::vector<std::string>& exts,
                                  std::error_code& ec) -> FileSet;

// Delete every accepted file in dir. Per-file failures are counted, not fatal.
[[nodiscard]] auto remove_matching(const std::filesystem::path& dir,
                                   const std::vector<std::string>& exts) -> snapwatch::model::ClearResult;

} // namespace snapwatch::collectors
