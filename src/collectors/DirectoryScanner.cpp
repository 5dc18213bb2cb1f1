#include "collectors/DirectoryScanner.hpp"
#include "util/AsciiLower.hpp"

#include <algorithm>
#include <cstdio>

namespace fs = std::filesystem;

namespace snapwatch::collectors {

auto has_accepted_extension(const std::string& name,
                            const std::vector<std::string>& exts) -> bool {
  auto ext = util::ascii_lower(fs::path(name).extension().string());
  if (ext.empty()) return false;
  return std::find(exts.begin(), exts.end(), ext) != exts.end();
}

auto scan_directory(const fs::path& dir, const std::vector<std::string>& exts,
                    std::error_code& ec) -> FileSet {
  FileSet out;
  ec.clear();
  fs::directory_iterator it(dir, ec);
  const fs::directory_iterator end;
  for (; !ec && it != end; it.increment(ec)) {
    std::error_code type_ec;
    // Follows symlinks; entries that vanish mid-scan are simply skipped
    if (!it->is_regular_file(type_ec) || type_ec) continue;
    auto name = it->path().filename().string();
    if (has_accepted_extension(name, exts)) out.insert(std::move(name));
  }
  return out;
}

auto remove_matching(const fs::path& dir, const std::vector<std::string>& exts)
    -> snapwatch::model::ClearResult {
  snapwatch::model::ClearResult res;
  std::error_code ec;
  auto files = scan_directory(dir, exts, ec);
  if (ec) {
    res.error = ec.message();
    std::fprintf(stderr, "snapwatch: clear: cannot scan %s: %s\n", dir.c_str(), res.error.c_str());
    return res;
  }
  for (const auto& name : files) {
    auto p = dir / name;
    std::error_code rm_ec;
    if (fs::remove(p, rm_ec) && !rm_ec) {
      ++res.deleted;
    } else {
      ++res.failed;
      std::fprintf(stderr, "snapwatch: clear: failed to delete %s: %s\n", p.c_str(),
                   rm_ec ? rm_ec.message().c_str() : "already gone");
    }
  }
  return res;
}

} // namespace snapwatch::collectors
