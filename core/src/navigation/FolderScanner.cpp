#include "lc/navigation/FolderScanner.hpp"
#include "lc/document/Document.hpp"

#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <system_error>

namespace lc {

namespace fs = std::filesystem;

bool DirectoryScanner::scan(const std::string& folder, std::vector<std::string>& out) {
  out.clear();

  std::error_code ec;
  fs::directory_iterator it(folder, ec);
  if (ec) {
    std::fprintf(stderr, "DirectoryScanner::scan: cannot read '%s': %s\n",
                 folder.c_str(), ec.message().c_str());
    return false;
  }

  for (const fs::directory_entry& entry : it) {
    std::error_code fileEc;
    if (!entry.is_regular_file(fileEc) || fileEc) continue;
    std::string path = entry.path().string();
    if (documentKindFromPath(path)) out.push_back(std::move(path));
  }

  std::sort(out.begin(), out.end());
  return true;
}

} // namespace lc
