#pragma once
#include <string>
#include <vector>

namespace lc {

// Lists the viewable documents of a folder in navigation order.
class FolderScanner {
public:
  virtual ~FolderScanner() = default;

  // Returns false if the folder cannot be read; `out` is left empty.
  virtual bool scan(const std::string& folder, std::vector<std::string>& out) = 0;
};

// Regular files with a recognised document extension, sorted by path.
// Not recursive.
class DirectoryScanner : public FolderScanner {
public:
  bool scan(const std::string& folder, std::vector<std::string>& out) override;
};

} // namespace lc
