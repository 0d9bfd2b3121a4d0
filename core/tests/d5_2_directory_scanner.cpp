// D5.2 — Directory scanner test
// Tests: only regular files with a document extension are listed, sorted
// by path, subdirectories skipped, unreadable folder reported.

#include "lc/navigation/FolderScanner.hpp"

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <string>
#include <vector>

namespace fs = std::filesystem;

static void requireTrue(bool cond, const char* msg) {
  if (!cond) {
    std::fprintf(stderr, "ASSERT FAIL: %s\n", msg);
    std::exit(1);
  }
}

static void touch(const fs::path& p) {
  std::FILE* f = std::fopen(p.string().c_str(), "wb");
  requireTrue(f != nullptr, "create fixture file");
  std::fputs("x", f);
  std::fclose(f);
}

int main() {
  fs::path root = fs::temp_directory_path() / "lucent_d5_2_scanner";
  std::error_code ec;
  fs::remove_all(root, ec);
  fs::create_directories(root / "sub.png");

  touch(root / "c.png");
  touch(root / "a.JPG");
  touch(root / "b.svg");
  touch(root / "d.pdf");
  touch(root / "notes.txt");
  touch(root / "README");
  touch(root / "sub.png" / "nested.png");

  // --- Test 1: filtered and sorted ---
  {
    lc::DirectoryScanner scanner;
    std::vector<std::string> out;
    requireTrue(scanner.scan(root.string(), out), "scan ok");
    requireTrue(out.size() == 4, "four documents");
    requireTrue(fs::path(out[0]).filename() == "a.JPG", "a first");
    requireTrue(fs::path(out[1]).filename() == "b.svg", "b second");
    requireTrue(fs::path(out[2]).filename() == "c.png", "c third");
    requireTrue(fs::path(out[3]).filename() == "d.pdf", "d fourth");
    std::printf("  Test 1 (filter + sort) PASS\n");
  }

  // --- Test 2: missing folder ---
  {
    lc::DirectoryScanner scanner;
    std::vector<std::string> out{"stale"};
    requireTrue(!scanner.scan((root / "does-not-exist").string(), out), "scan fails");
    requireTrue(out.empty(), "output cleared");
    std::printf("  Test 2 (missing folder) PASS\n");
  }

  fs::remove_all(root, ec);
  std::printf("D5.2 directory_scanner: ALL PASS\n");
  return 0;
}
