#include "ms/core/exclusion.h"

#include <cassert>
#include <filesystem>
#include <vector>

int main() {
  using ms::core::CleanPath;
  using ms::core::DirectoryDepth;
  using ms::core::IsExcluded;
  using ms::core::JoinClean;
  namespace stdfs = std::filesystem;

  assert(CleanPath(" /a//b/ ") == stdfs::path("/a/b"));
  assert(CleanPath("/") == stdfs::path("/"));
  assert(CleanPath("/a/./b/../c") == stdfs::path("/a/c"));
  assert(CleanPath("a/./b/..") == stdfs::path("a"));
  assert(CleanPath("   ").empty());

  assert(JoinClean("/t", ".") == stdfs::path("/t"));
  assert(JoinClean("/t", "a/b") == stdfs::path("/t/a/b"));
  assert(JoinClean("/t/", "a/") == stdfs::path("/t/a"));

  const std::vector<stdfs::path> excludes{"/real/dir1", "/real/other/deep"};

  assert(IsExcluded("/real/dir1", excludes));
  assert(IsExcluded("/real/dir1/", excludes));
  assert(IsExcluded("/real/dir1/sub/file.txt", excludes));
  assert(IsExcluded("  /real/dir1/sub  ", excludes));
  assert(IsExcluded("/real/dir2/../dir1/x", excludes));
  assert(IsExcluded("/real/other/deep/a", excludes));

  assert(!IsExcluded("/real/dir1x", excludes) && "sibling sharing a prefix");
  assert(!IsExcluded("/real", excludes) && "ancestors are not excluded");
  assert(!IsExcluded("/real/other", excludes));
  assert(!IsExcluded("/elsewhere/dir1", excludes));
  assert(!IsExcluded("/real/dir1", {}));

  assert(DirectoryDepth(".") == 0);
  assert(DirectoryDepth("a") == 0);
  assert(DirectoryDepth("a/b") == 1);
  assert(DirectoryDepth("a/b/c/") == 2);

  return 0;
}
