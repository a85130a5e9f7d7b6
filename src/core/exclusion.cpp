#include "ms/core/exclusion.h"

#include "ms/common.h"

#include <algorithm>
#include <string>

namespace ms::core {

std::filesystem::path CleanPath(std::string_view raw) {
  const auto trimmed = TrimWhitespace(raw);
  if (trimmed.empty()) {
    return {};
  }
  auto normal = std::filesystem::path(std::string(trimmed)).lexically_normal().generic_string();
  while (normal.size() > 1 && normal.back() == '/') {
    normal.pop_back();
  }
  if (normal.empty()) {
    normal = ".";
  }
  return std::filesystem::path(normal);
}

std::filesystem::path JoinClean(const std::filesystem::path& root, const std::filesystem::path& rel) {
  if (rel.empty() || rel == ".") {
    return CleanPath(root.generic_string());
  }
  return CleanPath((root / rel).generic_string());
}

bool IsExcluded(const std::filesystem::path& path,
                const std::vector<std::filesystem::path>& excludes) {
  const auto candidate = CleanPath(path.generic_string());
  for (const auto& excluded : excludes) {
    if (candidate == excluded) {
      return true;
    }
    const auto rel = candidate.lexically_relative(excluded);
    if (rel.empty()) {
      continue;  // no common root, e.g. relative against absolute
    }
    const auto first = *rel.begin();
    if (first != "..") {
      return true;
    }
  }
  return false;
}

int DirectoryDepth(const std::filesystem::path& rel) {
  const auto cleaned = CleanPath(rel.generic_string()).generic_string();
  return static_cast<int>(std::count(cleaned.begin(), cleaned.end(), '/'));
}

} // namespace ms::core
