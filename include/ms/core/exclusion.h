#pragma once

#include <filesystem>
#include <string_view>
#include <vector>

namespace ms::core {

// Trims surrounding whitespace and lexically normalizes the path; a trailing
// separator is dropped except on the root. Empty input stays empty.
std::filesystem::path CleanPath(std::string_view raw);

// root joined with rel, cleaned. "." maps to root itself.
std::filesystem::path JoinClean(const std::filesystem::path& root, const std::filesystem::path& rel);

// True when path equals one of the (already cleaned) excludes or lies beneath
// one. Component-wise, so /real/dir1x is not under /real/dir1.
bool IsExcluded(const std::filesystem::path& path,
                const std::vector<std::filesystem::path>& excludes);

// Number of separators in the cleaned relative path: "a" is 0, "a/b" is 1.
int DirectoryDepth(const std::filesystem::path& rel);

} // namespace ms::core
