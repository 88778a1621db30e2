#pragma once

#include <cstdint>
#include <filesystem>
#include <regex>
#include <string>
#include <vector>

namespace relpack::util
{

/// "512 B", "3.4 KB", "12.0 MB", "1.1 GB"
std::string human_size(std::uintmax_t bytes);

/// Size of a regular file, 0 if it cannot be read.
std::uintmax_t file_size_or_zero(const std::filesystem::path& path);

/// Adds execute permission for owner, group and others. No-op on Windows.
void make_executable(const std::filesystem::path& path);

/// Shell-style wildcard ('*', '?') translated to an anchored regex.
std::string wildcard_to_regex(const std::string& pattern);

/// Matches file names against shell-style wildcards.
class NameFilter
{
  public:
    NameFilter() = default;
    explicit NameFilter(const std::vector<std::string>& patterns);

    bool matches(const std::string& name) const;
    bool empty() const
    {
        return patterns_.empty();
    }

  private:
    std::vector<std::regex> patterns_;
};

/// Recursive copy of `source` into `destination`, skipping any entry whose
/// file name matches `ignore`. Existing files are overwritten.
/// @return number of files copied
std::size_t copy_tree(const std::filesystem::path& source,
                      const std::filesystem::path& destination, const NameFilter& ignore);

} // namespace relpack::util
