#include "relpack/util/files.hpp"

#include <iomanip>
#include <sstream>

namespace relpack::util
{

std::string human_size(std::uintmax_t bytes)
{
    static const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    if (bytes < 1024)
        return std::to_string(bytes) + " B";

    double value = static_cast<double>(bytes);
    size_t unit = 0;
    while (value >= 1024.0 && unit + 1 < sizeof(units) / sizeof(units[0]))
    {
        value /= 1024.0;
        ++unit;
    }

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << value << " " << units[unit];
    return oss.str();
}

std::uintmax_t file_size_or_zero(const std::filesystem::path& path)
{
    std::error_code ec;
    auto size = std::filesystem::file_size(path, ec);
    return ec ? 0 : size;
}

void make_executable(const std::filesystem::path& path)
{
#ifndef _WIN32
    using std::filesystem::perms;
    std::filesystem::permissions(path, perms::owner_exec | perms::group_exec | perms::others_exec,
                                 std::filesystem::perm_options::add);
#else
    (void)path;
#endif
}

static std::string escape_regex_char(char c)
{
    static const std::string special = R"(\^$.|+()[]{})";
    if (special.find(c) != std::string::npos)
        return std::string("\\") + c;
    return std::string(1, c);
}

std::string wildcard_to_regex(const std::string& pattern)
{
    std::string result;
    result.reserve(pattern.size() * 2);
    for (char c : pattern)
    {
        if (c == '*')
            result += ".*";
        else if (c == '?')
            result += ".";
        else
            result += escape_regex_char(c);
    }
    return "^" + result + "$";
}

NameFilter::NameFilter(const std::vector<std::string>& patterns)
{
    patterns_.reserve(patterns.size());
    for (const auto& p : patterns)
        patterns_.emplace_back(wildcard_to_regex(p));
}

bool NameFilter::matches(const std::string& name) const
{
    for (const auto& re : patterns_)
    {
        if (std::regex_match(name, re))
            return true;
    }
    return false;
}

std::size_t copy_tree(const std::filesystem::path& source,
                      const std::filesystem::path& destination, const NameFilter& ignore)
{
    namespace fs = std::filesystem;

    fs::create_directories(destination);

    std::size_t copied = 0;
    for (const auto& entry : fs::directory_iterator(source))
    {
        const auto name = entry.path().filename();
        if (ignore.matches(name.string()))
            continue;

        const auto target = destination / name;
        if (entry.is_symlink())
        {
            fs::copy_symlink(entry.path(), target);
            ++copied;
        }
        else if (entry.is_directory())
        {
            copied += copy_tree(entry.path(), target, ignore);
        }
        else if (entry.is_regular_file())
        {
            fs::copy_file(entry.path(), target, fs::copy_options::overwrite_existing);
            ++copied;
        }
    }
    return copied;
}

} // namespace relpack::util
