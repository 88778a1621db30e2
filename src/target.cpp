#include "relpack/target.hpp"

#include "relpack/exceptions.hpp"

#include <algorithm>
#include <cctype>

namespace relpack
{

namespace
{
std::string lowercase(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}
} // namespace

std::string to_string(Os os)
{
    switch (os)
    {
    case Os::Windows:
        return "windows";
    case Os::Linux:
        return "linux";
    case Os::Darwin:
        return "darwin";
    }
    return "linux";
}

std::string to_string(Arch arch)
{
    switch (arch)
    {
    case Arch::Amd64:
        return "amd64";
    case Arch::Arm64:
        return "arm64";
    }
    return "amd64";
}

std::string to_string(const BuildTarget& target)
{
    return to_string(target.os) + "/" + to_string(target.arch);
}

Os parse_os(const std::string& s)
{
    auto v = lowercase(s);
    if (v == "windows")
        return Os::Windows;
    if (v == "linux")
        return Os::Linux;
    if (v == "darwin")
        return Os::Darwin;
    throw ConfigError("Unsupported target OS: '" + s + "' (expected windows, linux or darwin)");
}

Arch parse_arch(const std::string& s)
{
    auto v = lowercase(s);
    if (v == "amd64")
        return Arch::Amd64;
    if (v == "arm64")
        return Arch::Arm64;
    throw ConfigError("Unsupported target architecture: '" + s + "' (expected amd64 or arm64)");
}

BuildTarget parse_target(const std::string& s)
{
    auto slash = s.find('/');
    if (slash == std::string::npos || s.find('/', slash + 1) != std::string::npos)
        throw ConfigError("Malformed build target: '" + s + "' (expected <os>/<arch>)");
    return BuildTarget{parse_os(s.substr(0, slash)), parse_arch(s.substr(slash + 1))};
}

std::vector<BuildTarget> default_matrix()
{
    return {
        {Os::Windows, Arch::Amd64}, {Os::Windows, Arch::Arm64}, {Os::Linux, Arch::Amd64},
        {Os::Linux, Arch::Arm64},   {Os::Darwin, Arch::Amd64},  {Os::Darwin, Arch::Arm64},
    };
}

std::string artifact_name(const std::string& binary_name, const BuildTarget& target)
{
    return executable_name(binary_name + "-" + to_string(target.os) + "-" + to_string(target.arch),
                           target.os);
}

std::string executable_name(const std::string& name, Os os)
{
    if (os == Os::Windows)
        return name + ".exe";
    return name;
}

BuildTarget host_platform()
{
    BuildTarget host;
#if defined(_WIN32)
    host.os = Os::Windows;
#elif defined(__APPLE__)
    host.os = Os::Darwin;
#else
    host.os = Os::Linux;
#endif

#if defined(__aarch64__) || defined(_M_ARM64)
    host.arch = Arch::Arm64;
#else
    host.arch = Arch::Amd64;
#endif
    return host;
}

} // namespace relpack
