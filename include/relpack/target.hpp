#pragma once

#include <string>
#include <vector>

namespace relpack
{

enum class Os
{
    Windows,
    Linux,
    Darwin
};

enum class Arch
{
    Amd64,
    Arm64
};

/// An (operating system, architecture) pair selecting one cross-compilation output.
struct BuildTarget
{
    Os os{Os::Linux};
    Arch arch{Arch::Amd64};

    bool operator==(const BuildTarget& other) const
    {
        return os == other.os && arch == other.arch;
    }
    bool operator!=(const BuildTarget& other) const
    {
        return !(*this == other);
    }
};

std::string to_string(Os os);
std::string to_string(Arch arch);

/// "linux/amd64"
std::string to_string(const BuildTarget& target);

/// Strict parsers; throw ConfigError for values outside the supported set.
Os parse_os(const std::string& s);
Arch parse_arch(const std::string& s);
BuildTarget parse_target(const std::string& s);

/// windows/amd64, windows/arm64, linux/amd64, linux/arm64, darwin/amd64, darwin/arm64
std::vector<BuildTarget> default_matrix();

/// `<name>-<os>-<arch>`, with ".exe" appended only for windows targets.
std::string artifact_name(const std::string& binary_name, const BuildTarget& target);

/// `<name>` with ".exe" appended only when `os` is windows.
std::string executable_name(const std::string& name, Os os);

/// Platform relpack itself was compiled for.
BuildTarget host_platform();

} // namespace relpack
