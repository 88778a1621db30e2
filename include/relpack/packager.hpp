#pragma once
#include "relpack/logging.hpp"
#include "relpack/settings.hpp"
#include "relpack/target.hpp"
#include "relpack/toolchain.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace relpack
{

/// Outcome of one cross-compiled target.
struct BuildResult
{
    BuildTarget target;
    bool ok{false};
    std::filesystem::path artifact;
    std::uintmax_t size_bytes{0};
    std::string error;
};

struct MatrixReport
{
    std::vector<BuildResult> results;

    std::vector<BuildTarget> failures() const;
    bool all_ok() const
    {
        return failures().empty();
    }
};

struct PackagerOptions
{
    bool with_rust_host{false};
};

/// Drives the Go cross-compilation matrix and the host-native Rust build.
///
/// Matrix targets are best effort: a failed target is recorded and the next one
/// is attempted. The host artifact has no fallback, so every host failure throws.
class ReleasePackager
{
  public:
    ReleasePackager(const Settings& settings, CommandRunner& runner, const Logger& logger,
                    BuildTarget host = host_platform());

    /// Throws ToolNotFoundError when the tool is not on PATH; logs and returns its version.
    std::string check_go();
    std::string check_cargo();

    /// Creates the output directories and builds every configured target.
    /// Never throws for a single target's failure.
    MatrixReport build_matrix();

    /// cargo build --release and copy into the binaries directory.
    /// Throws BuildError when the build fails or no release binary is found.
    std::filesystem::path build_rust_host();

    /// go build for the host into the binaries directory. Throws on any failure.
    std::filesystem::path build_go_host();

    /// Fails with BuildError naming the first missing binary; logs sizes otherwise.
    void verify_host_outputs() const;

    /// `relpack build`: banner, matrix, optional host build, summary.
    /// @return process exit code (1 only in strict mode with failed targets)
    int run_cross(const PackagerOptions& options);

    /// `relpack host`: one-click host build of both binaries.
    int run_host();

  private:
    BuildResult build_target(GoToolchain& go, const BuildTarget& target);
    void ensure_output_dirs() const;

    const Settings& settings_;
    CommandRunner& runner_;
    const Logger& log_;
    BuildTarget host_;
};

std::string join_targets(const std::vector<BuildTarget>& targets);

} // namespace relpack
