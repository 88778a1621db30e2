#pragma once
#include "relpack/target.hpp"
#include "relpack/types.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace relpack
{

/// Contents of the distributable product folder assembled by `relpack package`.
struct BundleSpec
{
    std::string output_dir{"mpm-release"};
    std::string product_name{"MyProjectManager"};
    std::vector<std::string> directories{"mcp-server-go", "docs"};
    std::vector<std::string> files{
        "README.md",     "README_EN.md",     "install.ps1",
        "QUICKSTART.md", "QUICKSTART_EN.md", "docs/images/mpm_logo.png",
        "user-manual/COMPLETE-MANUAL-CONCISE.md",
    };
    std::vector<std::string> scripts{
        "scripts/build-windows.ps1",
        "scripts/build-unix.sh",
        "scripts/build-cross-platform.sh",
    };
    std::vector<std::string> ignore_patterns{
        "__pycache__", ".mcp-data", ".git",    "*.pyc",   ".vscode", ".idea",
        "target",      "node_modules", "debug_*", "check_*", "*.pdb",   "*.log",
    };
    /// Paths relative to the bundle root. Empty means the host binaries under bin_dir.
    std::vector<std::string> required_binaries;

    static BundleSpec from_json(const Json& j);
};

struct Settings
{
    std::string log_level{"INFO"};
    /// Partial matrix failures and incomplete bundles exit non-zero.
    bool strict{false};

    std::filesystem::path project_root{"."};

    std::string binary_name{"mpm-go"};
    std::string go_module_dir{"mcp-server-go"};
    std::string go_package{"./cmd/server"};
    std::string release_dir{"release_cross_platform"};
    std::string bin_dir{"mcp-server-go/bin"};

    std::string rust_crate_dir{"mcp-server-go/internal/services/ast_indexer_rust"};
    std::vector<std::string> rust_artifact_candidates{"ast_indexer_rust", "ast_indexer"};
    std::string host_artifact_name{"ast_indexer"};

    std::vector<BuildTarget> targets{default_matrix()};

    std::string release_base_url{
        "https://github.com/halflifezyf2680/mpm-vibe-coding/releases/latest/download"};
    std::string asset_prefix{"mpm"};
    std::string install_dir{"mpm-bin"};
    std::string fetched_binary{"mpm-go"};

    BundleSpec bundle;

    std::filesystem::path release_path() const
    {
        return project_root / release_dir;
    }
    std::filesystem::path bin_path() const
    {
        return project_root / bin_dir;
    }
    std::filesystem::path go_module_path() const
    {
        return project_root / go_module_dir;
    }
    std::filesystem::path rust_crate_path() const
    {
        return project_root / rust_crate_dir;
    }

    /// Throws ConfigError when a value cannot drive a build.
    void validate() const;

    /// Overlay environment variables onto this instance.
    void apply_env();

    static Settings from_env();
    static Settings from_json(const Json& j);
    static Settings from_file(const std::filesystem::path& path);

    /// Defaults, then the config file, then the environment.
    ///
    /// The project root comes from RELPACK_PROJECT_ROOT (default: current directory),
    /// the config file from RELPACK_CONFIG (default: `<root>/relpack.json` when present).
    static Settings resolve();
};

} // namespace relpack
