#pragma once
#include "relpack/logging.hpp"
#include "relpack/settings.hpp"
#include "relpack/target.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace relpack
{

struct BundleReport
{
    std::filesystem::path root;
    std::size_t files_copied{0};
    std::vector<std::string> missing_inputs;
    std::vector<std::string> missing_binaries;

    bool complete() const
    {
        return missing_binaries.empty();
    }
};

/// Binaries a bundle must contain, relative to its root.
///
/// The configured list when present, otherwise the server and indexer under bin_dir
/// named for `host_os`.
std::vector<std::string> required_bundle_binaries(const Settings& settings, Os host_os);

/// Rebuilds `<project>/<output_dir>/<product_name>` from scratch.
///
/// Missing inputs are logged and skipped; missing required binaries leave the
/// report incomplete. Throws ConfigError before touching the disk when the settings fail
/// validation; filesystem failures propagate as std::filesystem::filesystem_error.
BundleReport assemble_bundle(const Settings& settings, const Logger& log,
                             Os host_os = host_platform().os);

/// `relpack package`. Returns 1 only in strict mode with an incomplete bundle.
int run_package(const Settings& settings, const Logger& log);

} // namespace relpack
