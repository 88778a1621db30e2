#include "relpack/bundle.hpp"

#include "relpack/util/files.hpp"

namespace relpack
{

namespace fs = std::filesystem;

std::vector<std::string> required_bundle_binaries(const Settings& settings, Os host_os)
{
    if (!settings.bundle.required_binaries.empty())
        return settings.bundle.required_binaries;

    const fs::path bin = settings.bin_dir;
    return {
        (bin / executable_name(settings.binary_name, host_os)).generic_string(),
        (bin / executable_name(settings.host_artifact_name, host_os)).generic_string(),
    };
}

BundleReport assemble_bundle(const Settings& settings, const Logger& log, Os host_os)
{
    settings.validate();

    const auto& bundle = settings.bundle;
    const fs::path source_root = settings.project_root;
    const fs::path output_root = source_root / bundle.output_dir;

    BundleReport report;
    report.root = output_root / bundle.product_name;

    if (fs::exists(output_root))
        fs::remove_all(output_root);
    fs::create_directories(report.root);

    log.step("Assemble " + bundle.product_name);
    log.info("Source: " + source_root.string());
    log.info("Target: " + report.root.string());

    util::NameFilter ignore(bundle.ignore_patterns);
    std::error_code ec;

    for (const auto& dir : bundle.directories)
    {
        auto src = source_root / dir;
        if (!fs::is_directory(src, ec))
        {
            log.warn("Directory not found: " + dir);
            report.missing_inputs.push_back(dir);
            continue;
        }
        auto copied = util::copy_tree(src, report.root / dir, ignore);
        report.files_copied += copied;
        log.ok("Packed " + dir + " (" + std::to_string(copied) + " files)");
    }

    for (const auto& file : bundle.files)
    {
        auto src = source_root / file;
        if (!fs::is_regular_file(src, ec))
        {
            log.warn("File not found: " + file);
            report.missing_inputs.push_back(file);
            continue;
        }
        auto dest = report.root / file;
        fs::create_directories(dest.parent_path());
        fs::copy_file(src, dest, fs::copy_options::overwrite_existing);
        ++report.files_copied;
        log.ok("Packed " + file);
    }

    const auto scripts_dir = report.root / "scripts";
    fs::create_directories(scripts_dir);
    for (const auto& script : bundle.scripts)
    {
        auto src = source_root / script;
        if (!fs::is_regular_file(src, ec))
        {
            log.warn("Build script not found: " + script);
            report.missing_inputs.push_back(script);
            continue;
        }
        fs::copy_file(src, scripts_dir / src.filename(), fs::copy_options::overwrite_existing);
        ++report.files_copied;
        log.ok("Packed script " + src.filename().string());
    }

    log.step("Verify bundled binaries");
    for (const auto& rel : required_bundle_binaries(settings, host_os))
    {
        auto path = report.root / rel;
        if (!fs::is_regular_file(path, ec))
        {
            log.warn("Missing: " + rel);
            report.missing_binaries.push_back(rel);
            continue;
        }
        log.ok(rel + " (" + util::human_size(util::file_size_or_zero(path)) + ")");
    }

    return report;
}

int run_package(const Settings& settings, const Logger& log)
{
    auto report = assemble_bundle(settings, log);

    log.info("");
    if (!report.complete())
    {
        log.warn("Some binaries are missing from the bundle; build the project first");
        return settings.strict ? 1 : 0;
    }

    log.info("=== Bundle completed ===");
    log.info("Bundle: " + report.root.string());
    return 0;
}

} // namespace relpack
