#include "relpack/packager.hpp"

#include "relpack/exceptions.hpp"
#include "relpack/util/files.hpp"

namespace relpack
{

namespace fs = std::filesystem;

std::vector<BuildTarget> MatrixReport::failures() const
{
    std::vector<BuildTarget> failed;
    for (const auto& r : results)
    {
        if (!r.ok)
            failed.push_back(r.target);
    }
    return failed;
}

std::string join_targets(const std::vector<BuildTarget>& targets)
{
    std::string out;
    for (const auto& t : targets)
    {
        if (!out.empty())
            out += " ";
        out += to_string(t);
    }
    return out;
}

ReleasePackager::ReleasePackager(const Settings& settings, CommandRunner& runner,
                                 const Logger& logger, BuildTarget host)
    : settings_(settings), runner_(runner), log_(logger), host_(host)
{
}

void ReleasePackager::ensure_output_dirs() const
{
    fs::create_directories(settings_.release_path());
    fs::create_directories(settings_.bin_path());
}

std::string ReleasePackager::check_go()
{
    GoToolchain go(runner_, settings_.go_module_path(), settings_.go_package);
    go.require();
    auto version = go.version();
    log_.ok(version);
    return version;
}

std::string ReleasePackager::check_cargo()
{
    CargoToolchain cargo(runner_, settings_.rust_crate_path());
    cargo.require();
    auto version = cargo.version();
    log_.ok(version);
    return version;
}

BuildResult ReleasePackager::build_target(GoToolchain& go, const BuildTarget& target)
{
    BuildResult result;
    result.target = target;
    result.artifact = settings_.release_path() / artifact_name(settings_.binary_name, target);

    log_.info("  -> " + to_string(target));
    try
    {
        int code = go.build(go.cross_build_command(target, result.artifact));
        std::error_code ec;
        if (code != 0)
            result.error = "go build exited with code " + std::to_string(code);
        else if (!fs::is_regular_file(result.artifact, ec))
            result.error = "go build succeeded but " + result.artifact.string() + " is missing";
        else
            result.ok = true;
    }
    catch (const CommandError& e)
    {
        result.error = e.what();
    }

    if (result.ok)
    {
        result.size_bytes = util::file_size_or_zero(result.artifact);
        log_.ok(result.artifact.filename().string() + " (" + util::human_size(result.size_bytes) +
                ")");
    }
    else
    {
        log_.debug(to_string(target) + ": " + result.error);
        log_.warn("Failed: " + to_string(target));
    }
    return result;
}

MatrixReport ReleasePackager::build_matrix()
{
    ensure_output_dirs();

    GoToolchain go(runner_, settings_.go_module_path(), settings_.go_package);
    MatrixReport report;
    if (settings_.targets.empty())
        log_.warn("No build targets configured");

    for (const auto& target : settings_.targets)
        report.results.push_back(build_target(go, target));
    return report;
}

std::filesystem::path ReleasePackager::build_rust_host()
{
    CargoToolchain cargo(runner_, settings_.rust_crate_path());
    int code = cargo.build_release();
    if (code != 0)
        throw BuildError("cargo build --release failed with exit code " + std::to_string(code));

    auto artifact = cargo.locate_release_artifact(settings_.rust_artifact_candidates, host_.os);
    if (!artifact)
        throw BuildError(settings_.host_artifact_name + " release binary not found");

    fs::create_directories(settings_.bin_path());
    auto dest = settings_.bin_path() / executable_name(settings_.host_artifact_name, host_.os);
    fs::copy_file(*artifact, dest, fs::copy_options::overwrite_existing);
    try
    {
        util::make_executable(dest);
    }
    catch (const fs::filesystem_error& e)
    {
        log_.warn("Could not mark " + dest.string() + " executable: " + e.what());
    }

    log_.ok("Built host " + settings_.host_artifact_name);
    return dest;
}

std::filesystem::path ReleasePackager::build_go_host()
{
    GoToolchain go(runner_, settings_.go_module_path(), settings_.go_package);
    fs::create_directories(settings_.bin_path());
    auto out = settings_.bin_path() / executable_name(settings_.binary_name, host_.os);

    int code = go.build(go.host_build_command(out));
    if (code != 0)
        throw BuildError("go build failed with exit code " + std::to_string(code));

    std::error_code ec;
    if (!fs::is_regular_file(out, ec))
        throw BuildError(settings_.binary_name + " was not produced at " + out.string());

    try
    {
        util::make_executable(out);
    }
    catch (const fs::filesystem_error& e)
    {
        log_.warn("Could not mark " + out.string() + " executable: " + e.what());
    }

    log_.ok("Built " + settings_.binary_name);
    return out;
}

void ReleasePackager::verify_host_outputs() const
{
    for (const auto& name : {settings_.binary_name, settings_.host_artifact_name})
    {
        auto file = settings_.bin_path() / executable_name(name, host_.os);
        std::error_code ec;
        if (!fs::is_regular_file(file, ec))
            throw BuildError(name + " missing");
        log_.ok(name + " (" + util::human_size(util::file_size_or_zero(file)) + ")");
    }
}

int ReleasePackager::run_cross(const PackagerOptions& options)
{
    log_.info("=== relpack cross-platform build ===");
    log_.info("Project root: " + settings_.project_root.string());
    log_.info("Release dir:  " + settings_.release_path().string());
    log_.info("");

    log_.step("Check Go toolchain");
    check_go();

    log_.step("Build " + settings_.binary_name + " for target matrix");
    auto report = build_matrix();
    auto failed = report.failures();
    if (!failed.empty())
        log_.warn("Some targets failed: " + join_targets(failed));

    if (options.with_rust_host)
    {
        log_.step("Build host " + settings_.host_artifact_name);
        check_cargo();
        build_rust_host();
    }
    else
    {
        log_.warn("Skipped host Rust build (use --with-rust-host to enable)");
    }

    log_.info("");
    log_.info("=== Build completed ===");
    log_.info("Release binaries: " + settings_.release_path().string());
    log_.info("Host binaries:    " + settings_.bin_path().string());
    if (!failed.empty())
        log_.info("Failed targets:   " + join_targets(failed));

    if (!failed.empty() && settings_.strict)
    {
        log_.fail(std::to_string(failed.size()) + " target(s) failed and strict mode is enabled");
        return 1;
    }
    return 0;
}

int ReleasePackager::run_host()
{
    log_.info("=== relpack host build ===");
    log_.info("Project root: " + settings_.project_root.string());
    log_.info("Output dir:   " + settings_.bin_path().string());
    log_.info("");

    log_.step("Check toolchain");
    check_go();
    check_cargo();

    log_.step("Build " + settings_.binary_name);
    build_go_host();

    log_.step("Build " + settings_.host_artifact_name);
    build_rust_host();

    log_.info("");
    log_.step("Verify outputs");
    verify_host_outputs();

    log_.info("");
    log_.info("=== Build completed ===");
    log_.info("Output dir: " + settings_.bin_path().string());
    return 0;
}

} // namespace relpack
