#include "relpack/packager.hpp"

#include "test_helpers.hpp"

#include <cassert>
#include <iostream>

namespace fs = std::filesystem;

static bool throws_build_error(ReleasePackager& packager, const std::string& needle)
{
    try
    {
        packager.build_rust_host();
    }
    catch (const BuildError& e)
    {
        return std::string(e.what()).find(needle) != std::string::npos;
    }
    return false;
}

int main()
{
    const BuildTarget host{Os::Linux, Arch::Amd64};

    std::cout << "Test: cargo succeeds but produces no binary...\n";
    {
        ScratchDir root("rust_absent");
        Settings settings;
        settings.project_root = root.path();
        FakeRunner runner;
        CapturedLog log;
        ReleasePackager packager(settings, runner, log.logger, host);

        assert(throws_build_error(packager, "ast_indexer release binary not found"));
        assert(runner.count_runs("cargo") == 1);
        assert(!fs::exists(settings.bin_path() / "ast_indexer"));
        std::cout << "  [PASS]\n";
    }

    std::cout << "Test: cargo failure...\n";
    {
        ScratchDir root("rust_fail");
        Settings settings;
        settings.project_root = root.path();
        FakeRunner runner;
        runner.on_run = [](const Command&) { return 101; };
        CapturedLog log;
        ReleasePackager packager(settings, runner, log.logger, host);

        assert(throws_build_error(packager, "exit code 101"));
        std::cout << "  [PASS]\n";
    }

    std::cout << "Test: fallback candidate is installed under the host name...\n";
    {
        ScratchDir root("rust_fallback");
        Settings settings;
        settings.project_root = root.path();
        write_file(settings.rust_crate_path() / "target" / "release" / "ast_indexer", "fallback");

        FakeRunner runner;
        CapturedLog log;
        ReleasePackager packager(settings, runner, log.logger, host);

        auto dest = packager.build_rust_host();
        assert(dest == settings.bin_path() / "ast_indexer");
        std::ifstream in(dest);
        std::string content;
        in >> content;
        assert(content == "fallback");

        auto perms = fs::status(dest).permissions();
        assert((perms & fs::perms::owner_exec) != fs::perms::none);

        auto& cmd = runner.runs.front();
        assert(cmd.program == "cargo");
        assert(cmd.working_directory == settings.rust_crate_path());
        assert(log.contains("[OK]   Built host ast_indexer"));
        std::cout << "  [PASS]\n";
    }

    std::cout << "Test: windows host names the copy ast_indexer.exe...\n";
    {
        ScratchDir root("rust_windows");
        Settings settings;
        settings.project_root = root.path();
        write_file(settings.rust_crate_path() / "target" / "release" / "ast_indexer_rust.exe",
                   "pe");

        FakeRunner runner;
        CapturedLog log;
        ReleasePackager packager(settings, runner, log.logger, {Os::Windows, Arch::Amd64});

        auto dest = packager.build_rust_host();
        assert(dest.filename() == "ast_indexer.exe");
        assert(fs::exists(dest));
        std::cout << "  [PASS]\n";
    }

    return 0;
}
