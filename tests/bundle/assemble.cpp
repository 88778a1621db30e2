#include "relpack/bundle.hpp"

#include "test_helpers.hpp"

#include <algorithm>
#include <cassert>
#include <iostream>

namespace fs = std::filesystem;

static bool has(const std::vector<std::string>& v, const std::string& s)
{
    return std::find(v.begin(), v.end(), s) != v.end();
}

static void seed_project(const fs::path& root)
{
    write_file(root / "mcp-server-go" / "go.mod", "module mpm");
    write_file(root / "mcp-server-go" / "cmd" / "server" / "main.go", "package main");
    write_file(root / "mcp-server-go" / "bin" / "mpm-go", "server");
    write_file(root / "mcp-server-go" / "server.log", "noise");
    write_file(root / "mcp-server-go" / "debug_dump.txt", "noise");
    write_file(root / "mcp-server-go" / "internal" / "services" / "ast_indexer_rust" / "target" /
                   "release" / "ast_indexer_rust",
               "build output");
    write_file(root / "docs" / "guide.md", "# Guide");
    write_file(root / "docs" / "images" / "mpm_logo.png", "png");
    write_file(root / "README.md", "# readme");
    write_file(root / "user-manual" / "COMPLETE-MANUAL-CONCISE.md", "manual");
    write_file(root / "scripts" / "build-unix.sh", "#!/bin/sh");
}

int main()
{
    std::cout << "Test: required binaries...\n";
    {
        Settings settings;
        auto linux_bins = required_bundle_binaries(settings, Os::Linux);
        assert(linux_bins ==
               (std::vector<std::string>{"mcp-server-go/bin/mpm-go", "mcp-server-go/bin/ast_indexer"}));
        auto win_bins = required_bundle_binaries(settings, Os::Windows);
        assert(win_bins.front() == "mcp-server-go/bin/mpm-go.exe");

        settings.bundle.required_binaries = {"bin/custom"};
        assert(required_bundle_binaries(settings, Os::Linux).size() == 1);
        std::cout << "  [PASS]\n";
    }

    std::cout << "Test: bundle assembly...\n";
    {
        ScratchDir root("bundle");
        seed_project(root.path());
        Settings settings;
        settings.project_root = root.path();

        // Leftovers from a previous run are wiped
        write_file(root.path() / "mpm-release" / "stale.txt", "old");

        CapturedLog log;
        auto report = assemble_bundle(settings, log.logger, Os::Linux);
        const auto out = root.path() / "mpm-release" / "MyProjectManager";
        assert(report.root == out);
        assert(!fs::exists(root.path() / "mpm-release" / "stale.txt"));

        assert(fs::exists(out / "mcp-server-go" / "go.mod"));
        assert(fs::exists(out / "mcp-server-go" / "cmd" / "server" / "main.go"));
        assert(!fs::exists(out / "mcp-server-go" / "server.log"));
        assert(!fs::exists(out / "mcp-server-go" / "debug_dump.txt"));
        assert(!fs::exists(out / "mcp-server-go" / "internal" / "services" / "ast_indexer_rust" /
                           "target"));
        assert(fs::exists(out / "docs" / "guide.md"));
        assert(fs::exists(out / "docs" / "images" / "mpm_logo.png"));
        assert(fs::exists(out / "README.md"));
        assert(fs::exists(out / "user-manual" / "COMPLETE-MANUAL-CONCISE.md"));
        assert(fs::exists(out / "scripts" / "build-unix.sh"));

        assert(has(report.missing_inputs, "README_EN.md"));
        assert(has(report.missing_inputs, "scripts/build-windows.ps1"));
        assert(!has(report.missing_inputs, "README.md"));
        assert(log.contains("[WARN] File not found: README_EN.md"));

        // ast_indexer was never built
        assert(!report.complete());
        assert(report.missing_binaries ==
               (std::vector<std::string>{"mcp-server-go/bin/ast_indexer"}));
        assert(log.contains("[OK]   mcp-server-go/bin/mpm-go (6 B)"));
        std::cout << "  [PASS]\n";
    }

    std::cout << "Test: output_dir outside the project is refused before anything is removed...\n";
    {
        ScratchDir root("bundle_outside_root");
        ScratchDir outside("bundle_outside");
        seed_project(root.path());
        write_file(outside.path() / "precious.txt", "keep");

        Settings settings;
        settings.project_root = root.path();
        settings.bundle.output_dir = outside.path().string();

        CapturedLog log;
        bool threw = false;
        try
        {
            assemble_bundle(settings, log.logger, Os::Linux);
        }
        catch (const ConfigError&)
        {
            threw = true;
        }
        assert(threw);
        assert(fs::exists(outside.path() / "precious.txt"));

        settings.bundle.output_dir = ".";
        threw = false;
        try
        {
            run_package(settings, log.logger);
        }
        catch (const ConfigError&)
        {
            threw = true;
        }
        assert(threw);
        assert(fs::exists(root.path() / "README.md"));
        std::cout << "  [PASS]\n";
    }

    std::cout << "Test: run_package exit codes...\n";
    {
        ScratchDir root("bundle_run");
        seed_project(root.path());
        Settings settings;
        settings.project_root = root.path();
        settings.bundle.required_binaries = {"mcp-server-go/bin/mpm-go", "mcp-server-go/bin/ast_indexer"};

        CapturedLog log;
        assert(run_package(settings, log.logger) == 0);
        assert(log.contains("Some binaries are missing"));

        settings.strict = true;
        assert(run_package(settings, log.logger) == 1);

        write_file(root.path() / "mcp-server-go" / "bin" / "ast_indexer", "indexer");
        log.lines.clear();
        assert(run_package(settings, log.logger) == 0);
        assert(log.contains("=== Bundle completed ==="));
        std::cout << "  [PASS]\n";
    }

    return 0;
}
