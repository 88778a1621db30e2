#include "relpack/bundle.hpp"
#include "relpack/exceptions.hpp"
#include "relpack/fetch.hpp"
#include "relpack/logging.hpp"
#include "relpack/packager.hpp"
#include "relpack/settings.hpp"
#include "relpack/toolchain.hpp"
#include "relpack/version.hpp"

#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace
{

static int usage(int exit_code = 1)
{
    std::cout << "relpack " << relpack::VERSION_MAJOR << "." << relpack::VERSION_MINOR << "."
              << relpack::VERSION_PATCH << "\n";
    std::cout << "Usage:\n";
    std::cout << "  relpack [build] [--with-rust-host]  Cross-compile the Go server for every target\n";
    std::cout << "  relpack host                        Build mpm-go and ast_indexer for this machine\n";
    std::cout << "  relpack fetch [<dir>]               Download the pre-built release for this host\n";
    std::cout << "  relpack package                     Assemble the distributable bundle\n";
    std::cout << "  relpack --help | --version\n";
    std::cout << "\n";
    std::cout << "Environment:\n";
    std::cout << "  RELPACK_PROJECT_ROOT   Project root (default: current directory)\n";
    std::cout << "  RELPACK_CONFIG         Config file (default: <root>/relpack.json if present)\n";
    std::cout << "  RELPACK_LOG_LEVEL      DEBUG, INFO, WARN or ERROR\n";
    std::cout << "  RELPACK_STRICT         1 to fail when any matrix target fails\n";
    return exit_code;
}

static bool consume_flag(std::vector<std::string>& args, const std::string& flag)
{
    for (size_t i = 0; i < args.size(); ++i)
    {
        if (args[i] == flag)
        {
            args.erase(args.begin() + static_cast<long long>(i));
            return true;
        }
    }
    return false;
}

static int unknown_argument(const relpack::Logger& log, const std::string& arg)
{
    log.info("Unknown argument: " + arg);
    return 1;
}

static int run_build(std::vector<std::string> args, const relpack::Settings& settings,
                     const relpack::Logger& log)
{
    relpack::PackagerOptions options;
    options.with_rust_host = consume_flag(args, "--with-rust-host");
    if (!args.empty())
        return unknown_argument(log, args.front());

    relpack::ProcessRunner runner(&log);
    relpack::ReleasePackager packager(settings, runner, log);
    return packager.run_cross(options);
}

static int run_host(const std::vector<std::string>& args, const relpack::Settings& settings,
                    const relpack::Logger& log)
{
    if (!args.empty())
        return unknown_argument(log, args.front());

    relpack::ProcessRunner runner(&log);
    relpack::ReleasePackager packager(settings, runner, log);
    return packager.run_host();
}

static int run_fetch(const std::vector<std::string>& args, const relpack::Settings& settings,
                     const relpack::Logger& log)
{
    if (args.size() > 1 || (!args.empty() && args.front().rfind("-", 0) == 0))
        return unknown_argument(log, args.back());

    std::filesystem::path work_dir =
        args.empty() ? std::filesystem::current_path() : std::filesystem::path(args.front());

    relpack::ProcessRunner runner(&log);
    relpack::fetch::CurlDownloader downloader;
    relpack::fetch::TarExtractor extractor(runner);
    relpack::fetch::ArtifactFetcher fetcher(settings, downloader, extractor, log);
    fetcher.fetch(work_dir);
    return 0;
}

static int run_package(const std::vector<std::string>& args, const relpack::Settings& settings,
                       const relpack::Logger& log)
{
    if (!args.empty())
        return unknown_argument(log, args.front());
    return relpack::run_package(settings, log);
}

} // namespace

int main(int argc, char** argv)
{
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i)
        args.emplace_back(argv[i]);

    if (!args.empty() && (args.front() == "--help" || args.front() == "-h"))
        return usage(0);
    if (!args.empty() && args.front() == "--version")
    {
        std::cout << "relpack " << relpack::VERSION_STRING << "\n";
        return 0;
    }

    std::string cmd = "build";
    if (!args.empty() && args.front().rfind("-", 0) != 0)
    {
        cmd = args.front();
        args.erase(args.begin());
    }

    relpack::Logger log;
    try
    {
        auto settings = relpack::Settings::resolve();
        log.set_level(relpack::log_level_from_string(settings.log_level));

        if (cmd == "build")
            return run_build(args, settings, log);
        if (cmd == "host")
            return run_host(args, settings, log);
        if (cmd == "fetch")
            return run_fetch(args, settings, log);
        if (cmd == "package")
            return run_package(args, settings, log);

        log.info("Unknown command: " + cmd);
        return usage(1);
    }
    catch (const relpack::Error& e)
    {
        log.fail(e.what());
        return 1;
    }
    catch (const std::filesystem::filesystem_error& e)
    {
        log.fail(e.what());
        return 1;
    }
}
