#pragma once
#include "relpack/logging.hpp"
#include "relpack/target.hpp"

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace relpack
{

/// One external program invocation.
struct Command
{
    std::string program;
    std::vector<std::string> args;
    /// Set on top of the inherited environment
    std::map<std::string, std::string> environment;
    std::filesystem::path working_directory;

    /// Shell-like rendering for logs, e.g. "GOARCH=arm64 GOOS=linux go build -o out ./cmd/server"
    std::string display() const;
};

/// Seam between relpack and the outside world's toolchains.
class CommandRunner
{
  public:
    virtual ~CommandRunner() = default;

    /// Resolve a program through PATH.
    virtual std::optional<std::string> find_program(const std::string& name) const = 0;

    /// Run with inherited stdio and return the exit code.
    /// Throws CommandError when the program cannot be started.
    virtual int run(const Command& command) = 0;

    /// Run and return stdout. Throws CommandError on spawn failure or non-zero exit.
    virtual std::string capture(const Command& command) = 0;
};

/// CommandRunner backed by real subprocesses.
class ProcessRunner final : public CommandRunner
{
  public:
    ProcessRunner() = default;
    explicit ProcessRunner(const Logger* logger) : logger_(logger) {}

    std::optional<std::string> find_program(const std::string& name) const override;
    int run(const Command& command) override;
    std::string capture(const Command& command) override;

  private:
    const Logger* logger_ = nullptr;
};

/// Throws ToolNotFoundError if `name` is not on PATH.
void require_tool(const CommandRunner& runner, const std::string& name);

/// The Go compiler, driven through GOOS/GOARCH for cross builds.
class GoToolchain
{
  public:
    GoToolchain(CommandRunner& runner, std::filesystem::path module_dir, std::string package);

    void require() const;

    /// First line of `go version`.
    std::string version();

    /// CGO_ENABLED=0 GOOS=<os> GOARCH=<arch> go build -o <output> <package>
    Command cross_build_command(const BuildTarget& target,
                                const std::filesystem::path& output) const;

    /// go build -o <output> <package>, no target selection
    Command host_build_command(const std::filesystem::path& output) const;

    int build(const Command& command);

  private:
    CommandRunner& runner_;
    std::filesystem::path module_dir_;
    std::string package_;
};

/// cargo, used only for the host-native release build.
class CargoToolchain
{
  public:
    CargoToolchain(CommandRunner& runner, std::filesystem::path crate_dir);

    void require() const;

    /// `rustc --version`, falling back to `cargo --version`.
    std::string version();

    /// cargo build --release, run inside the crate
    Command release_build_command() const;

    int build_release();

    /// First of `<crate>/target/release/<candidate>[.exe]` that exists.
    std::optional<std::filesystem::path>
    locate_release_artifact(const std::vector<std::string>& candidates, Os host_os) const;

  private:
    CommandRunner& runner_;
    std::filesystem::path crate_dir_;
};

} // namespace relpack
