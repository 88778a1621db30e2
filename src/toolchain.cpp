#include "relpack/toolchain.hpp"

#include "internal/process.hpp"
#include "relpack/exceptions.hpp"

#include <utility>

namespace relpack
{

namespace
{
std::string first_line(const std::string& text)
{
    auto end = text.find_first_of("\r\n");
    std::string line = text.substr(0, end);
    while (!line.empty() && (line.back() == ' ' || line.back() == '\t'))
        line.pop_back();
    return line;
}

process::ProcessOptions options_for(const Command& command)
{
    process::ProcessOptions opts;
    opts.working_directory = command.working_directory.string();
    opts.environment = command.environment;
    return opts;
}
} // namespace

std::string Command::display() const
{
    std::string out;
    for (const auto& [key, value] : environment)
        out += key + "=" + value + " ";
    out += program;
    for (const auto& arg : args)
    {
        out += " ";
        if (arg.find(' ') != std::string::npos)
            out += "\"" + arg + "\"";
        else
            out += arg;
    }
    return out;
}

// =============================================================================
// ProcessRunner
// =============================================================================

std::optional<std::string> ProcessRunner::find_program(const std::string& name) const
{
    return process::find_executable(name);
}

int ProcessRunner::run(const Command& command)
{
    if (logger_)
        logger_->debug("(" + command.working_directory.string() + ") " + command.display());

    try
    {
        process::Process proc;
        proc.spawn(command.program, command.args, options_for(command));
        return proc.wait();
    }
    catch (const process::ProcessError& e)
    {
        throw CommandError(e.what());
    }
}

std::string ProcessRunner::capture(const Command& command)
{
    if (logger_)
        logger_->debug(command.display());

    auto opts = options_for(command);
    opts.redirect_stdout = true;

    std::string output;
    int code = 0;
    try
    {
        process::Process proc;
        proc.spawn(command.program, command.args, opts);
        output = proc.stdout_pipe().read_all();
        code = proc.wait();
    }
    catch (const process::ProcessError& e)
    {
        throw CommandError(e.what());
    }

    if (code != 0)
        throw CommandError("'" + command.display() + "' exited with code " + std::to_string(code));
    return output;
}

void require_tool(const CommandRunner& runner, const std::string& name)
{
    if (!runner.find_program(name))
        throw ToolNotFoundError(name);
}

// =============================================================================
// GoToolchain
// =============================================================================

GoToolchain::GoToolchain(CommandRunner& runner, std::filesystem::path module_dir,
                         std::string package)
    : runner_(runner), module_dir_(std::move(module_dir)), package_(std::move(package))
{
}

void GoToolchain::require() const
{
    require_tool(runner_, "go");
}

std::string GoToolchain::version()
{
    return first_line(runner_.capture(Command{"go", {"version"}, {}, {}}));
}

Command GoToolchain::cross_build_command(const BuildTarget& target,
                                         const std::filesystem::path& output) const
{
    Command cmd = host_build_command(output);
    cmd.environment["CGO_ENABLED"] = "0";
    cmd.environment["GOOS"] = to_string(target.os);
    cmd.environment["GOARCH"] = to_string(target.arch);
    return cmd;
}

Command GoToolchain::host_build_command(const std::filesystem::path& output) const
{
    Command cmd;
    cmd.program = "go";
    cmd.args = {"build", "-o", output.string(), package_};
    cmd.working_directory = module_dir_;
    return cmd;
}

int GoToolchain::build(const Command& command)
{
    return runner_.run(command);
}

// =============================================================================
// CargoToolchain
// =============================================================================

CargoToolchain::CargoToolchain(CommandRunner& runner, std::filesystem::path crate_dir)
    : runner_(runner), crate_dir_(std::move(crate_dir))
{
}

void CargoToolchain::require() const
{
    require_tool(runner_, "cargo");
}

std::string CargoToolchain::version()
{
    if (runner_.find_program("rustc"))
        return first_line(runner_.capture(Command{"rustc", {"--version"}, {}, {}}));
    return first_line(runner_.capture(Command{"cargo", {"--version"}, {}, {}}));
}

Command CargoToolchain::release_build_command() const
{
    Command cmd;
    cmd.program = "cargo";
    cmd.args = {"build", "--release"};
    cmd.working_directory = crate_dir_;
    return cmd;
}

int CargoToolchain::build_release()
{
    return runner_.run(release_build_command());
}

std::optional<std::filesystem::path>
CargoToolchain::locate_release_artifact(const std::vector<std::string>& candidates,
                                        Os host_os) const
{
    const auto release_dir = crate_dir_ / "target" / "release";
    std::error_code ec;
    for (const auto& name : candidates)
    {
        auto path = release_dir / executable_name(name, host_os);
        if (std::filesystem::is_regular_file(path, ec))
            return path;
    }
    return std::nullopt;
}

} // namespace relpack
