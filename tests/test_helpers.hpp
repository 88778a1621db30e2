/// @file tests/test_helpers.hpp
/// @brief Fakes and scratch-directory helpers shared by relpack tests
#pragma once

#include "relpack/exceptions.hpp"
#include "relpack/logging.hpp"
#include "relpack/toolchain.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <optional>
#include <set>
#include <string>
#include <vector>

using namespace relpack;

// Temporary directory removed on destruction
class ScratchDir
{
  public:
    explicit ScratchDir(const std::string& tag)
    {
        static std::atomic<int> counter{0};
        auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        path_ = std::filesystem::temp_directory_path() /
                ("relpack_" + tag + "_" + std::to_string(stamp) + "_" +
                 std::to_string(counter++));
        std::filesystem::create_directories(path_);
    }
    ~ScratchDir()
    {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    ScratchDir(const ScratchDir&) = delete;
    ScratchDir& operator=(const ScratchDir&) = delete;

    const std::filesystem::path& path() const
    {
        return path_;
    }

  private:
    std::filesystem::path path_;
};

inline void write_file(const std::filesystem::path& path, const std::string& content)
{
    std::filesystem::create_directories(path.parent_path());
    std::ofstream f(path, std::ios::binary);
    f << content;
}

// Output argument of `go build -o <out> ...`, empty if absent
inline std::string output_arg(const Command& cmd)
{
    for (size_t i = 0; i + 1 < cmd.args.size(); ++i)
    {
        if (cmd.args[i] == "-o")
            return cmd.args[i + 1];
    }
    return {};
}

// CommandRunner that records invocations instead of spawning processes
class FakeRunner : public CommandRunner
{
  public:
    std::set<std::string> programs{"go", "cargo", "rustc", "tar"};
    std::function<int(const Command&)> on_run;
    std::vector<Command> runs;
    std::vector<Command> captures;

    std::optional<std::string> find_program(const std::string& name) const override
    {
        if (programs.count(name))
            return "/fake/bin/" + name;
        return std::nullopt;
    }

    int run(const Command& command) override
    {
        runs.push_back(command);
        if (!programs.count(command.program))
            throw CommandError("Failed to execute '" + command.program + "'");
        return on_run ? on_run(command) : 0;
    }

    std::string capture(const Command& command) override
    {
        captures.push_back(command);
        if (!programs.count(command.program))
            throw CommandError("Failed to execute '" + command.program + "'");
        if (command.program == "go")
            return "go version go1.22.1 linux/amd64\n";
        if (command.program == "rustc")
            return "rustc 1.77.0 (aedd173a2 2024-03-17)\n";
        return command.program + " 1.0\n";
    }

    size_t count_runs(const std::string& program) const
    {
        size_t n = 0;
        for (const auto& c : runs)
            if (c.program == program)
                ++n;
        return n;
    }

    size_t count_any(const std::string& program) const
    {
        size_t n = count_runs(program);
        for (const auto& c : captures)
            if (c.program == program)
                ++n;
        return n;
    }
};

// Logger whose lines are kept for inspection
struct CapturedLog
{
    std::vector<std::string> lines;
    Logger logger{[this](LogLevel, const std::string& line) { lines.push_back(line); },
                  LogLevel::Debug};

    bool contains(const std::string& needle) const
    {
        for (const auto& l : lines)
            if (l.find(needle) != std::string::npos)
                return true;
        return false;
    }
};
