// Cross-platform process management for relpack toolchain invocations

#pragma once

#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace relpack::process
{

// Forward declarations for platform-specific types
struct ProcessHandle;
struct PipeHandle;

/// Exception thrown when process operations fail
class ProcessError : public std::runtime_error
{
  public:
    explicit ProcessError(const std::string& message) : std::runtime_error(message) {}
};

/// Pipe for reading output from a subprocess
class ReadPipe
{
  public:
    ReadPipe();
    ~ReadPipe();

    ReadPipe(const ReadPipe&) = delete;
    ReadPipe& operator=(const ReadPipe&) = delete;
    ReadPipe(ReadPipe&&) noexcept;
    ReadPipe& operator=(ReadPipe&&) noexcept;

    /// Read up to size bytes into buffer
    /// @return Number of bytes read, 0 on EOF
    size_t read(char* buffer, size_t size);

    /// Read until EOF
    std::string read_all();

    /// Close the pipe
    void close();

    /// Check if pipe is open
    bool is_open() const;

  private:
    friend class Process;
    std::unique_ptr<PipeHandle> handle_;
};

/// Options for spawning a subprocess
struct ProcessOptions
{
    std::string working_directory;
    /// Added to (or overriding) the inherited environment
    std::map<std::string, std::string> environment;
    bool inherit_environment = true;
    bool redirect_stdout = false;
    bool redirect_stderr = false;
};

/// Cross-platform subprocess management
class Process
{
  public:
    Process();
    ~Process();

    Process(const Process&) = delete;
    Process& operator=(const Process&) = delete;
    Process(Process&&) noexcept;
    Process& operator=(Process&&) noexcept;

    /// Spawn a new process. Throws ProcessError if it cannot be started.
    void spawn(const std::string& executable, const std::vector<std::string>& args,
               const ProcessOptions& options = {});

    /// Get stdout pipe (only valid if redirect_stdout was true)
    ReadPipe& stdout_pipe();

    /// Get stderr pipe (only valid if redirect_stderr was true)
    ReadPipe& stderr_pipe();

    /// Check if process is still running
    bool is_running() const;

    /// Blocking wait for process termination
    /// @return exit code, or 128 + signal number on POSIX when killed by a signal
    int wait();

    /// Request graceful termination
    void terminate();

    /// Forcefully kill the process
    void kill();

    /// Get process ID
    int pid() const;

  private:
    std::unique_ptr<ProcessHandle> handle_;
    std::unique_ptr<ReadPipe> stdout_;
    std::unique_ptr<ReadPipe> stderr_;
};

/// Find an executable in the system PATH
std::optional<std::string> find_executable(const std::string& name);

} // namespace relpack::process
