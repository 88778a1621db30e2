// POSIX implementation of subprocess management

#ifndef _WIN32

#include "process.hpp"

#include <cstdlib>
#include <cstring>
#include <errno.h>
#include <fcntl.h>
#include <filesystem>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

extern "C" char** environ;

namespace relpack::process
{

// =============================================================================
// Platform-specific handle structures
// =============================================================================

struct PipeHandle
{
    int fd = -1;

    ~PipeHandle()
    {
        if (fd >= 0)
            ::close(fd);
    }
};

struct ProcessHandle
{
    pid_t pid = 0;
    bool running = false;
    int exit_code = -1;
};

// =============================================================================
// Helper functions
// =============================================================================

static std::string get_errno_message()
{
    return std::strerror(errno);
}

static void close_pipe(int (&fds)[2])
{
    for (int& fd : fds)
    {
        if (fd >= 0)
        {
            ::close(fd);
            fd = -1;
        }
    }
}

static int decode_status(int status)
{
    if (WIFEXITED(status))
        return WEXITSTATUS(status);
    if (WIFSIGNALED(status))
        return 128 + WTERMSIG(status);
    return -1;
}

[[noreturn]] static void report_child_failure(int error_fd)
{
    int err = errno;
    (void)::write(error_fd, &err, sizeof(err));
    _exit(127);
}

// =============================================================================
// ReadPipe implementation
// =============================================================================

ReadPipe::ReadPipe() : handle_(std::make_unique<PipeHandle>()) {}

ReadPipe::~ReadPipe()
{
    close();
}

ReadPipe::ReadPipe(ReadPipe&&) noexcept = default;
ReadPipe& ReadPipe::operator=(ReadPipe&&) noexcept = default;

size_t ReadPipe::read(char* buffer, size_t size)
{
    if (!is_open())
        throw ProcessError("Pipe is not open");

    while (true)
    {
        ssize_t bytes_read = ::read(handle_->fd, buffer, size);
        if (bytes_read >= 0)
            return static_cast<size_t>(bytes_read);
        if (errno == EINTR)
            continue;
        throw ProcessError("Read failed: " + get_errno_message());
    }
}

std::string ReadPipe::read_all()
{
    std::string out;
    char buffer[4096];
    while (true)
    {
        size_t n = read(buffer, sizeof(buffer));
        if (n == 0)
            break;
        out.append(buffer, n);
    }
    return out;
}

void ReadPipe::close()
{
    if (handle_ && handle_->fd >= 0)
    {
        ::close(handle_->fd);
        handle_->fd = -1;
    }
}

bool ReadPipe::is_open() const
{
    return handle_ && handle_->fd >= 0;
}

// =============================================================================
// Process implementation
// =============================================================================

Process::Process()
    : handle_(std::make_unique<ProcessHandle>()), stdout_(std::make_unique<ReadPipe>()),
      stderr_(std::make_unique<ReadPipe>())
{
}

Process::~Process()
{
    if (stdout_)
        stdout_->close();
    if (stderr_)
        stderr_->close();

    if (is_running())
    {
        terminate();
        wait();
    }
}

Process::Process(Process&&) noexcept = default;
Process& Process::operator=(Process&&) noexcept = default;

void Process::spawn(const std::string& executable, const std::vector<std::string>& args,
                    const ProcessOptions& options)
{
    int stdout_pipe[2] = {-1, -1};
    if (options.redirect_stdout && pipe(stdout_pipe) != 0)
        throw ProcessError("Failed to create stdout pipe: " + get_errno_message());

    int stderr_pipe[2] = {-1, -1};
    if (options.redirect_stderr && pipe(stderr_pipe) != 0)
    {
        close_pipe(stdout_pipe);
        throw ProcessError("Failed to create stderr pipe: " + get_errno_message());
    }

    // Error pipe for detecting exec failures
    int error_pipe[2] = {-1, -1};
    if (pipe(error_pipe) != 0)
    {
        close_pipe(stdout_pipe);
        close_pipe(stderr_pipe);
        throw ProcessError("Failed to create error pipe: " + get_errno_message());
    }
    fcntl(error_pipe[1], F_SETFD, FD_CLOEXEC);

    pid_t pid = fork();
    if (pid < 0)
    {
        close_pipe(stdout_pipe);
        close_pipe(stderr_pipe);
        close_pipe(error_pipe);
        throw ProcessError("Failed to fork process: " + get_errno_message());
    }

    if (pid == 0)
    {
        // Child process
        ::close(error_pipe[0]);

        if (options.redirect_stdout)
        {
            ::close(stdout_pipe[0]);
            if (dup2(stdout_pipe[1], STDOUT_FILENO) < 0)
                report_child_failure(error_pipe[1]);
            ::close(stdout_pipe[1]);
        }

        if (options.redirect_stderr)
        {
            ::close(stderr_pipe[0]);
            if (dup2(stderr_pipe[1], STDERR_FILENO) < 0)
                report_child_failure(error_pipe[1]);
            ::close(stderr_pipe[1]);
        }

        if (!options.working_directory.empty() && chdir(options.working_directory.c_str()) != 0)
            report_child_failure(error_pipe[1]);

        if (!options.inherit_environment)
        {
#if defined(__linux__) && defined(_GNU_SOURCE)
            clearenv();
#else
            if (environ)
                environ[0] = nullptr;
#endif
        }

        for (const auto& [key, value] : options.environment)
            setenv(key.c_str(), value.c_str(), 1);

        std::vector<char*> argv;
        argv.push_back(const_cast<char*>(executable.c_str()));
        for (const auto& arg : args)
            argv.push_back(const_cast<char*>(arg.c_str()));
        argv.push_back(nullptr);

        execvp(executable.c_str(), argv.data());
        report_child_failure(error_pipe[1]);
    }

    // Parent process
    ::close(error_pipe[1]);
    int child_errno = 0;
    ssize_t error_bytes = ::read(error_pipe[0], &child_errno, sizeof(child_errno));
    ::close(error_pipe[0]);

    if (error_bytes > 0)
    {
        waitpid(pid, nullptr, 0);
        close_pipe(stdout_pipe);
        close_pipe(stderr_pipe);
        throw ProcessError("Failed to execute '" + executable + "': " + std::strerror(child_errno));
    }

    if (options.redirect_stdout)
    {
        ::close(stdout_pipe[1]);
        stdout_->handle_->fd = stdout_pipe[0];
    }

    if (options.redirect_stderr)
    {
        ::close(stderr_pipe[1]);
        stderr_->handle_->fd = stderr_pipe[0];
    }

    handle_->pid = pid;
    handle_->running = true;
}

ReadPipe& Process::stdout_pipe()
{
    if (!stdout_ || !stdout_->is_open())
        throw ProcessError("stdout pipe not available");
    return *stdout_;
}

ReadPipe& Process::stderr_pipe()
{
    if (!stderr_ || !stderr_->is_open())
        throw ProcessError("stderr pipe not available");
    return *stderr_;
}

bool Process::is_running() const
{
    if (!handle_ || handle_->pid == 0 || !handle_->running)
        return false;

    if (::kill(handle_->pid, 0) == 0)
        return true;

    return errno != ESRCH;
}

int Process::wait()
{
    if (!handle_ || handle_->pid == 0)
        return handle_ ? handle_->exit_code : -1;

    if (!handle_->running)
        return handle_->exit_code;

    int status = 0;
    pid_t result;
    do
    {
        result = waitpid(handle_->pid, &status, 0);
    } while (result < 0 && errno == EINTR);

    if (result == handle_->pid)
    {
        handle_->exit_code = decode_status(status);
        handle_->running = false;
        return handle_->exit_code;
    }

    throw ProcessError("waitpid failed: " + get_errno_message());
}

void Process::terminate()
{
    if (handle_ && handle_->pid > 0 && handle_->running)
        ::kill(handle_->pid, SIGTERM);
}

void Process::kill()
{
    if (handle_ && handle_->pid > 0 && handle_->running)
        ::kill(handle_->pid, SIGKILL);
}

int Process::pid() const
{
    return handle_ ? static_cast<int>(handle_->pid) : 0;
}

// =============================================================================
// Utility functions
// =============================================================================

static bool is_executable_file(const std::filesystem::path& p)
{
    std::error_code ec;
    return std::filesystem::is_regular_file(p, ec) && access(p.c_str(), X_OK) == 0;
}

std::optional<std::string> find_executable(const std::string& name)
{
    namespace fs = std::filesystem;

    if (name.empty())
        return std::nullopt;

    if (name.find('/') != std::string::npos)
    {
        if (is_executable_file(name))
            return fs::absolute(name).string();
        return std::nullopt;
    }

    const char* path_env = std::getenv("PATH");
    if (!path_env)
        return std::nullopt;

    std::string path_str(path_env);
    size_t start = 0;
    while (start <= path_str.size())
    {
        size_t end = path_str.find(':', start);
        if (end == std::string::npos)
            end = path_str.size();

        std::string dir = path_str.substr(start, end - start);
        if (!dir.empty())
        {
            fs::path candidate = fs::path(dir) / name;
            if (is_executable_file(candidate))
                return candidate.string();
        }
        start = end + 1;
    }

    return std::nullopt;
}

} // namespace relpack::process

#endif // !_WIN32
