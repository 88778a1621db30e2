// Win32 implementation of subprocess management (CreateProcessW, Unicode)

#ifdef _WIN32

#include "process.hpp"

#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <windows.h>

namespace relpack::process
{

// =============================================================================
// Platform-specific handle structures
// =============================================================================

struct PipeHandle
{
    HANDLE handle = INVALID_HANDLE_VALUE;

    ~PipeHandle()
    {
        if (handle != INVALID_HANDLE_VALUE)
            CloseHandle(handle);
    }
};

struct ProcessHandle
{
    HANDLE process_handle = INVALID_HANDLE_VALUE;
    HANDLE thread_handle = INVALID_HANDLE_VALUE;
    DWORD process_id = 0;
    bool running = false;
    int exit_code = -1;

    ~ProcessHandle()
    {
        if (thread_handle != INVALID_HANDLE_VALUE)
            CloseHandle(thread_handle);
        if (process_handle != INVALID_HANDLE_VALUE)
            CloseHandle(process_handle);
    }
};

// =============================================================================
// Job Object: compilers die with relpack
// =============================================================================

static HANDLE get_child_process_job()
{
    static HANDLE job = []() -> HANDLE
    {
        HANDLE h = CreateJobObjectW(nullptr, nullptr);
        if (h)
        {
            JOBOBJECT_EXTENDED_LIMIT_INFORMATION info = {};
            info.BasicLimitInformation.LimitFlags = JOB_OBJECT_LIMIT_KILL_ON_JOB_CLOSE;
            SetInformationJobObject(h, JobObjectExtendedLimitInformation, &info, sizeof(info));
        }
        return h;
    }();
    return job;
}

// =============================================================================
// Unicode helpers
// =============================================================================

static std::wstring utf8_to_wide(const std::string& utf8)
{
    if (utf8.empty())
        return {};
    int size =
        MultiByteToWideChar(CP_UTF8, 0, utf8.c_str(), static_cast<int>(utf8.size()), nullptr, 0);
    if (size <= 0)
        return {};
    std::wstring wide(static_cast<size_t>(size), 0);
    MultiByteToWideChar(CP_UTF8, 0, utf8.c_str(), static_cast<int>(utf8.size()), &wide[0], size);
    return wide;
}

static std::string wide_to_utf8(const std::wstring& wide)
{
    if (wide.empty())
        return {};
    int size = WideCharToMultiByte(CP_UTF8, 0, wide.c_str(), static_cast<int>(wide.size()),
                                   nullptr, 0, nullptr, nullptr);
    if (size <= 0)
        return {};
    std::string utf8(static_cast<size_t>(size), 0);
    WideCharToMultiByte(CP_UTF8, 0, wide.c_str(), static_cast<int>(wide.size()), &utf8[0], size,
                        nullptr, nullptr);
    return utf8;
}

static std::wstring build_wide_env_block(const std::map<std::string, std::string>& env_map)
{
    std::wstring block;
    for (const auto& [key, value] : env_map)
    {
        block += utf8_to_wide(key) + L"=" + utf8_to_wide(value);
        block.push_back(L'\0');
    }
    block.push_back(L'\0');
    return block;
}

// =============================================================================
// Helper functions
// =============================================================================

static std::string get_last_error_message()
{
    DWORD error = GetLastError();
    if (error == 0)
        return "No error";

    LPSTR buffer = nullptr;
    size_t size = FormatMessageA(FORMAT_MESSAGE_ALLOCATE_BUFFER | FORMAT_MESSAGE_FROM_SYSTEM |
                                     FORMAT_MESSAGE_IGNORE_INSERTS,
                                 nullptr, error, MAKELANGID(LANG_NEUTRAL, SUBLANG_DEFAULT),
                                 reinterpret_cast<LPSTR>(&buffer), 0, nullptr);

    std::string message(buffer, size);
    LocalFree(buffer);

    while (!message.empty() && (message.back() == '\n' || message.back() == '\r'))
        message.pop_back();

    return message;
}

static void close_handle(HANDLE& h)
{
    if (h != INVALID_HANDLE_VALUE)
    {
        CloseHandle(h);
        h = INVALID_HANDLE_VALUE;
    }
}

// MSVCRT argv rules: backslashes are literal unless they precede a quote
static std::string quote_argument(const std::string& arg)
{
    if (!arg.empty() && arg.find_first_of(" \t\"") == std::string::npos)
        return arg;

    std::string result = "\"";
    size_t backslashes = 0;
    for (char c : arg)
    {
        if (c == '\\')
        {
            ++backslashes;
            continue;
        }
        if (c == '"')
            backslashes = backslashes * 2 + 1;
        result.append(backslashes, '\\');
        backslashes = 0;
        result += c;
    }
    result.append(backslashes * 2, '\\');
    result += '"';
    return result;
}

static std::string build_command_line(const std::string& executable,
                                      const std::vector<std::string>& args)
{
    std::string cmdline = quote_argument(executable);
    for (const auto& arg : args)
        cmdline += " " + quote_argument(arg);
    return cmdline;
}

// CreateProcessW does not search PATH with PATHEXT, so bare tool names are resolved here
static std::string resolve_executable(const std::string& executable)
{
    if (std::filesystem::path(executable).has_parent_path())
        return executable;
    return find_executable(executable).value_or(executable);
}

static std::vector<std::string> split_list(const std::string& value, char separator)
{
    std::vector<std::string> parts;
    size_t start = 0;
    while (start <= value.size())
    {
        size_t end = value.find(separator, start);
        if (end == std::string::npos)
            end = value.size();
        if (end > start)
            parts.push_back(value.substr(start, end - start));
        start = end + 1;
    }
    return parts;
}

// Child end inheritable, parent end not
static void create_child_pipe(HANDLE& parent_read, HANDLE& child_write, const char* stream)
{
    SECURITY_ATTRIBUTES sa{};
    sa.nLength = sizeof(sa);
    sa.bInheritHandle = TRUE;
    if (!CreatePipe(&parent_read, &child_write, &sa, 0))
        throw ProcessError(std::string("Failed to create ") + stream +
                           " pipe: " + get_last_error_message());
    SetHandleInformation(parent_read, HANDLE_FLAG_INHERIT, 0);
}

static std::map<std::string, std::string> current_environment()
{
    std::map<std::string, std::string> env;
    LPWCH env_strings = GetEnvironmentStringsW();
    if (!env_strings)
        return env;

    for (LPWCH p = env_strings; *p; p += wcslen(p) + 1)
    {
        std::wstring entry(p);
        size_t eq = entry.find(L'=');
        // Entries like "=C:=C:\\" describe per-drive cwd and start with '='
        if (eq != std::wstring::npos && eq > 0)
            env[wide_to_utf8(entry.substr(0, eq))] = wide_to_utf8(entry.substr(eq + 1));
    }
    FreeEnvironmentStringsW(env_strings);
    return env;
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

    DWORD bytes_read = 0;
    BOOL success =
        ReadFile(handle_->handle, buffer, static_cast<DWORD>(size), &bytes_read, nullptr);

    if (!success)
    {
        DWORD error = GetLastError();
        if (error == ERROR_BROKEN_PIPE || error == ERROR_NO_DATA)
            return 0;
        throw ProcessError("Read failed: " + get_last_error_message());
    }

    return bytes_read;
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
    if (handle_ && handle_->handle != INVALID_HANDLE_VALUE)
    {
        CloseHandle(handle_->handle);
        handle_->handle = INVALID_HANDLE_VALUE;
    }
}

bool ReadPipe::is_open() const
{
    return handle_ && handle_->handle != INVALID_HANDLE_VALUE;
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
        kill();
        wait();
    }
}

Process::Process(Process&&) noexcept = default;
Process& Process::operator=(Process&&) noexcept = default;

void Process::spawn(const std::string& executable, const std::vector<std::string>& args,
                    const ProcessOptions& options)
{
    HANDLE stdout_read = INVALID_HANDLE_VALUE;
    HANDLE stdout_write = INVALID_HANDLE_VALUE;
    HANDLE stderr_read = INVALID_HANDLE_VALUE;
    HANDLE stderr_write = INVALID_HANDLE_VALUE;

    if (options.redirect_stdout)
        create_child_pipe(stdout_read, stdout_write, "stdout");

    if (options.redirect_stderr)
    {
        try
        {
            create_child_pipe(stderr_read, stderr_write, "stderr");
        }
        catch (const ProcessError&)
        {
            close_handle(stdout_read);
            close_handle(stdout_write);
            throw;
        }
    }

    std::string cmdline = build_command_line(resolve_executable(executable), args);

    std::wstring env_block;
    bool provide_env_block = false;
    if (!options.environment.empty() || !options.inherit_environment)
    {
        std::map<std::string, std::string> env;
        if (options.inherit_environment)
            env = current_environment();
        for (const auto& [key, value] : options.environment)
            env[key] = value;

        env_block = build_wide_env_block(env);
        provide_env_block = true;
    }

    STARTUPINFOW si;
    ZeroMemory(&si, sizeof(si));
    si.cb = sizeof(si);
    si.dwFlags = STARTF_USESTDHANDLES;
    si.hStdInput = GetStdHandle(STD_INPUT_HANDLE);
    si.hStdOutput =
        stdout_write != INVALID_HANDLE_VALUE ? stdout_write : GetStdHandle(STD_OUTPUT_HANDLE);
    si.hStdError =
        stderr_write != INVALID_HANDLE_VALUE ? stderr_write : GetStdHandle(STD_ERROR_HANDLE);

    std::wstring cmdline_wide = utf8_to_wide(cmdline);
    std::wstring workdir_wide = options.working_directory.empty()
                                    ? std::wstring()
                                    : utf8_to_wide(options.working_directory);

    PROCESS_INFORMATION pi;
    ZeroMemory(&pi, sizeof(pi));

    BOOL success = CreateProcessW(nullptr, &cmdline_wide[0], nullptr, nullptr, TRUE,
                                  CREATE_UNICODE_ENVIRONMENT,
                                  provide_env_block ? env_block.data() : nullptr,
                                  workdir_wide.empty() ? nullptr : workdir_wide.c_str(), &si, &pi);

    // Close child's ends of pipes
    close_handle(stdout_write);
    close_handle(stderr_write);

    if (!success)
    {
        std::string message = get_last_error_message();
        close_handle(stdout_read);
        close_handle(stderr_read);
        throw ProcessError("Failed to execute '" + executable + "': " + message);
    }

    handle_->process_handle = pi.hProcess;
    handle_->thread_handle = pi.hThread;
    handle_->process_id = pi.dwProcessId;
    handle_->running = true;

    HANDLE job = get_child_process_job();
    if (job)
        AssignProcessToJobObject(job, pi.hProcess);

    stdout_->handle_->handle = stdout_read;
    stderr_->handle_->handle = stderr_read;
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
    if (!handle_ || handle_->process_handle == INVALID_HANDLE_VALUE || !handle_->running)
        return false;

    DWORD exit_code;
    if (GetExitCodeProcess(handle_->process_handle, &exit_code))
        return exit_code == STILL_ACTIVE;
    return false;
}

int Process::wait()
{
    if (!handle_ || handle_->process_handle == INVALID_HANDLE_VALUE)
        return handle_ ? handle_->exit_code : -1;

    if (!handle_->running)
        return handle_->exit_code;

    if (WaitForSingleObject(handle_->process_handle, INFINITE) == WAIT_FAILED)
        throw ProcessError("WaitForSingleObject failed: " + get_last_error_message());

    DWORD exit_code = 0;
    GetExitCodeProcess(handle_->process_handle, &exit_code);
    handle_->running = false;
    handle_->exit_code = static_cast<int>(exit_code);
    return handle_->exit_code;
}

void Process::terminate()
{
    if (handle_ && handle_->process_handle != INVALID_HANDLE_VALUE && handle_->running)
    {
        DWORD result = WaitForSingleObject(handle_->process_handle, 1000);
        if (result != WAIT_OBJECT_0)
            TerminateProcess(handle_->process_handle, 1);
    }
}

void Process::kill()
{
    if (handle_ && handle_->process_handle != INVALID_HANDLE_VALUE && handle_->running)
        TerminateProcess(handle_->process_handle, 1);
}

int Process::pid() const
{
    return handle_ ? static_cast<int>(handle_->process_id) : 0;
}

// =============================================================================
// Utility functions
// =============================================================================

std::optional<std::string> find_executable(const std::string& name)
{
    namespace fs = std::filesystem;
    std::error_code ec;

    if (fs::path(name).is_absolute())
    {
        if (fs::is_regular_file(name, ec))
            return name;
        return std::nullopt;
    }

    const char* path_env = std::getenv("PATH");
    if (!path_env)
        return std::nullopt;

    const char* pathext_env = std::getenv("PATHEXT");
    const auto extensions = split_list(pathext_env ? pathext_env : ".COM;.EXE;.BAT;.CMD", ';');
    const bool has_extension = fs::path(name).has_extension();

    for (const auto& dir : split_list(path_env, ';'))
    {
        const fs::path base = fs::path(dir) / name;
        if (has_extension && fs::is_regular_file(base, ec))
            return base.string();
        for (const auto& ext : extensions)
        {
            fs::path candidate = base;
            candidate += ext;
            if (fs::is_regular_file(candidate, ec))
                return candidate.string();
        }
    }
    return std::nullopt;
}

} // namespace relpack::process

#endif // _WIN32
