#ifdef _WIN32

#include "process.hpp"

#include <cstdlib>
#include <filesystem>
#include <sstream>
#include <stdexcept>
#include <windows.h>

namespace bridge
{
namespace subprocess
{

// Platform-specific handle structures
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

namespace
{

// Job object with KILL_ON_JOB_CLOSE: the bridge dies with the desktop app,
// even when the app exits abnormally.
HANDLE child_process_job()
{
    static HANDLE job = []() -> HANDLE
    {
        HANDLE h = CreateJobObjectA(nullptr, nullptr);
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

std::string last_error_message()
{
    DWORD error = GetLastError();
    if (error == 0)
        return "No error";

    LPSTR buffer = nullptr;
    DWORD size = FormatMessageA(FORMAT_MESSAGE_ALLOCATE_BUFFER | FORMAT_MESSAGE_FROM_SYSTEM |
                                    FORMAT_MESSAGE_IGNORE_INSERTS,
                                nullptr, error, MAKELANGID(LANG_NEUTRAL, SUBLANG_DEFAULT),
                                reinterpret_cast<LPSTR>(&buffer), 0, nullptr);
    if (!buffer)
        return "Error " + std::to_string(error);

    std::string message(buffer, size);
    LocalFree(buffer);
    while (!message.empty() && (message.back() == '\n' || message.back() == '\r'))
        message.pop_back();
    return message;
}

void close_handle(HANDLE& h)
{
    if (h != INVALID_HANDLE_VALUE)
    {
        CloseHandle(h);
        h = INVALID_HANDLE_VALUE;
    }
}

// Quote one argument following the CommandLineToArgvW rules: backslashes are
// literal unless they precede a quote.
std::string quote_argument(const std::string& arg)
{
    if (!arg.empty() && arg.find_first_of(" \t\n\v\"") == std::string::npos)
        return arg;

    std::string result = "\"";
    std::size_t backslashes = 0;
    for (char c : arg)
    {
        if (c == '\\')
        {
            ++backslashes;
            continue;
        }
        if (c == '"')
            result.append(backslashes * 2 + 1, '\\');
        else
            result.append(backslashes, '\\');
        backslashes = 0;
        result += c;
    }
    result.append(backslashes * 2, '\\');
    result += '"';
    return result;
}

std::string build_environment_block(const SpawnOptions& options)
{
    std::map<std::string, std::string> env_map;

    if (options.inherit_environment)
    {
        char* env_strings = GetEnvironmentStringsA();
        if (env_strings)
        {
            for (char* current = env_strings; *current != '\0';)
            {
                std::string entry(current);
                std::size_t eq_pos = entry.find('=');
                // Entries like "=C:=C:\" describe drive state; keep them verbatim
                if (eq_pos != std::string::npos && eq_pos > 0)
                    env_map[entry.substr(0, eq_pos)] = entry.substr(eq_pos + 1);
                current += entry.length() + 1;
            }
            FreeEnvironmentStringsA(env_strings);
        }
    }

    for (const auto& [key, value] : options.environment)
        env_map[key] = value;

    std::string block;
    for (const auto& [key, value] : env_map)
    {
        block += key + "=" + value;
        block.push_back('\0');
    }
    // Double-null terminator, also for an empty block
    if (block.empty())
        block.push_back('\0');
    block.push_back('\0');
    return block;
}

void make_pipe(HANDLE& read_end, HANDLE& write_end, bool parent_reads, const char* what)
{
    SECURITY_ATTRIBUTES sa;
    sa.nLength = sizeof(SECURITY_ATTRIBUTES);
    sa.bInheritHandle = TRUE;
    sa.lpSecurityDescriptor = nullptr;

    if (!CreatePipe(&read_end, &write_end, &sa, 0))
        throw std::runtime_error(std::string("Failed to create ") + what +
                                 " pipe: " + last_error_message());

    // The parent's end must not leak into the child
    SetHandleInformation(parent_reads ? read_end : write_end, HANDLE_FLAG_INHERIT, 0);
}

} // namespace

// ReadPipe implementation
ReadPipe::ReadPipe() : handle_(std::make_unique<PipeHandle>()) {}

ReadPipe::~ReadPipe()
{
    close();
}

ReadPipe::ReadPipe(ReadPipe&&) noexcept = default;
ReadPipe& ReadPipe::operator=(ReadPipe&&) noexcept = default;

std::size_t ReadPipe::read(char* buffer, std::size_t size)
{
    if (!is_open())
        throw std::runtime_error("Pipe is not open");

    DWORD bytes_read = 0;
    if (!ReadFile(handle_->handle, buffer, static_cast<DWORD>(size), &bytes_read, nullptr))
    {
        DWORD error = GetLastError();
        if (error == ERROR_BROKEN_PIPE)
            return 0; // EOF
        throw std::runtime_error("Read failed: " + last_error_message());
    }

    return bytes_read;
}

bool ReadPipe::has_data(int timeout_ms)
{
    if (!is_open())
        return false;

    // Anonymous pipes cannot be waited on; poll in short steps
    DWORD waited = 0;
    for (;;)
    {
        DWORD bytes_available = 0;
        if (!PeekNamedPipe(handle_->handle, nullptr, 0, nullptr, &bytes_available, nullptr))
            return true; // Broken pipe: read() reports EOF without blocking
        if (bytes_available > 0)
            return true;
        if (waited >= static_cast<DWORD>(timeout_ms))
            return false;
        Sleep(10);
        waited += 10;
    }
}

void ReadPipe::close()
{
    if (handle_)
        close_handle(handle_->handle);
}

bool ReadPipe::is_open() const
{
    return handle_ && handle_->handle != INVALID_HANDLE_VALUE;
}

// WritePipe implementation
WritePipe::WritePipe() : handle_(std::make_unique<PipeHandle>()) {}

WritePipe::~WritePipe()
{
    close();
}

WritePipe::WritePipe(WritePipe&&) noexcept = default;
WritePipe& WritePipe::operator=(WritePipe&&) noexcept = default;

void WritePipe::write(const char* data, std::size_t size)
{
    if (!is_open())
        throw std::runtime_error("Pipe is not open");

    std::size_t written = 0;
    while (written < size)
    {
        DWORD chunk = 0;
        if (!WriteFile(handle_->handle, data + written, static_cast<DWORD>(size - written), &chunk,
                       nullptr))
        {
            if (GetLastError() == ERROR_NO_DATA || GetLastError() == ERROR_BROKEN_PIPE)
                throw std::runtime_error("Broken pipe (process closed stdin)");
            throw std::runtime_error("Write failed: " + last_error_message());
        }
        written += chunk;
    }
}

void WritePipe::write(const std::string& data)
{
    write(data.data(), data.size());
}

void WritePipe::flush()
{
    if (!is_open())
        throw std::runtime_error("Pipe is not open");
    // Pipes report ERROR_INVALID_FUNCTION when nothing is buffered; not a failure
    if (!FlushFileBuffers(handle_->handle) && GetLastError() != ERROR_INVALID_FUNCTION)
        throw std::runtime_error("Flush failed: " + last_error_message());
}

void WritePipe::close()
{
    if (handle_)
        close_handle(handle_->handle);
}

bool WritePipe::is_open() const
{
    return handle_ && handle_->handle != INVALID_HANDLE_VALUE;
}

// Process implementation
Process::Process() : handle_(std::make_unique<ProcessHandle>()) {}

Process::~Process()
{
    if (handle_ && handle_->running)
    {
        kill();
        wait();
    }
}

Process::Process(Process&&) noexcept = default;
Process& Process::operator=(Process&&) noexcept = default;

void Process::spawn(const std::string& executable, const std::vector<std::string>& args,
                    const SpawnOptions& options)
{
    if (handle_->running)
        throw std::runtime_error("Process already spawned");

    HANDLE stdin_read = INVALID_HANDLE_VALUE, stdin_write = INVALID_HANDLE_VALUE;
    HANDLE stdout_read = INVALID_HANDLE_VALUE, stdout_write = INVALID_HANDLE_VALUE;
    HANDLE stderr_read = INVALID_HANDLE_VALUE, stderr_write = INVALID_HANDLE_VALUE;
    HANDLE null_handle = INVALID_HANDLE_VALUE;

    auto close_child_ends = [&]
    {
        close_handle(stdin_read);
        close_handle(stdout_write);
        close_handle(stderr_write);
        close_handle(null_handle);
    };
    auto close_parent_ends = [&]
    {
        close_handle(stdin_write);
        close_handle(stdout_read);
        close_handle(stderr_read);
    };

    try
    {
        if (options.redirect_stdin)
            make_pipe(stdin_read, stdin_write, false, "stdin");
        if (options.redirect_stdout)
            make_pipe(stdout_read, stdout_write, true, "stdout");
        if (options.redirect_stderr)
            make_pipe(stderr_read, stderr_write, true, "stderr");
    }
    catch (...)
    {
        close_child_ends();
        close_parent_ends();
        throw;
    }

    // A GUI parent has no console; give the child NUL rather than an invalid handle
    if (!options.redirect_stderr)
    {
        SECURITY_ATTRIBUTES null_sa;
        null_sa.nLength = sizeof(SECURITY_ATTRIBUTES);
        null_sa.bInheritHandle = TRUE;
        null_sa.lpSecurityDescriptor = nullptr;
        null_handle = CreateFileA("NUL", GENERIC_WRITE, FILE_SHARE_WRITE, &null_sa, OPEN_EXISTING,
                                  FILE_ATTRIBUTE_NORMAL, nullptr);
    }

    std::ostringstream cmdline;
    cmdline << quote_argument(executable);
    for (const auto& arg : args)
        cmdline << " " << quote_argument(arg);
    std::string cmdline_str = cmdline.str();

    bool provide_env_block = !options.inherit_environment || !options.environment.empty();
    std::string env_block;
    if (provide_env_block)
        env_block = build_environment_block(options);

    // Explicit inheritance list so unrelated inheritable handles stay in the parent
    std::vector<HANDLE> handles_to_inherit;
    if (stdin_read != INVALID_HANDLE_VALUE)
        handles_to_inherit.push_back(stdin_read);
    if (stdout_write != INVALID_HANDLE_VALUE)
        handles_to_inherit.push_back(stdout_write);
    if (stderr_write != INVALID_HANDLE_VALUE)
        handles_to_inherit.push_back(stderr_write);
    else if (null_handle != INVALID_HANDLE_VALUE)
        handles_to_inherit.push_back(null_handle);

    STARTUPINFOEXA si;
    ZeroMemory(&si, sizeof(si));
    si.StartupInfo.cb = sizeof(si);
    si.StartupInfo.dwFlags = STARTF_USESTDHANDLES;
    si.StartupInfo.hStdInput = options.redirect_stdin ? stdin_read : GetStdHandle(STD_INPUT_HANDLE);
    si.StartupInfo.hStdOutput =
        options.redirect_stdout ? stdout_write : GetStdHandle(STD_OUTPUT_HANDLE);
    si.StartupInfo.hStdError =
        options.redirect_stderr
            ? stderr_write
            : (null_handle != INVALID_HANDLE_VALUE ? null_handle : GetStdHandle(STD_ERROR_HANDLE));

    SIZE_T attr_size = 0;
    InitializeProcThreadAttributeList(nullptr, 1, 0, &attr_size);
    si.lpAttributeList =
        static_cast<LPPROC_THREAD_ATTRIBUTE_LIST>(HeapAlloc(GetProcessHeap(), 0, attr_size));
    if (!si.lpAttributeList)
    {
        close_child_ends();
        close_parent_ends();
        throw std::runtime_error("Failed to allocate attribute list");
    }

    auto release_attributes = [&](bool initialized)
    {
        if (initialized)
            DeleteProcThreadAttributeList(si.lpAttributeList);
        HeapFree(GetProcessHeap(), 0, si.lpAttributeList);
    };

    if (!InitializeProcThreadAttributeList(si.lpAttributeList, 1, 0, &attr_size))
    {
        std::string message = last_error_message();
        release_attributes(false);
        close_child_ends();
        close_parent_ends();
        throw std::runtime_error("Failed to init attribute list: " + message);
    }

    if (!handles_to_inherit.empty() &&
        !UpdateProcThreadAttribute(si.lpAttributeList, 0, PROC_THREAD_ATTRIBUTE_HANDLE_LIST,
                                   handles_to_inherit.data(),
                                   handles_to_inherit.size() * sizeof(HANDLE), nullptr, nullptr))
    {
        std::string message = last_error_message();
        release_attributes(true);
        close_child_ends();
        close_parent_ends();
        throw std::runtime_error("Failed to update attribute list: " + message);
    }

    DWORD creation_flags = EXTENDED_STARTUPINFO_PRESENT;
    if (options.hide_console_window)
        creation_flags |= CREATE_NO_WINDOW;

    PROCESS_INFORMATION pi;
    ZeroMemory(&pi, sizeof(pi));

    BOOL success = CreateProcessA(
        nullptr, const_cast<char*>(cmdline_str.c_str()), nullptr, nullptr,
        TRUE, // Only the handles in the list
        creation_flags, provide_env_block ? const_cast<char*>(env_block.data()) : nullptr,
        options.working_directory.empty() ? nullptr : options.working_directory.c_str(),
        reinterpret_cast<LPSTARTUPINFOA>(&si), &pi);
    std::string spawn_error = success ? std::string() : last_error_message();

    release_attributes(true);
    close_child_ends();

    if (!success)
    {
        close_parent_ends();
        throw std::runtime_error("Failed to execute '" + executable + "': " + spawn_error);
    }

    if (options.redirect_stdin)
    {
        stdin_ = std::make_unique<WritePipe>();
        stdin_->handle_->handle = stdin_write;
    }
    if (options.redirect_stdout)
    {
        stdout_ = std::make_unique<ReadPipe>();
        stdout_->handle_->handle = stdout_read;
    }
    if (options.redirect_stderr)
    {
        stderr_ = std::make_unique<ReadPipe>();
        stderr_->handle_->handle = stderr_read;
    }

    handle_->process_handle = pi.hProcess;
    handle_->thread_handle = pi.hThread;
    handle_->process_id = pi.dwProcessId;
    handle_->running = true;
    handle_->exit_code = -1;

    HANDLE job = child_process_job();
    if (job)
        AssignProcessToJobObject(job, pi.hProcess);
}

WritePipe& Process::stdin_pipe()
{
    if (!stdin_)
        throw std::runtime_error("stdin not redirected");
    return *stdin_;
}

ReadPipe& Process::stdout_pipe()
{
    if (!stdout_)
        throw std::runtime_error("stdout not redirected");
    return *stdout_;
}

ReadPipe& Process::stderr_pipe()
{
    if (!stderr_)
        throw std::runtime_error("stderr not redirected");
    return *stderr_;
}

bool Process::is_running() const
{
    if (!handle_ || !handle_->running)
        return false;
    return WaitForSingleObject(handle_->process_handle, 0) == WAIT_TIMEOUT;
}

std::optional<int> Process::try_wait()
{
    if (!handle_ || !handle_->running)
        return handle_ ? handle_->exit_code : -1;

    DWORD result = WaitForSingleObject(handle_->process_handle, 0);
    if (result == WAIT_TIMEOUT)
        return std::nullopt;
    if (result == WAIT_FAILED)
        throw std::runtime_error("WaitForSingleObject failed: " + last_error_message());

    DWORD exit_code = 0;
    handle_->exit_code =
        GetExitCodeProcess(handle_->process_handle, &exit_code) ? static_cast<int>(exit_code) : -1;
    handle_->running = false;
    return handle_->exit_code;
}

int Process::wait()
{
    if (!handle_ || !handle_->running)
        return handle_ ? handle_->exit_code : -1;

    if (WaitForSingleObject(handle_->process_handle, INFINITE) == WAIT_FAILED)
        throw std::runtime_error("WaitForSingleObject failed: " + last_error_message());

    DWORD exit_code = 0;
    handle_->exit_code =
        GetExitCodeProcess(handle_->process_handle, &exit_code) ? static_cast<int>(exit_code) : -1;
    handle_->running = false;
    return handle_->exit_code;
}

void Process::kill()
{
    if (handle_ && handle_->running && handle_->process_handle != INVALID_HANDLE_VALUE)
        TerminateProcess(handle_->process_handle, 1);
}

int Process::pid() const
{
    return handle_ ? static_cast<int>(handle_->process_id) : 0;
}

std::optional<std::string> find_executable(const std::string& name)
{
    namespace fs = std::filesystem;
    std::error_code ec;

    fs::path exe_path(name);
    if (exe_path.has_parent_path())
    {
        if (fs::is_regular_file(exe_path, ec))
            return fs::absolute(exe_path, ec).string();
        return std::nullopt;
    }

    // node ships as node.exe; a bare name gets the executable extensions tried
    const std::vector<std::string> extensions =
        exe_path.has_extension() ? std::vector<std::string>{""}
                                 : std::vector<std::string>{".exe", ".cmd", ".bat"};

    const char* path_env = std::getenv("PATH");
    if (!path_env)
        return std::nullopt;

    std::string path_str(path_env);
    std::size_t start = 0;
    while (start <= path_str.size())
    {
        std::size_t end = path_str.find(';', start);
        if (end == std::string::npos)
            end = path_str.size();

        std::string dir = path_str.substr(start, end - start);
        if (!dir.empty())
        {
            for (const auto& ext : extensions)
            {
                fs::path candidate = fs::path(dir) / (name + ext);
                if (fs::is_regular_file(candidate, ec))
                    return candidate.string();
            }
        }

        start = end + 1;
    }

    return std::nullopt;
}

std::optional<std::string> home_directory()
{
    if (const char* profile = std::getenv("USERPROFILE"); profile && profile[0] != '\0')
        return std::string(profile);

    const char* drive = std::getenv("HOMEDRIVE");
    const char* path = std::getenv("HOMEPATH");
    if (drive && path && path[0] != '\0')
        return std::string(drive) + path;

    return std::nullopt;
}

} // namespace subprocess
} // namespace bridge

#endif // _WIN32
