// POSIX implementation of subprocess process management
// For Linux and macOS

#include "process.hpp"

#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <pthread.h>
#include <pwd.h>
#include <stdexcept>
#include <sys/select.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace bridge
{
namespace subprocess
{

// ============================================================================
// ProcessHandle - POSIX implementation
// ============================================================================

struct ProcessHandle
{
    pid_t pid = 0;
    bool running = false;
    int exit_code = -1;
};

// ============================================================================
// PipeHandle - POSIX implementation
// ============================================================================

struct PipeHandle
{
    int fd = -1;

    ~PipeHandle()
    {
        if (fd >= 0)
            ::close(fd);
    }
};

// ============================================================================
// Helper functions
// ============================================================================

namespace
{

std::string errno_message(int err)
{
    return std::strerror(err);
}

void close_fd(int& fd)
{
    if (fd >= 0)
    {
        ::close(fd);
        fd = -1;
    }
}

void close_pair(int fds[2])
{
    close_fd(fds[0]);
    close_fd(fds[1]);
}

void set_cloexec(int fd)
{
    int flags = fcntl(fd, F_GETFD, 0);
    if (flags != -1)
        fcntl(fd, F_SETFD, flags | FD_CLOEXEC);
}

// Pipe whose ends are close-on-exec. The child's end is dup2()'d onto a
// standard stream, which clears the flag on the duplicate.
void make_pipe(int fds[2], const char* what)
{
    if (::pipe(fds) != 0)
        throw std::runtime_error(std::string("Failed to create ") + what +
                                 " pipe: " + errno_message(errno));
    set_cloexec(fds[0]);
    set_cloexec(fds[1]);
#ifdef __APPLE__
    fcntl(fds[1], F_SETNOSIGPIPE, 1);
#endif
}

int decode_wait_status(int status)
{
    if (WIFEXITED(status))
        return WEXITSTATUS(status);
    if (WIFSIGNALED(status))
        return 128 + WTERMSIG(status);
    return -1;
}

#ifndef __APPLE__
// Blocks SIGPIPE for the calling thread around one write so a vanished reader
// surfaces as EPIPE. A SIGPIPE raised by that write is consumed before the
// previous mask is restored.
class SigpipeGuard
{
  public:
    SigpipeGuard()
    {
        sigemptyset(&sigpipe_);
        sigaddset(&sigpipe_, SIGPIPE);

        sigset_t pending;
        sigemptyset(&pending);
        sigpending(&pending);
        // Already pending means already blocked; leave the thread state alone
        if (sigismember(&pending, SIGPIPE) != 1)
            blocked_ = pthread_sigmask(SIG_BLOCK, &sigpipe_, &previous_) == 0;
    }

    ~SigpipeGuard()
    {
        if (!blocked_)
            return;

        if (broken_)
        {
            int saved = errno;
            struct timespec zero = {0, 0};
            while (sigtimedwait(&sigpipe_, nullptr, &zero) == -1 && errno == EINTR)
            {
            }
            errno = saved;
        }
        pthread_sigmask(SIG_SETMASK, &previous_, nullptr);
    }

    SigpipeGuard(const SigpipeGuard&) = delete;
    SigpipeGuard& operator=(const SigpipeGuard&) = delete;

    void mark_broken()
    {
        broken_ = true;
    }

  private:
    sigset_t sigpipe_;
    sigset_t previous_;
    bool blocked_ = false;
    bool broken_ = false;
};
#endif

// Reported by the child through the status pipe when it cannot exec
struct ChildFailure
{
    int stage; // 0 = chdir, 1 = exec
    int error;
};

void report_child_failure(int fd, int stage)
{
    ChildFailure failure{stage, errno};
    ssize_t ignored = ::write(fd, &failure, sizeof(failure));
    (void)ignored;
    _exit(127);
}

std::vector<std::string> build_environment(const SpawnOptions& options)
{
    std::map<std::string, std::string> merged;
    if (options.inherit_environment && environ)
    {
        for (char** entry = environ; *entry; ++entry)
        {
            std::string item(*entry);
            auto eq = item.find('=');
            if (eq != std::string::npos && eq > 0)
                merged[item.substr(0, eq)] = item.substr(eq + 1);
        }
    }

    // Custom variables override inherited ones
    for (const auto& [key, value] : options.environment)
        merged[key] = value;

    std::vector<std::string> entries;
    entries.reserve(merged.size());
    for (const auto& [key, value] : merged)
        entries.push_back(key + "=" + value);
    return entries;
}

bool is_executable_file(const std::filesystem::path& path)
{
    std::error_code ec;
    return std::filesystem::is_regular_file(path, ec) && access(path.c_str(), X_OK) == 0;
}

} // namespace

// ============================================================================
// ReadPipe implementation
// ============================================================================

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

    for (;;)
    {
        ssize_t bytes_read = ::read(handle_->fd, buffer, size);
        if (bytes_read >= 0)
            return static_cast<std::size_t>(bytes_read);
        if (errno == EINTR)
            continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK)
            return 0;
        throw std::runtime_error("Read failed: " + errno_message(errno));
    }
}

bool ReadPipe::has_data(int timeout_ms)
{
    if (!is_open())
        return false;

    fd_set read_fds;
    FD_ZERO(&read_fds);
    FD_SET(handle_->fd, &read_fds);

    struct timeval timeout;
    timeout.tv_sec = timeout_ms / 1000;
    timeout.tv_usec = (timeout_ms % 1000) * 1000;

    int result = select(handle_->fd + 1, &read_fds, nullptr, nullptr, &timeout);
    if (result < 0)
    {
        if (errno == EINTR)
            return false;
        throw std::runtime_error("select failed: " + errno_message(errno));
    }

    // Readable also covers EOF, which read() then reports as 0
    return result > 0 && FD_ISSET(handle_->fd, &read_fds);
}

void ReadPipe::close()
{
    if (handle_)
        close_fd(handle_->fd);
}

bool ReadPipe::is_open() const
{
    return handle_ && handle_->fd >= 0;
}

// ============================================================================
// WritePipe implementation
// ============================================================================

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

#ifndef __APPLE__
    SigpipeGuard guard;
#endif

    std::size_t written = 0;
    while (written < size)
    {
        ssize_t n = ::write(handle_->fd, data + written, size - written);
        if (n >= 0)
        {
            written += static_cast<std::size_t>(n);
            continue;
        }
        if (errno == EINTR)
            continue;
        if (errno == EPIPE)
        {
#ifndef __APPLE__
            guard.mark_broken();
#endif
            throw std::runtime_error("Broken pipe (process closed stdin)");
        }
        throw std::runtime_error("Write failed: " + errno_message(errno));
    }
}

void WritePipe::write(const std::string& data)
{
    write(data.data(), data.size());
}

void WritePipe::flush()
{
    // Pipe writes are unbuffered; only check the pipe is still usable
    if (!is_open())
        throw std::runtime_error("Pipe is not open");
}

void WritePipe::close()
{
    if (handle_)
        close_fd(handle_->fd);
}

bool WritePipe::is_open() const
{
    return handle_ && handle_->fd >= 0;
}

// ============================================================================
// Process implementation
// ============================================================================

Process::Process() : handle_(std::make_unique<ProcessHandle>()) {}

Process::~Process()
{
    if (handle_ && handle_->running)
    {
        kill();
        try
        {
            wait();
        }
        catch (const std::exception&)
        {
            // Already reaped elsewhere; nothing left to release
        }
    }
}

Process::Process(Process&&) noexcept = default;
Process& Process::operator=(Process&&) noexcept = default;

void Process::spawn(const std::string& executable, const std::vector<std::string>& args,
                    const SpawnOptions& options)
{
    if (handle_->running)
        throw std::runtime_error("Process already spawned");

    int stdin_fds[2] = {-1, -1};
    int stdout_fds[2] = {-1, -1};
    int stderr_fds[2] = {-1, -1};
    int status_fds[2] = {-1, -1};

    auto close_all = [&]
    {
        close_pair(stdin_fds);
        close_pair(stdout_fds);
        close_pair(stderr_fds);
        close_pair(status_fds);
    };

    try
    {
        if (options.redirect_stdin)
            make_pipe(stdin_fds, "stdin");
        if (options.redirect_stdout)
            make_pipe(stdout_fds, "stdout");
        if (options.redirect_stderr)
            make_pipe(stderr_fds, "stderr");
        make_pipe(status_fds, "status");
    }
    catch (...)
    {
        close_all();
        throw;
    }

    // Everything the child needs is prepared before fork()
    std::vector<std::string> env_entries = build_environment(options);
    std::vector<char*> envp;
    envp.reserve(env_entries.size() + 1);
    for (auto& entry : env_entries)
        envp.push_back(entry.data());
    envp.push_back(nullptr);

    std::vector<char*> argv;
    argv.reserve(args.size() + 2);
    argv.push_back(const_cast<char*>(executable.c_str()));
    for (const auto& arg : args)
        argv.push_back(const_cast<char*>(arg.c_str()));
    argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0)
    {
        int err = errno;
        close_all();
        throw std::runtime_error("Failed to fork process: " + errno_message(err));
    }

    if (pid == 0)
    {
        // Child process: only async-signal-safe calls from here on
        sigset_t empty;
        sigemptyset(&empty);
        sigprocmask(SIG_SETMASK, &empty, nullptr);
        signal(SIGPIPE, SIG_DFL);

        if (options.redirect_stdin && dup2(stdin_fds[0], STDIN_FILENO) < 0)
            report_child_failure(status_fds[1], 1);
        if (options.redirect_stdout && dup2(stdout_fds[1], STDOUT_FILENO) < 0)
            report_child_failure(status_fds[1], 1);
        if (options.redirect_stderr && dup2(stderr_fds[1], STDERR_FILENO) < 0)
            report_child_failure(status_fds[1], 1);

        if (!options.working_directory.empty() && chdir(options.working_directory.c_str()) != 0)
            report_child_failure(status_fds[1], 0);

        environ = envp.data();
        execvp(executable.c_str(), argv.data());

        // If execvp returns, it failed
        report_child_failure(status_fds[1], 1);
    }

    // Parent process: drop the child's ends
    close_fd(stdin_fds[0]);
    close_fd(stdout_fds[1]);
    close_fd(stderr_fds[1]);
    close_fd(status_fds[1]);

    // The status pipe closes on successful exec; data means the child gave up
    ChildFailure failure{0, 0};
    ssize_t n;
    do
    {
        n = ::read(status_fds[0], &failure, sizeof(failure));
    } while (n < 0 && errno == EINTR);
    close_fd(status_fds[0]);

    if (n == static_cast<ssize_t>(sizeof(failure)))
    {
        int status = 0;
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR)
        {
        }
        close_all();

        if (failure.stage == 0)
            throw std::runtime_error("Failed to change directory to '" +
                                     options.working_directory +
                                     "': " + errno_message(failure.error));
        throw std::runtime_error("Failed to execute '" + executable +
                                 "': " + errno_message(failure.error));
    }

    if (options.redirect_stdin)
    {
        stdin_ = std::make_unique<WritePipe>();
        stdin_->handle_->fd = stdin_fds[1];
    }

    if (options.redirect_stdout)
    {
        stdout_ = std::make_unique<ReadPipe>();
        stdout_->handle_->fd = stdout_fds[0];
    }

    if (options.redirect_stderr)
    {
        stderr_ = std::make_unique<ReadPipe>();
        stderr_->handle_->fd = stderr_fds[0];
    }

    handle_->pid = pid;
    handle_->running = true;
    handle_->exit_code = -1;
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
    if (!handle_ || handle_->pid == 0 || !handle_->running)
        return false;

    // Zombies still answer kill(0); ask waitpid without reaping
    siginfo_t info;
    std::memset(&info, 0, sizeof(info));
    if (waitid(P_PID, static_cast<id_t>(handle_->pid), &info, WEXITED | WNOHANG | WNOWAIT) != 0)
        return errno != ECHILD;
    return info.si_pid == 0;
}

std::optional<int> Process::try_wait()
{
    if (!handle_ || handle_->pid == 0)
        return handle_ ? handle_->exit_code : -1;

    if (!handle_->running)
        return handle_->exit_code;

    int status = 0;
    pid_t result;
    do
    {
        result = waitpid(handle_->pid, &status, WNOHANG);
    } while (result < 0 && errno == EINTR);

    if (result == 0)
        return std::nullopt; // Still running
    if (result < 0)
        throw std::runtime_error("waitpid failed: " + errno_message(errno));

    handle_->exit_code = decode_wait_status(status);
    handle_->running = false;
    return handle_->exit_code;
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

    if (result < 0)
        throw std::runtime_error("waitpid failed: " + errno_message(errno));

    handle_->exit_code = decode_wait_status(status);
    handle_->running = false;
    return handle_->exit_code;
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

// ============================================================================
// Helper functions
// ============================================================================

std::optional<std::string> find_executable(const std::string& name)
{
    namespace fs = std::filesystem;

    // Anything with a path separator is checked as given
    if (name.find('/') != std::string::npos)
    {
        if (is_executable_file(name))
            return fs::absolute(name).string();
        return std::nullopt;
    }

    const char* path_env = std::getenv("PATH");
    if (!path_env)
    {
        if (is_executable_file(name))
            return fs::absolute(name).string();
        return std::nullopt;
    }

    std::string path_str(path_env);
    std::size_t start = 0;
    while (start <= path_str.size())
    {
        std::size_t end = path_str.find(':', start);
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

std::optional<std::string> home_directory()
{
    if (const char* home = std::getenv("HOME"); home != nullptr && home[0] != '\0')
        return std::string(home);

    // Fall back to the password database
    long size_hint = sysconf(_SC_GETPW_R_SIZE_MAX);
    std::vector<char> buffer(size_hint > 0 ? static_cast<std::size_t>(size_hint) : 16384);
    struct passwd pwd;
    struct passwd* result = nullptr;
    if (getpwuid_r(getuid(), &pwd, buffer.data(), buffer.size(), &result) == 0 && result &&
        result->pw_dir && result->pw_dir[0] != '\0')
        return std::string(result->pw_dir);

    return std::nullopt;
}

} // namespace subprocess
} // namespace bridge
