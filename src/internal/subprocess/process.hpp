#ifndef BRIDGE_SUBPROCESS_PROCESS_HPP
#define BRIDGE_SUBPROCESS_PROCESS_HPP

#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace bridge
{
namespace subprocess
{

struct ProcessHandle;
struct PipeHandle;

// How the child is started. By default all three standard streams are piped,
// which is what the bridge transport needs.
struct SpawnOptions
{
    std::string working_directory; // empty: inherit ours
    std::map<std::string, std::string> environment;
    bool inherit_environment = true;

    bool redirect_stdin = true;
    bool redirect_stdout = true;
    bool redirect_stderr = false;

    bool hide_console_window = true; // Windows only
};

// Parent end of the child's stdout or stderr
class ReadPipe
{
  public:
    ReadPipe();
    ~ReadPipe();

    ReadPipe(const ReadPipe&) = delete;
    ReadPipe& operator=(const ReadPipe&) = delete;
    ReadPipe(ReadPipe&&) noexcept;
    ReadPipe& operator=(ReadPipe&&) noexcept;

    // Returns 0 at end of stream. Throws std::runtime_error on failure.
    std::size_t read(char* buffer, std::size_t size);

    // Waits up to timeout_ms. True when read() would return without blocking,
    // either with data or with end of stream.
    bool has_data(int timeout_ms = 0);

    void close();

  private:
    friend class Process;
    bool is_open() const;

    std::unique_ptr<PipeHandle> handle_;
};

// Parent end of the child's stdin
class WritePipe
{
  public:
    WritePipe();
    ~WritePipe();

    WritePipe(const WritePipe&) = delete;
    WritePipe& operator=(const WritePipe&) = delete;
    WritePipe(WritePipe&&) noexcept;
    WritePipe& operator=(WritePipe&&) noexcept;

    // Writes everything or throws std::runtime_error. A closed read end is an
    // error here, never a SIGPIPE.
    void write(const char* data, std::size_t size);
    void write(const std::string& data);
    void flush();

    // Closing delivers EOF to the child
    void close();

  private:
    friend class Process;
    bool is_open() const;

    std::unique_ptr<PipeHandle> handle_;
};

class Process
{
  public:
    Process();
    ~Process(); // kills the child if it is still running
    Process(const Process&) = delete;
    Process& operator=(const Process&) = delete;
    Process(Process&&) noexcept;
    Process& operator=(Process&&) noexcept;

    // Throws std::runtime_error when the child cannot be started. On POSIX
    // that includes an exec or chdir failure inside the child.
    void spawn(const std::string& executable, const std::vector<std::string>& args,
               const SpawnOptions& options = {});

    // Throw std::runtime_error if the stream was not redirected
    WritePipe& stdin_pipe();
    ReadPipe& stdout_pipe();
    ReadPipe& stderr_pipe();

    bool is_running() const;
    std::optional<int> try_wait();
    int wait();
    void kill();

    int pid() const;

  private:
    std::unique_ptr<ProcessHandle> handle_;
    std::unique_ptr<WritePipe> stdin_;
    std::unique_ptr<ReadPipe> stdout_;
    std::unique_ptr<ReadPipe> stderr_;
};

// Searches PATH
std::optional<std::string> find_executable(const std::string& name);

// HOME, falling back to the password database; USERPROFILE on Windows
std::optional<std::string> home_directory();

} // namespace subprocess
} // namespace bridge

#endif // BRIDGE_SUBPROCESS_PROCESS_HPP
