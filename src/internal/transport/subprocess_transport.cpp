#include "subprocess_transport.hpp"

#include "../line_buffer.hpp"
#include "bridge_locator.hpp"

#include <bridge/errors.hpp>
#include <spdlog/spdlog.h>

namespace bridge
{
namespace internal
{

namespace
{

constexpr std::size_t READ_CHUNK_SIZE = 4096;
constexpr int READ_POLL_MS = 100;

void deliver_line(const std::function<void(const std::string&)>& handler, const std::string& line,
                  const char* stream, spdlog::logger& log)
{
    if (!handler)
        return;
    try
    {
        handler(line);
    }
    catch (const std::exception& e)
    {
        log.error("Bridge {} handler threw: {}", stream, e.what());
    }
}

} // namespace

SubprocessTransport::SubprocessTransport(const BridgeOptions& options)
    : Transport(options.logger), options_(options)
{
}

SubprocessTransport::~SubprocessTransport()
{
    close();
}

std::vector<std::string> SubprocessTransport::build_command(const std::string& script) const
{
    std::vector<std::string> args;
    args.reserve(options_.extra_args.size() + 1);
    args.push_back(script);
    for (const auto& arg : options_.extra_args)
        args.push_back(arg);
    return args;
}

subprocess::SpawnOptions SubprocessTransport::build_process_options() const
{
    subprocess::SpawnOptions proc_opts;
    proc_opts.redirect_stdin = true;
    proc_opts.redirect_stdout = true;
    proc_opts.redirect_stderr = true;
    proc_opts.hide_console_window = true;
    proc_opts.inherit_environment = options_.inherit_environment;
    proc_opts.environment = options_.environment;

    // The bridge resolves user-level tool configuration relative to its cwd
    if (options_.working_directory)
    {
        proc_opts.working_directory = *options_.working_directory;
    }
    else
    {
        auto home = subprocess::home_directory();
        if (!home)
            throw BridgeSpawnError(
                "Failed to get home directory for the bridge working directory");
        proc_opts.working_directory = *home;
    }

    return proc_opts;
}

void SubprocessTransport::start(TransportCallbacks callbacks)
{
    std::lock_guard<std::mutex> lock(process_mutex_);

    if (closed_)
        throw BridgeSpawnError("Bridge transport has been closed");
    if (process_)
        return; // Already started

    std::string script = locate_bridge_script(options_, logger());
    std::string node = resolve_node_executable(options_, logger());
    subprocess::SpawnOptions proc_opts = build_process_options();
    auto args = build_command(script);

    auto process = std::make_unique<subprocess::Process>();
    try
    {
        process->spawn(node, args, proc_opts);
    }
    catch (const std::exception& e)
    {
        throw BridgeSpawnError(std::string("Failed to spawn bridge process: ") + e.what());
    }

    subprocess::ReadPipe* stdout_pipe = nullptr;
    subprocess::ReadPipe* stderr_pipe = nullptr;
    try
    {
        process->stdin_pipe();
        stdout_pipe = &process->stdout_pipe();
        stderr_pipe = &process->stderr_pipe();
    }
    catch (const std::exception& e)
    {
        process->kill();
        process->wait();
        throw BridgeSpawnError(std::string("Failed to get bridge process streams: ") + e.what());
    }

    logger().info("Started bridge process (pid {}): {} {} (cwd {})", process->pid(), node, script,
                  proc_opts.working_directory);

    callbacks_ = std::move(callbacks);
    process_ = std::move(process);
    stdin_open_ = true;
    running_ = true;

    reader_thread_ = std::thread(&SubprocessTransport::reader_loop, this, stdout_pipe);
    stderr_reader_thread_ = std::thread(&SubprocessTransport::stderr_reader_loop, this, stderr_pipe);
    reader_id_ = reader_thread_.get_id();
    stderr_reader_id_ = stderr_reader_thread_.get_id();
}

void SubprocessTransport::write_line(const std::string& line)
{
    std::lock_guard<std::mutex> write_lock(write_mutex_);

    subprocess::WritePipe* pipe = nullptr;
    {
        std::lock_guard<std::mutex> lock(process_mutex_);
        if (!process_ || !stdin_open_)
            throw ProcessNotRunningError(
                "Bridge stdin not available. Please restart the application.");
        pipe = &process_->stdin_pipe();
    }

    // The pipe outlives this call: close() parks the process and only releases
    // it while holding write_mutex_
    try
    {
        pipe->write(line);
        pipe->flush();
    }
    catch (const std::exception& e)
    {
        throw ProcessClosedError(std::string("Bridge process closed unexpectedly: ") + e.what() +
                                 ". Please check the bridge service logs and restart the "
                                 "application.");
    }
}

bool SubprocessTransport::is_open() const
{
    std::lock_guard<std::mutex> lock(process_mutex_);
    return process_ != nullptr && stdin_open_;
}

void SubprocessTransport::clear_stdin()
{
    {
        std::lock_guard<std::mutex> lock(process_mutex_);
        if (!stdin_open_)
            return;
        stdin_open_ = false;
    }

    // A write already in progress finishes (or fails) before stdin goes away
    std::lock_guard<std::mutex> write_lock(write_mutex_);
    std::lock_guard<std::mutex> lock(process_mutex_);
    if (process_)
        process_->stdin_pipe().close();
}

void SubprocessTransport::close()
{
    bool on_reader_thread = false;
    {
        std::lock_guard<std::mutex> lock(process_mutex_);
        const auto self = std::this_thread::get_id();
        on_reader_thread = self == reader_id_ || self == stderr_reader_id_;

        if (!closed_)
        {
            closed_ = true;
            running_ = false;
            stdin_open_ = false;

            if (process_)
            {
                logger().info("Shutting down bridge process (pid {})", process_->pid());
                process_->kill();
                try
                {
                    int exit_code = process_->wait();
                    logger().debug("Bridge process exited with code {}", exit_code);
                }
                catch (const std::exception& e)
                {
                    logger().warn("Failed to reap bridge process: {}", e.what());
                }
                retired_process_ = std::move(process_);
            }
        }
    }

    // Called from a callback: the reader cannot join itself. It stops on its
    // own and the next close() from another thread, at the latest the
    // destructor, joins it.
    if (on_reader_thread)
        return;

    std::lock_guard<std::mutex> join_lock(join_mutex_);
    if (reader_thread_.joinable())
        reader_thread_.join();
    if (stderr_reader_thread_.joinable())
        stderr_reader_thread_.join();

    std::lock_guard<std::mutex> write_lock(write_mutex_);
    std::lock_guard<std::mutex> lock(process_mutex_);
    retired_process_.reset();
}

long SubprocessTransport::get_pid() const
{
    std::lock_guard<std::mutex> lock(process_mutex_);
    return process_ ? static_cast<long>(process_->pid()) : 0;
}

void SubprocessTransport::reader_loop(subprocess::ReadPipe* pipe)
{
    protocol::LineBuffer framer(options_.max_buffer_size);
    char buffer[READ_CHUNK_SIZE];
    bool eof = false;

    try
    {
        while (running_)
        {
            if (!pipe->has_data(READ_POLL_MS))
                continue;

            std::size_t n = pipe->read(buffer, sizeof(buffer));
            if (n == 0)
            {
                eof = true;
                break;
            }

            auto lines = framer.add_data(buffer, n);
            for (const auto& line : lines)
                deliver_line(callbacks_.on_stdout_line, line, "stdout", logger());

            // The reply in that line is lost, so the channel can no longer be trusted
            if (framer.overflowed())
                throw MessageFramingError("Line from bridge stdout exceeded maximum size of " +
                                          std::to_string(*options_.max_buffer_size) + " bytes");
        }
    }
    catch (const std::exception& e)
    {
        if (running_)
            logger().error("Error reading bridge stdout: {}", e.what());
    }

    if (eof)
    {
        // An unterminated last line still counts
        if (auto rest = framer.take_remainder())
            deliver_line(callbacks_.on_stdout_line, *rest, "stdout", logger());
        if (running_)
            logger().warn("Bridge stdout closed");
    }

    clear_stdin();

    if (callbacks_.on_closed)
    {
        try
        {
            callbacks_.on_closed();
        }
        catch (const std::exception& e)
        {
            logger().error("Bridge close handler threw: {}", e.what());
        }
    }

    logger().debug("Bridge stdout reader stopped");
}

void SubprocessTransport::stderr_reader_loop(subprocess::ReadPipe* pipe)
{
    protocol::LineBuffer framer(options_.max_buffer_size);
    char buffer[READ_CHUNK_SIZE];

    try
    {
        while (running_)
        {
            if (!pipe->has_data(READ_POLL_MS))
                continue;

            std::size_t n = pipe->read(buffer, sizeof(buffer));
            if (n == 0)
            {
                if (auto rest = framer.take_remainder())
                    deliver_line(callbacks_.on_stderr_line, *rest, "stderr", logger());
                break;
            }

            auto lines = framer.add_data(buffer, n);
            for (const auto& line : lines)
                deliver_line(callbacks_.on_stderr_line, line, "stderr", logger());

            if (framer.overflowed())
            {
                logger().warn("Dropped an oversized line from bridge stderr (limit {} bytes)",
                              *options_.max_buffer_size);
                framer.clear_buffer();
            }
        }
    }
    catch (const std::exception& e)
    {
        // Not escalated: stderr is diagnostics only
        if (running_)
            logger().error("Error reading bridge stderr: {}", e.what());
    }

    logger().debug("Bridge stderr reader stopped");
}

} // namespace internal

std::unique_ptr<Transport> create_subprocess_transport(const BridgeOptions& options)
{
    return std::make_unique<internal::SubprocessTransport>(options);
}

} // namespace bridge
