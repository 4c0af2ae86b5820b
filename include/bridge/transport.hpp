#ifndef BRIDGE_TRANSPORT_HPP
#define BRIDGE_TRANSPORT_HPP

#include <bridge/types.hpp>
#include <functional>
#include <memory>
#include <spdlog/spdlog.h>
#include <string>

namespace bridge
{

// Handlers a transport invokes from its background reader threads
struct TransportCallbacks
{
    // One complete, non-empty line from the child's stdout (newline stripped)
    std::function<void(const std::string&)> on_stdout_line;

    // One complete, non-empty line from the child's stderr (newline stripped)
    std::function<void(const std::string&)> on_stderr_line;

    // The stdout reader has stopped (EOF, read error, or close()).
    // Called at most once, after is_open() has turned false.
    std::function<void()> on_closed;
};

/**
 * Abstract line transport between BridgeClient and the bridge service.
 *
 * A transport owns the child process and its three standard streams. It
 * delivers complete lines from the child's output through TransportCallbacks
 * and writes complete lines to the child's input. It knows nothing about
 * message shapes or correlation; BridgeClient builds those on top.
 *
 * Implementations include:
 * - SubprocessTransport: Node.js bridge script spawned with piped stdio
 * - Test doubles that feed lines from memory
 */
class Transport
{
  public:
    explicit Transport(std::shared_ptr<spdlog::logger> logger = nullptr)
        : logger_(logger ? std::move(logger) : spdlog::default_logger())
    {
    }

    Transport(const Transport&) = delete;
    Transport& operator=(const Transport&) = delete;

    virtual ~Transport() = default;

    /**
     * Start the transport and its reader threads.
     * For subprocess transports, this locates and spawns the process.
     * Throws BridgeNotFoundError or BridgeSpawnError on failure.
     */
    virtual void start(TransportCallbacks callbacks) = 0;

    /**
     * Write one line (the caller supplies the trailing newline) and flush it.
     * Writes are serialized; concurrent callers never interleave partial lines.
     * Throws ProcessNotRunningError if the input stream is already gone and
     * ProcessClosedError if the write or flush fails.
     */
    virtual void write_line(const std::string& line) = 0;

    /**
     * True while the process handle exists and its input stream has not been
     * cleared by EOF on the output stream or by close().
     */
    virtual bool is_open() const = 0;

    /**
     * Forcibly terminate the child, wait for it, and release its handles.
     * Idempotent: calls after the first are no-ops.
     */
    virtual void close() = 0;

    /**
     * Get the process ID for subprocess transports.
     * Returns 0 for non-subprocess transports or after close().
     */
    virtual long get_pid() const
    {
        return 0;
    }

  protected:
    spdlog::logger& logger() const
    {
        return *logger_;
    }

  private:
    std::shared_ptr<spdlog::logger> logger_;
};

// Factory for the default subprocess transport
std::unique_ptr<Transport> create_subprocess_transport(const BridgeOptions& options);

} // namespace bridge

#endif // BRIDGE_TRANSPORT_HPP
