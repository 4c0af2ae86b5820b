#ifndef BRIDGE_INTERNAL_SUBPROCESS_TRANSPORT_HPP
#define BRIDGE_INTERNAL_SUBPROCESS_TRANSPORT_HPP

#include "../subprocess/process.hpp"

#include <atomic>
#include <bridge/transport.hpp>
#include <bridge/types.hpp>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace bridge
{
namespace internal
{

/**
 * Subprocess transport for the Node.js provider bridge.
 *
 * Spawns `node <bridge script>` with all three standard streams piped, frames
 * its stdout and stderr into lines on two background threads, and writes
 * request lines to its stdin.
 *
 * EOF (or a read error) on stdout clears the stdin handle, which is what turns
 * is_open() false; there is no other health check. close() kills the child.
 * It may be called from a callback (on a reader thread); the transport itself
 * must not be destroyed there.
 */
class SubprocessTransport : public Transport
{
  public:
    explicit SubprocessTransport(const BridgeOptions& options);
    ~SubprocessTransport() override;

    // Transport interface
    void start(TransportCallbacks callbacks) override;
    void write_line(const std::string& line) override;
    bool is_open() const override;
    void close() override;
    long get_pid() const override;

  private:
    std::vector<std::string> build_command(const std::string& script) const;
    subprocess::SpawnOptions build_process_options() const;

    // Background reader threads; the pipes belong to the process, which is
    // kept alive until both threads have been joined
    void reader_loop(subprocess::ReadPipe* pipe);
    void stderr_reader_loop(subprocess::ReadPipe* pipe);

    // Drop the stdin handle after stdout ended
    void clear_stdin();

    BridgeOptions options_;
    TransportCallbacks callbacks_;

    // Guards process_, retired_process_, stdin_open_ and closed_
    mutable std::mutex process_mutex_;
    std::unique_ptr<subprocess::Process> process_;
    // Killed process parked until its reader threads are gone
    std::unique_ptr<subprocess::Process> retired_process_;
    bool stdin_open_ = false;
    bool closed_ = false;

    // Serializes stdin writes and the closing of stdin
    std::mutex write_mutex_;

    // Held while joining the readers; never taken on a reader thread
    std::mutex join_mutex_;
    std::thread reader_thread_;
    std::thread stderr_reader_thread_;
    // Set in start() under process_mutex_
    std::thread::id reader_id_;
    std::thread::id stderr_reader_id_;
    std::atomic<bool> running_{false};
};

} // namespace internal
} // namespace bridge

#endif // BRIDGE_INTERNAL_SUBPROCESS_TRANSPORT_HPP
