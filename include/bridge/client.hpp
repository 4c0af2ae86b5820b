#ifndef BRIDGE_CLIENT_HPP
#define BRIDGE_CLIENT_HPP

#include <bridge/transport.hpp>
#include <bridge/types.hpp>
#include <cstddef>
#include <future>
#include <memory>
#include <optional>
#include <string>

namespace bridge
{

/**
 * Request/response channel to the provider bridge service.
 *
 * Construction starts the transport (spawning the bridge process by default)
 * and waits up to BridgeOptions::ready_timeout for the bridge's "ready" event.
 * A missing script or a failed spawn throws; an expired readiness wait only
 * logs a warning, and the client stays usable once "ready" arrives later.
 *
 * All request methods are thread-safe. Responses are matched to requests by
 * id only; no ordering between independent requests is implied. There is no
 * per-request timeout. Destroying the client calls shutdown().
 *
 * shutdown() may be called from the event or stderr callbacks. Destroying the
 * client from inside one of them is not supported.
 */
class BridgeClient
{
  public:
    explicit BridgeClient(const BridgeOptions& options = BridgeOptions{});
    // Test-only/advanced: inject a custom transport implementation.
    BridgeClient(const BridgeOptions& options, std::unique_ptr<Transport> transport);
    ~BridgeClient();

    // No copy, move only
    BridgeClient(const BridgeClient&) = delete;
    BridgeClient& operator=(const BridgeClient&) = delete;
    BridgeClient(BridgeClient&&) noexcept;
    BridgeClient& operator=(BridgeClient&&) noexcept;

    // Process handle present and "ready" observed
    bool is_alive() const;

    // "ready" observed (monotonic)
    bool is_ready() const;

    // Process ID of the bridge, 0 once shut down
    long get_pid() const;

    // Number of requests awaiting a response
    std::size_t pending_requests() const;

    /**
     * Send a request and return a future for its result.
     *
     * Throws ProcessNotRunningError before allocating an id if is_alive() is
     * false, and ProcessClosedError if writing the request fails. The future
     * yields the remote result (null when absent), or throws RemoteError with
     * the remote error string, or ProcessClosedError if the transport goes
     * away first. Dropping the future abandons the call.
     */
    std::future<json> send_request_async(const std::string& method,
                                         const json& params = json::object());

    // Blocking form of send_request_async()
    json send_request(const std::string& method, const json& params = json::object());

    // Provider sessions
    json launch(const std::string& profile, const std::string& provider, const json& config);
    json send_message(const std::string& profile, const std::string& message);
    json stop(const std::string& profile);
    json list_providers();

    // Authentication
    json check_auth(const std::string& provider, const std::string& profile_name);
    json login_with_api_key(const std::string& profile_name, const std::string& provider,
                            const std::string& api_key,
                            const std::optional<json>& metadata = std::nullopt);
    json get_auth_options(const std::string& profile_name, const std::string& provider);
    json link_existing_credential(const std::string& profile_name, const std::string& provider);

    // Profiles
    json list_profiles();
    json create_profile(const std::string& name, const std::string& provider);
    json switch_profile(const std::string& profile_id);
    json delete_profile(const std::string& profile_id);
    json get_current_profile();

    // Kill the bridge and release its handles. Idempotent.
    void shutdown();

  private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace bridge

#endif // BRIDGE_CLIENT_HPP
