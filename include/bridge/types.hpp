#ifndef BRIDGE_TYPES_HPP
#define BRIDGE_TYPES_HPP

#include <chrono>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace spdlog
{
class logger;
}

namespace bridge
{

// JSON type alias - allows swapping implementation later if needed
using json = nlohmann::json;

// Channel name under which "message" events are forwarded to the event sink
constexpr const char* MESSAGE_STREAM_CHANNEL = "message-stream";

// Location of the bridge script relative to a resource or project directory
constexpr const char* BRIDGE_RELATIVE_PATH = "dist/bridge/provider-bridge.js";

// Receives forwarded events: (channel, payload)
using EventCallback = std::function<void(const std::string&, const json&)>;

// Receives each non-empty diagnostic line written by the bridge to stderr
using StderrCallback = std::function<void(const std::string&)>;

struct BridgeOptions
{
    // Explicit bridge script. If empty, PROVIDER_BRIDGE_PATH is consulted, then
    // the packaged resource directory, then an upward search.
    std::string bridge_path;

    // Explicit interpreter. If empty, PROVIDER_BRIDGE_NODE is consulted, then PATH.
    std::string node_path;

    // Packaged resource directory checked first during discovery.
    // Defaults to the directory of the running executable.
    std::string resource_dir;

    // Directory the upward search starts from. Defaults to the current directory.
    std::string search_start;

    // Number of directories examined by the upward search (start included)
    int search_depth = 5;

    // Working directory of the child. Defaults to the user's home directory so
    // the bridge finds user-level tool configuration regardless of install location.
    std::optional<std::string> working_directory;

    std::map<std::string, std::string> environment;
    bool inherit_environment = true; // If false, only `environment` is passed to the child

    // Extra arguments appended after the script path
    std::vector<std::string> extra_args;

    // Upper bound on the startup wait for the "ready" event.
    // Expiry is logged, not fatal.
    std::chrono::milliseconds ready_timeout{5000};

    /// Maximum size of one buffered line from the bridge (in bytes).
    /// Unset means no limit. A stdout line over the limit ends the channel:
    /// requests in flight fail with ProcessClosedError.
    std::optional<std::size_t> max_buffer_size;

    /// Sink for "message" events, invoked as (MESSAGE_STREAM_CHANNEL, data).
    /// Note: Executes on the stdout reader thread - blocking here delays every
    /// response behind it.
    std::optional<EventCallback> event_callback;

    /// Callback invoked when the bridge writes to stderr, in addition to the log.
    /// Note: Executes on a background thread - ensure callback is thread-safe.
    std::optional<StderrCallback> stderr_callback;

    // Log sink. Null means spdlog::default_logger().
    std::shared_ptr<spdlog::logger> logger;
};

} // namespace bridge

#endif // BRIDGE_TYPES_HPP
