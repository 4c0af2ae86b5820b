#ifndef BRIDGE_INTERNAL_BRIDGE_LOCATOR_HPP
#define BRIDGE_INTERNAL_BRIDGE_LOCATOR_HPP

#include <bridge/types.hpp>
#include <optional>
#include <string>

namespace spdlog
{
class logger;
}

namespace bridge
{
namespace internal
{

// Environment overrides consulted when the options leave a path empty
constexpr const char* BRIDGE_PATH_ENV = "PROVIDER_BRIDGE_PATH";
constexpr const char* BRIDGE_NODE_ENV = "PROVIDER_BRIDGE_NODE";

/**
 * Find the bridge script.
 *
 * Order: options.bridge_path, $PROVIDER_BRIDGE_PATH, the resource directory
 * (options.resource_dir or the executable's directory) joined with
 * BRIDGE_RELATIVE_PATH, then BRIDGE_RELATIVE_PATH under search_start and up to
 * search_depth - 1 of its ancestors. An explicit path that does not exist is
 * an error rather than a reason to keep searching.
 *
 * Throws BridgeNotFoundError.
 */
std::string locate_bridge_script(const BridgeOptions& options, spdlog::logger& log);

/**
 * Find the Node.js interpreter: options.node_path, $PROVIDER_BRIDGE_NODE, then
 * "node" on PATH. Throws BridgeNotFoundError.
 */
std::string resolve_node_executable(const BridgeOptions& options, spdlog::logger& log);

// Directory containing the running executable, if the platform can tell
std::optional<std::string> executable_directory();

} // namespace internal
} // namespace bridge

#endif // BRIDGE_INTERNAL_BRIDGE_LOCATOR_HPP
