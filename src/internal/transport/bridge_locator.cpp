#include "bridge_locator.hpp"

#include "../subprocess/process.hpp"

#include <bridge/errors.hpp>
#include <cstdlib>
#include <filesystem>
#include <spdlog/spdlog.h>
#include <vector>

#if defined(_WIN32)
#include <windows.h>
#elif defined(__APPLE__)
#include <mach-o/dyld.h>
#endif

namespace bridge
{
namespace internal
{

namespace fs = std::filesystem;

namespace
{

std::optional<std::string> env_value(const char* name)
{
    const char* value = std::getenv(name);
    if (value == nullptr || value[0] == '\0')
        return std::nullopt;
    return std::string(value);
}

bool is_file(const fs::path& path)
{
    std::error_code ec;
    return fs::is_regular_file(path, ec);
}

std::string absolute_string(const fs::path& path)
{
    std::error_code ec;
    fs::path abs = fs::absolute(path, ec);
    return ec ? path.string() : abs.lexically_normal().string();
}

std::string current_directory()
{
    std::error_code ec;
    fs::path cwd = fs::current_path(ec);
    return ec ? std::string("<unknown>") : cwd.string();
}

} // namespace

std::optional<std::string> executable_directory()
{
#if defined(_WIN32)
    std::vector<char> buffer(MAX_PATH);
    for (;;)
    {
        DWORD len = GetModuleFileNameA(nullptr, buffer.data(), static_cast<DWORD>(buffer.size()));
        if (len == 0)
            return std::nullopt;
        if (len < buffer.size())
            return fs::path(std::string(buffer.data(), len)).parent_path().string();
        buffer.resize(buffer.size() * 2);
    }
#elif defined(__APPLE__)
    uint32_t size = 0;
    _NSGetExecutablePath(nullptr, &size);
    std::vector<char> buffer(size + 1, '\0');
    if (_NSGetExecutablePath(buffer.data(), &size) != 0)
        return std::nullopt;
    std::error_code ec;
    fs::path exe = fs::canonical(buffer.data(), ec);
    return ec ? fs::path(buffer.data()).parent_path().string() : exe.parent_path().string();
#else
    std::error_code ec;
    fs::path exe = fs::read_symlink("/proc/self/exe", ec);
    if (ec)
        return std::nullopt;
    return exe.parent_path().string();
#endif
}

std::string locate_bridge_script(const BridgeOptions& options, spdlog::logger& log)
{
    // Explicit locations are taken at their word
    auto check_explicit = [&](const std::string& path, const char* source) -> std::string
    {
        if (!is_file(path))
            throw BridgeNotFoundError(std::string("Bridge script from ") + source +
                                      " does not exist: " + path);
        log.debug("Using bridge script from {}: {}", source, path);
        return absolute_string(path);
    };

    if (!options.bridge_path.empty())
        return check_explicit(options.bridge_path, "options");

    if (auto env_path = env_value(BRIDGE_PATH_ENV))
        return check_explicit(*env_path, BRIDGE_PATH_ENV);

    // Packaged location next to the application
    std::optional<std::string> resource_dir;
    if (!options.resource_dir.empty())
        resource_dir = options.resource_dir;
    else
        resource_dir = executable_directory();

    if (resource_dir)
    {
        fs::path candidate = fs::path(*resource_dir) / BRIDGE_RELATIVE_PATH;
        log.debug("Looking for bridge script at {}", candidate.string());
        if (is_file(candidate))
            return absolute_string(candidate);
    }

    // Development layout: walk up from the start directory
    std::string start = options.search_start.empty() ? current_directory() : options.search_start;
    fs::path dir = start;
    for (int level = 0; level < options.search_depth; ++level)
    {
        fs::path candidate = dir / BRIDGE_RELATIVE_PATH;
        log.debug("Looking for bridge script at {}", candidate.string());
        if (is_file(candidate))
            return absolute_string(candidate);

        if (!dir.has_parent_path() || dir.parent_path() == dir)
            break;
        dir = dir.parent_path();
    }

    throw BridgeNotFoundError(std::string("Could not find bridge service (") +
                              BRIDGE_RELATIVE_PATH + "). Search started in: " + start +
                              ". Please ensure the project is built with 'npm run build' before "
                              "running the app.");
}

std::string resolve_node_executable(const BridgeOptions& options, spdlog::logger& log)
{
    if (!options.node_path.empty())
    {
        log.debug("Using node from options: {}", options.node_path);
        return options.node_path;
    }

    if (auto env_node = env_value(BRIDGE_NODE_ENV))
    {
        log.debug("Using node from {}: {}", BRIDGE_NODE_ENV, *env_node);
        return *env_node;
    }

#ifdef _WIN32
    const char* node_name = "node.exe";
#else
    const char* node_name = "node";
#endif

    if (auto found = subprocess::find_executable(node_name))
    {
        log.debug("Using node from PATH: {}", *found);
        return *found;
    }

    throw BridgeNotFoundError(std::string("Could not find '") + node_name +
                              "' in PATH. Install Node.js or set " + BRIDGE_NODE_ENV + ".");
}

} // namespace internal
} // namespace bridge
