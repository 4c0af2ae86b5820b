#include <bridge/bridge.hpp>
#include <chrono>
#include <iostream>

constexpr bool TIMING = true;

int main()
{
    std::cout << "Provider bridge client version: " << bridge::version_string() << "\n\n";

    bridge::BridgeOptions opts;
    // Optional overrides; the defaults search the packaged resources and the
    // project tree for dist/bridge/provider-bridge.js and use `node` from PATH
    // opts.bridge_path = "/path/to/dist/bridge/provider-bridge.js";
    // opts.node_path = "/usr/local/bin/node";

    try
    {
        auto start = std::chrono::steady_clock::now();
        bridge::BridgeClient client(opts);
        auto started = std::chrono::steady_clock::now();

        if (TIMING)
            std::cout << "Bridge started in "
                      << std::chrono::duration_cast<std::chrono::milliseconds>(started - start)
                             .count()
                      << " ms (pid " << client.get_pid() << ")\n";

        if (!client.is_alive())
        {
            std::cerr << "Bridge did not become ready\n";
            return 1;
        }

        auto providers = client.list_providers();
        std::cout << "Providers: " << providers.dump() << "\n";

        auto profiles = client.list_profiles();
        std::cout << "Profiles: " << profiles.dump(2) << "\n";

        auto current = client.get_current_profile();
        std::cout << "Current profile: " << current.dump() << "\n";

        client.shutdown();
    }
    catch (const bridge::BridgeNotFoundError& e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
    catch (const bridge::BridgeSpawnError& e)
    {
        std::cerr << "Error: bridge could not be started - " << e.what() << "\n";
        return 1;
    }
    catch (const bridge::RemoteError& e)
    {
        std::cerr << "Bridge reported an error: " << e.what() << "\n";
        return 1;
    }
    catch (const bridge::BridgeError& e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
