/**
 * @file error_handling.cpp
 * @brief Error handling with the provider bridge client
 *
 * Demonstrates:
 * - Construction failures (missing script, unrunnable interpreter)
 * - Remote errors reported by the bridge
 * - Fast failure once the bridge process is gone
 */

#include <bridge/bridge.hpp>
#include <iostream>
#include <string>

void print_scenario(const std::string& scenario)
{
    std::cout << "\n" << std::string(60, '=') << "\n";
    std::cout << "Scenario: " << scenario << "\n";
    std::cout << std::string(60, '=') << "\n\n";
}

void example_missing_script()
{
    print_scenario("Missing bridge script");

    bridge::BridgeOptions opts;
    opts.bridge_path = "/this/path/does/not/exist/provider-bridge.js";

    try
    {
        bridge::BridgeClient client(opts);
    }
    catch (const bridge::BridgeNotFoundError& e)
    {
        std::cerr << "Not found: " << e.what() << "\n";
        std::cerr << "Build the bridge with 'npm run build' or set PROVIDER_BRIDGE_PATH.\n";
    }
}

void example_remote_error(bridge::BridgeClient& client)
{
    print_scenario("Remote error");

    try
    {
        client.switch_profile("no-such-profile");
    }
    catch (const bridge::RemoteError& e)
    {
        // The bridge's message, verbatim
        std::cerr << "Bridge said: " << e.what() << "\n";
    }
}

void example_after_shutdown(bridge::BridgeClient& client)
{
    print_scenario("Calls after shutdown");

    client.shutdown();
    client.shutdown(); // no-op

    try
    {
        client.list_providers();
    }
    catch (const bridge::ProcessNotRunningError& e)
    {
        std::cerr << "Not running: " << e.what() << "\n";
    }
}

int main()
{
    example_missing_script();

    try
    {
        bridge::BridgeClient client;
        example_remote_error(client);
        example_after_shutdown(client);
    }
    catch (const bridge::BridgeError& e)
    {
        std::cerr << "Bridge unavailable: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
