/**
 * @file message_stream.cpp
 * @brief Launch a provider session and print its streamed messages
 *
 * Usage: message_stream <profile> <provider> <message>
 *
 * The bridge streams provider output as "message" events, which arrive on the
 * event callback under the "message-stream" channel while requests are in flight.
 */

#include <bridge/bridge.hpp>
#include <chrono>
#include <iostream>
#include <spdlog/spdlog.h>
#include <thread>

int main(int argc, char** argv)
{
    if (argc < 4)
    {
        std::cerr << "Usage: " << argv[0] << " <profile> <provider> <message>\n";
        return 2;
    }

    const std::string profile = argv[1];
    const std::string provider = argv[2];
    const std::string message = argv[3];

    spdlog::set_level(spdlog::level::info);

    bridge::BridgeOptions opts;
    opts.event_callback = [](const std::string& channel, const bridge::json& data)
    {
        // Runs on the reader thread: keep it short
        std::cout << "[" << channel << "] " << data.dump() << std::endl;
    };
    opts.stderr_callback = [](const std::string& line)
    { std::cerr << "bridge: " << line << std::endl; };

    try
    {
        bridge::BridgeClient client(opts);

        auto auth = client.check_auth(provider, profile);
        std::cout << "Auth status: " << auth.dump() << "\n";

        client.launch(profile, provider, bridge::json::object());
        client.send_message(profile, message);

        // Give the provider time to stream its answer
        std::this_thread::sleep_for(std::chrono::seconds(10));

        client.stop(profile);
    }
    catch (const bridge::BridgeError& e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
