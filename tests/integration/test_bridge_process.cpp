#include "../test_utils.hpp"

#include <atomic>
#include <bridge/client.hpp>
#include <bridge/errors.hpp>
#include <chrono>
#include <future>
#include <gtest/gtest.h>
#include <mutex>
#include <thread>
#include <vector>

// End-to-end tests against a real child process speaking the bridge protocol.
// The fake bridge stands in for `node provider-bridge.js`.

using namespace bridge;
using bridge::test::CapturingLogger;
using bridge::test::fake_bridge_options;
using bridge::test::TempDir;
using bridge::test::wait_until;

class BridgeProcessTest : public ::testing::Test
{
  protected:
    BridgeOptions options(const std::string& mode = "")
    {
        BridgeOptions opts = fake_bridge_options(mode);
        opts.logger = log_.logger;
        return opts;
    }

    CapturingLogger log_;
};

TEST_F(BridgeProcessTest, StartsAndReportsReady)
{
    BridgeClient client(options());

    EXPECT_TRUE(client.is_ready());
    EXPECT_TRUE(client.is_alive());
    EXPECT_GT(client.get_pid(), 0);
    EXPECT_TRUE(log_.contains("Bridge service ready"));
}

TEST_F(BridgeProcessTest, ListProvidersRoundTrip)
{
    BridgeClient client(options());

    json result = client.list_providers();
    ASSERT_TRUE(result.contains("providers"));
    EXPECT_EQ(result["providers"], json({"codex", "claude", "gemini"}));
    EXPECT_EQ(client.pending_requests(), 0u);
}

TEST_F(BridgeProcessTest, RemoteErrorSurfacesVerbatim)
{
    BridgeClient client(options());

    try
    {
        client.send_request("fail", {{"profile", "nope"}});
        FAIL() << "expected RemoteError";
    }
    catch (const RemoteError& e)
    {
        EXPECT_STREQ(e.what(), "invalid profile");
    }

    // Channel is unaffected
    EXPECT_TRUE(client.is_alive());
    EXPECT_EQ(client.send_request("echo", {{"x", 1}})["x"], 1);
}

TEST_F(BridgeProcessTest, UnknownMethodIsARemoteError)
{
    BridgeClient client(options());
    EXPECT_THROW(client.send_request("noSuchMethod"), RemoteError);
}

TEST_F(BridgeProcessTest, MissingResultIsNull)
{
    BridgeClient client(options());
    EXPECT_TRUE(client.send_request("noresult").is_null());
}

TEST_F(BridgeProcessTest, OutOfOrderRepliesAreCorrelated)
{
    BridgeClient client(options());

    auto a = client.send_request_async("hold");
    auto b = client.send_request_async("hold");
    auto c = client.send_request_async("hold");
    EXPECT_EQ(client.pending_requests(), 3u);

    EXPECT_EQ(client.send_request("release"), true);

    EXPECT_EQ(a.get()["released"], 1);
    EXPECT_EQ(b.get()["released"], 2);
    EXPECT_EQ(c.get()["released"], 3);
}

TEST_F(BridgeProcessTest, ConcurrentCallers)
{
    BridgeClient client(options());

    constexpr int kThreads = 6;
    constexpr int kPerThread = 25;
    std::atomic<int> mismatches{0};

    std::vector<std::thread> callers;
    for (int t = 0; t < kThreads; ++t)
    {
        callers.emplace_back(
            [&, t]
            {
                for (int i = 0; i < kPerThread; ++i)
                {
                    int n = t * 100 + i;
                    if (client.send_request("echo", {{"n", n}})["n"] != n)
                        ++mismatches;
                }
            });
    }
    for (auto& c : callers)
        c.join();

    EXPECT_EQ(mismatches.load(), 0);
    EXPECT_EQ(client.pending_requests(), 0u);
}

TEST_F(BridgeProcessTest, MessageEventsAreForwarded)
{
    std::mutex mutex;
    std::vector<std::pair<std::string, json>> received;

    BridgeOptions opts = options();
    opts.event_callback = [&](const std::string& channel, const json& data)
    {
        std::lock_guard<std::mutex> lock(mutex);
        received.emplace_back(channel, data);
    };
    BridgeClient client(opts);

    // The event line precedes the reply on the same stream
    client.send_request("emitMessage", {{"profile", "work"}, {"chunk", "Hello"}});

    std::lock_guard<std::mutex> lock(mutex);
    ASSERT_EQ(received.size(), 1u);
    EXPECT_EQ(received[0].first, MESSAGE_STREAM_CHANNEL);
    EXPECT_EQ(received[0].second["chunk"], "Hello");
}

TEST_F(BridgeProcessTest, NoiseOnStdoutIsIgnored)
{
    BridgeClient client(options());

    EXPECT_EQ(client.send_request("emitUnknown"), "ok");
    EXPECT_TRUE(log_.contains("Unknown event from bridge: progress"));
    EXPECT_TRUE(log_.contains("Unknown message from bridge: Debugger listening"));
    EXPECT_TRUE(log_.contains("unknown request id"));
    EXPECT_TRUE(client.is_alive());
}

TEST_F(BridgeProcessTest, StderrIsRelayed)
{
    std::mutex mutex;
    std::vector<std::string> lines;

    BridgeOptions opts = options();
    opts.stderr_callback = [&](const std::string& line)
    {
        std::lock_guard<std::mutex> lock(mutex);
        lines.push_back(line);
    };
    BridgeClient client(opts);

    client.send_request("stderr", {{"text", "provider warming up"}});

    // Stderr has its own reader; ordering against stdout is not guaranteed
    EXPECT_TRUE(wait_until(
        [&]
        {
            std::lock_guard<std::mutex> lock(mutex);
            for (const auto& line : lines)
                if (line == "provider warming up")
                    return true;
            return false;
        }));
    EXPECT_TRUE(wait_until([&] { return log_.contains("[bridge stderr] provider warming up"); }));
}

TEST_F(BridgeProcessTest, ChildRunsInConfiguredDirectory)
{
    TempDir dir;
    BridgeOptions opts = options();
    opts.working_directory = dir.path().string();
    BridgeClient client(opts);

    EXPECT_EQ(std::filesystem::weakly_canonical(client.send_request("cwd").get<std::string>()),
              std::filesystem::weakly_canonical(dir.path()));
}

TEST_F(BridgeProcessTest, ChildDefaultsToHomeDirectory)
{
    auto home = subprocess::home_directory();
    if (!home)
        GTEST_SKIP() << "No home directory in this environment";

    BridgeClient client(options());
    EXPECT_EQ(std::filesystem::weakly_canonical(client.send_request("cwd").get<std::string>()),
              std::filesystem::weakly_canonical(*home));
}

TEST_F(BridgeProcessTest, EnvironmentIsPassedToChild)
{
    BridgeOptions opts = options();
    opts.environment["PROVIDER_BRIDGE_TEST"] = "from-host";
    BridgeClient client(opts);

    EXPECT_EQ(client.send_request("env", {{"name", "PROVIDER_BRIDGE_TEST"}}), "from-host");
}

TEST_F(BridgeProcessTest, ReadinessTimeoutIsNotFatal)
{
    BridgeOptions opts = options("silent");
    opts.ready_timeout = std::chrono::milliseconds(200);

    auto started = std::chrono::steady_clock::now();
    BridgeClient client(opts);
    auto elapsed = std::chrono::steady_clock::now() - started;

    EXPECT_GE(elapsed, std::chrono::milliseconds(150));
    EXPECT_FALSE(client.is_ready());
    EXPECT_FALSE(client.is_alive());
    EXPECT_GT(client.get_pid(), 0);
    EXPECT_TRUE(log_.contains("did not report ready"));
    EXPECT_THROW(client.send_request("listProviders"), ProcessNotRunningError);
}

TEST_F(BridgeProcessTest, LateReadyOpensTheGate)
{
    BridgeOptions opts = options("late_ready");
    opts.ready_timeout = std::chrono::milliseconds(50);
    BridgeClient client(opts);

    EXPECT_TRUE(wait_until([&] { return client.is_alive(); }));
    EXPECT_EQ(client.list_providers()["providers"].size(), 3u);
}

TEST_F(BridgeProcessTest, ExitBeforeReadyEndsTheWaitEarly)
{
    BridgeOptions opts = options("exit_on_start");
    opts.ready_timeout = std::chrono::milliseconds(10000);

    auto started = std::chrono::steady_clock::now();
    BridgeClient client(opts);
    auto elapsed = std::chrono::steady_clock::now() - started;

    EXPECT_LT(elapsed, std::chrono::milliseconds(5000));
    EXPECT_FALSE(client.is_alive());
    EXPECT_TRUE(log_.contains("exited before reporting ready"));
}

TEST_F(BridgeProcessTest, EndOfStreamFailsInFlightThenFailsFast)
{
    BridgeClient client(options());
    EXPECT_EQ(client.list_providers()["providers"].size(), 3u);

    // The child exits without answering: stdout closes with the request in flight
    auto in_flight = client.send_request_async("exit");
    EXPECT_THROW(in_flight.get(), ProcessClosedError);

    EXPECT_TRUE(wait_until([&] { return !client.is_alive(); }));
    EXPECT_TRUE(client.is_ready());
    EXPECT_THROW(client.send_request("listProviders"), ProcessNotRunningError);
    EXPECT_EQ(client.pending_requests(), 0u);
}

TEST_F(BridgeProcessTest, ShutdownIsIdempotent)
{
    BridgeClient client(options());
    auto held = client.send_request_async("hold");

    client.shutdown();
    EXPECT_FALSE(client.is_alive());
    EXPECT_EQ(client.get_pid(), 0);
    EXPECT_THROW(held.get(), ProcessClosedError);

    client.shutdown();
    EXPECT_FALSE(client.is_alive());
    EXPECT_THROW(client.send_request("listProviders"), ProcessNotRunningError);
}

TEST_F(BridgeProcessTest, DestructorShutsDown)
{
    long pid = 0;
    {
        BridgeClient client(options());
        pid = client.get_pid();
        EXPECT_GT(pid, 0);
    }
    EXPECT_TRUE(log_.contains("Shutting down bridge process (pid " + std::to_string(pid) + ")"));
}

TEST_F(BridgeProcessTest, MissingScriptFailsConstruction)
{
    TempDir dir;
    BridgeOptions opts = options();
    opts.bridge_path = (dir.path() / "dist/bridge/provider-bridge.js").string();

    EXPECT_THROW(BridgeClient client(opts), BridgeNotFoundError);
}

TEST_F(BridgeProcessTest, UnrunnableInterpreterFailsConstruction)
{
    TempDir dir;
    BridgeOptions opts = options();
    opts.node_path = (dir.path() / "not-node").string();

    EXPECT_THROW(BridgeClient client(opts), BridgeSpawnError);
}

TEST_F(BridgeProcessTest, LargePayloadSurvivesFraming)
{
    BridgeClient client(options());

    std::string big(200 * 1024, 'z');
    EXPECT_EQ(client.send_request("echo", {{"blob", big}})["blob"].get<std::string>().size(),
              big.size());
}

TEST_F(BridgeProcessTest, MultiMegabyteReplyWithDefaultOptions)
{
    BridgeClient client(options());

    std::string big(2 * 1024 * 1024, 'z');
    auto reply = client.send_request_async("echo", {{"blob", big}});

    ASSERT_EQ(reply.wait_for(std::chrono::seconds(10)), std::future_status::ready);
    EXPECT_EQ(reply.get()["blob"].get<std::string>().size(), big.size());
    EXPECT_EQ(client.pending_requests(), 0u);
}

TEST_F(BridgeProcessTest, ReplyOverBufferLimitClosesTheChannel)
{
    BridgeOptions opts = options();
    opts.max_buffer_size = 1024;
    BridgeClient client(opts);

    auto reply = client.send_request_async("echo", {{"blob", std::string(8192, 'q')}});

    ASSERT_EQ(reply.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    EXPECT_THROW(reply.get(), ProcessClosedError);
    EXPECT_TRUE(wait_until([&] { return !client.is_alive(); }));
    EXPECT_TRUE(log_.contains("exceeded maximum size of 1024 bytes"));
    EXPECT_THROW(client.send_request("listProviders"), ProcessNotRunningError);
}

TEST_F(BridgeProcessTest, ShutdownFromEventCallbackThenDestroy)
{
    std::atomic<BridgeClient*> self{nullptr};

    BridgeOptions opts = options();
    opts.event_callback = [&](const std::string&, const json&)
    {
        if (BridgeClient* client = self.load())
            client->shutdown();
    };

    {
        BridgeClient client(opts);
        self = &client;

        auto in_flight = client.send_request_async("emitMessage", {{"chunk", "bye"}});
        ASSERT_EQ(in_flight.wait_for(std::chrono::seconds(5)), std::future_status::ready);
        EXPECT_THROW(in_flight.get(), ProcessClosedError);
        EXPECT_FALSE(client.is_alive());

        self = nullptr;
    }

    // Both readers were joined before the destructor returned
    EXPECT_TRUE(log_.contains("Bridge stdout reader stopped"));
    EXPECT_TRUE(log_.contains("Bridge stderr reader stopped"));
}
