#include <atomic>
#include <bridge/client.hpp>
#include <bridge/errors.hpp>
#include <bridge/protocol/messages.hpp>
#include <bridge/protocol/pending.hpp>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <spdlog/spdlog.h>

namespace bridge
{

namespace
{

constexpr const char* READY_EVENT = "ready";
constexpr const char* MESSAGE_EVENT = "message";

constexpr const char* NOT_RUNNING_MESSAGE =
    "Bridge process is not running. Please restart the application.";

constexpr const char* SHUTDOWN_MESSAGE = "Bridge client was shut down with the request in flight";

constexpr const char* OUTPUT_CLOSED_MESSAGE =
    "Bridge process closed unexpectedly: output stream ended. Please check the bridge service "
    "logs and restart the application.";

} // namespace

// BridgeClient::Impl - correlation, routing and readiness on top of a Transport
class BridgeClient::Impl
{
  public:
    Impl(const BridgeOptions& options, std::unique_ptr<Transport> transport)
        : options_(options),
          logger_(options.logger ? options.logger : spdlog::default_logger()),
          transport_(transport ? std::move(transport) : create_subprocess_transport(options))
    {
    }

    ~Impl()
    {
        shutdown();
    }

    void start()
    {
        TransportCallbacks callbacks;
        callbacks.on_stdout_line = [this](const std::string& line) { handle_line(line); };
        callbacks.on_stderr_line = [this](const std::string& line) { handle_stderr_line(line); };
        callbacks.on_closed = [this]() { handle_closed(); };

        transport_->start(std::move(callbacks));
        wait_for_ready();
    }

    // Readiness gate: bounded, and a timeout is not an error
    void wait_for_ready()
    {
        std::unique_lock<std::mutex> lock(ready_mutex_);
        bool settled = ready_cv_.wait_for(lock, options_.ready_timeout,
                                          [this] { return ready_ || closed_; });

        if (ready_)
            return;
        if (settled)
            logger_->warn("Bridge process exited before reporting ready");
        else
            logger_->warn("Bridge did not report ready within {} ms; continuing without it",
                          options_.ready_timeout.count());
    }

    bool is_ready() const
    {
        std::lock_guard<std::mutex> lock(ready_mutex_);
        return ready_;
    }

    bool is_alive() const
    {
        return transport_->is_open() && is_ready();
    }

    std::future<json> send_async(const std::string& method, const json& params)
    {
        if (!is_alive())
            throw ProcessNotRunningError(NOT_RUNNING_MESSAGE);

        protocol::Request request;
        request.id = next_id_.fetch_add(1);
        request.method = method;
        request.params = params;
        std::string line = protocol::serialize_request(request);

        // Registered before the write so an immediate reply always finds its entry
        auto future = pending_.register_request(request.id);
        logger_->debug("Sending request {} ({})", request.id, method);

        try
        {
            transport_->write_line(line);
        }
        catch (const BridgeError&)
        {
            pending_.remove(request.id);
            throw;
        }

        return future;
    }

    void shutdown()
    {
        shutting_down_ = true;
        transport_->close();

        std::size_t failed = pending_.fail_all(SHUTDOWN_MESSAGE);
        if (failed > 0)
            logger_->debug("Failed {} in-flight request(s) on shutdown", failed);
    }

    // Stdout demultiplexer: runs on the transport's stdout reader thread
    void handle_line(const std::string& line)
    {
        logger_->debug("Bridge stdout: {}", line);

        auto message = protocol::classify_line(line);

        if (auto* response = std::get_if<protocol::Response>(&message))
        {
            if (!pending_.complete(*response))
                logger_->warn("Received response for unknown request id {}", response->id);
            return;
        }

        if (auto* event = std::get_if<protocol::Event>(&message))
        {
            handle_event(*event);
            return;
        }

        logger_->warn("Unknown message from bridge: {}", line);
    }

    void handle_event(const protocol::Event& event)
    {
        if (event.event == READY_EVENT)
        {
            // Logged first: the constructor may return as soon as it is notified
            logger_->info("Bridge service ready");
            {
                std::lock_guard<std::mutex> lock(ready_mutex_);
                ready_ = true;
            }
            ready_cv_.notify_all();
            return;
        }

        if (event.event == MESSAGE_EVENT)
        {
            if (!options_.event_callback)
            {
                logger_->debug("No event sink configured; dropping message event");
                return;
            }
            try
            {
                (*options_.event_callback)(MESSAGE_STREAM_CHANNEL, event.data);
            }
            catch (const std::exception& e)
            {
                logger_->error("Event callback threw: {}", e.what());
            }
            return;
        }

        logger_->warn("Unknown event from bridge: {}", event.event);
    }

    // Stderr relay: verbatim to the log, then to the optional callback
    void handle_stderr_line(const std::string& line)
    {
        logger_->info("[bridge stderr] {}", line);

        if (!options_.stderr_callback)
            return;
        try
        {
            (*options_.stderr_callback)(line);
        }
        catch (const std::exception& e)
        {
            logger_->error("Stderr callback threw: {}", e.what());
        }
    }

    void handle_closed()
    {
        {
            std::lock_guard<std::mutex> lock(ready_mutex_);
            closed_ = true;
        }
        ready_cv_.notify_all();

        std::size_t failed =
            pending_.fail_all(shutting_down_ ? SHUTDOWN_MESSAGE : OUTPUT_CLOSED_MESSAGE);
        if (failed > 0)
            logger_->warn("Bridge output closed with {} request(s) in flight", failed);
    }

    BridgeOptions options_;
    std::shared_ptr<spdlog::logger> logger_;

    protocol::PendingRegistry pending_;
    std::atomic<std::uint64_t> next_id_{1};

    mutable std::mutex ready_mutex_;
    std::condition_variable ready_cv_;
    bool ready_ = false;
    bool closed_ = false;
    std::atomic<bool> shutting_down_{false};

    // Declared last: destroyed (and its reader threads stopped) first
    std::unique_ptr<Transport> transport_;
};

BridgeClient::BridgeClient(const BridgeOptions& options)
    : BridgeClient(options, nullptr)
{
}

BridgeClient::BridgeClient(const BridgeOptions& options, std::unique_ptr<Transport> transport)
    : impl_(std::make_unique<Impl>(options, std::move(transport)))
{
    impl_->start();
}

BridgeClient::~BridgeClient() = default;

BridgeClient::BridgeClient(BridgeClient&&) noexcept = default;
BridgeClient& BridgeClient::operator=(BridgeClient&&) noexcept = default;

bool BridgeClient::is_alive() const
{
    return impl_->is_alive();
}

bool BridgeClient::is_ready() const
{
    return impl_->is_ready();
}

long BridgeClient::get_pid() const
{
    return impl_->transport_->get_pid();
}

std::size_t BridgeClient::pending_requests() const
{
    return impl_->pending_.size();
}

std::future<json> BridgeClient::send_request_async(const std::string& method, const json& params)
{
    return impl_->send_async(method, params);
}

json BridgeClient::send_request(const std::string& method, const json& params)
{
    return send_request_async(method, params).get();
}

json BridgeClient::launch(const std::string& profile, const std::string& provider,
                          const json& config)
{
    return send_request("launch", {{"profile", profile}, {"provider", provider}, {"config", config}});
}

json BridgeClient::send_message(const std::string& profile, const std::string& message)
{
    return send_request("sendMessage", {{"profile", profile}, {"message", message}});
}

json BridgeClient::stop(const std::string& profile)
{
    return send_request("stop", {{"profile", profile}});
}

json BridgeClient::list_providers()
{
    return send_request("listProviders");
}

json BridgeClient::check_auth(const std::string& provider, const std::string& profile_name)
{
    return send_request("checkAuth", {{"provider", provider}, {"profileName", profile_name}});
}

json BridgeClient::login_with_api_key(const std::string& profile_name, const std::string& provider,
                                      const std::string& api_key,
                                      const std::optional<json>& metadata)
{
    json params = {{"profileName", profile_name}, {"provider", provider}, {"apiKey", api_key}};
    if (metadata && !metadata->is_null())
        params["metadata"] = *metadata;
    return send_request("loginWithApiKey", params);
}

json BridgeClient::get_auth_options(const std::string& profile_name, const std::string& provider)
{
    return send_request("getAuthOptions", {{"profileName", profile_name}, {"provider", provider}});
}

json BridgeClient::link_existing_credential(const std::string& profile_name,
                                            const std::string& provider)
{
    return send_request("linkExistingCredential",
                        {{"profileName", profile_name}, {"provider", provider}});
}

json BridgeClient::list_profiles()
{
    return send_request("listProfiles");
}

json BridgeClient::create_profile(const std::string& name, const std::string& provider)
{
    return send_request("createProfile", {{"name", name}, {"provider", provider}});
}

json BridgeClient::switch_profile(const std::string& profile_id)
{
    return send_request("switchProfile", {{"profileId", profile_id}});
}

json BridgeClient::delete_profile(const std::string& profile_id)
{
    return send_request("deleteProfile", {{"profileId", profile_id}});
}

json BridgeClient::get_current_profile()
{
    return send_request("getCurrentProfile");
}

void BridgeClient::shutdown()
{
    impl_->shutdown();
}

} // namespace bridge
