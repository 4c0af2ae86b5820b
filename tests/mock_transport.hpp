#pragma once

#include <bridge/errors.hpp>
#include <bridge/transport.hpp>
#include <functional>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace bridge::test
{

// In-memory transport: records written lines and lets the test play the
// bridge by pushing stdout/stderr lines synchronously on the calling thread.
//
// State lives in a shared block so the test keeps access after the client
// takes ownership of the transport.
class MockTransport : public Transport
{
  public:
    struct State
    {
        std::mutex mutex;
        TransportCallbacks callbacks;
        std::vector<std::string> written;
        bool started = false;
        bool open = false;
        bool fail_writes = false;
        int close_calls = 0;

        // Optional auto-reply: given a written request, the line to answer with
        std::function<std::optional<std::string>(const nlohmann::json&)> responder;
    };

    explicit MockTransport(std::shared_ptr<State> state, bool ready_on_start = true)
        : state_(std::move(state)), ready_on_start_(ready_on_start)
    {
    }

    ~MockTransport() override
    {
        close();
    }

    void start(TransportCallbacks callbacks) override
    {
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            state_->callbacks = std::move(callbacks);
            state_->started = true;
            state_->open = true;
        }
        if (ready_on_start_)
            push_line(*state_, R"({"event":"ready","data":{"status":"initialized"}})");
    }

    void write_line(const std::string& line) override
    {
        decltype(state_->responder) responder;
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            if (!state_->open)
                throw ProcessNotRunningError(
                    "Bridge stdin not available. Please restart the application.");
            if (state_->fail_writes)
                throw ProcessClosedError(
                    "Bridge process closed unexpectedly: Broken pipe. Please check the bridge "
                    "service logs and restart the application.");
            state_->written.push_back(line);
            responder = state_->responder;
        }

        if (responder)
        {
            if (auto reply = responder(nlohmann::json::parse(line)))
                push_line(*state_, *reply);
        }
    }

    bool is_open() const override
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        return state_->open;
    }

    void close() override
    {
        bool was_open;
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            ++state_->close_calls;
            was_open = state_->open;
            state_->open = false;
        }
        if (was_open && state_->callbacks.on_closed)
            state_->callbacks.on_closed();
    }

    long get_pid() const override
    {
        return is_open() ? 4242 : 0;
    }

    // Bridge side -------------------------------------------------------------

    static void push_line(State& state, const std::string& line)
    {
        if (state.callbacks.on_stdout_line)
            state.callbacks.on_stdout_line(line);
    }

    static void push_stderr(State& state, const std::string& line)
    {
        if (state.callbacks.on_stderr_line)
            state.callbacks.on_stderr_line(line);
    }

    // Simulates EOF on stdout: stdin is cleared, then the close handler runs
    static void end_of_stream(State& state)
    {
        {
            std::lock_guard<std::mutex> lock(state.mutex);
            state.open = false;
        }
        if (state.callbacks.on_closed)
            state.callbacks.on_closed();
    }

    static std::vector<nlohmann::json> written_json(State& state)
    {
        std::lock_guard<std::mutex> lock(state.mutex);
        std::vector<nlohmann::json> out;
        for (const auto& line : state.written)
            out.push_back(nlohmann::json::parse(line));
        return out;
    }

  private:
    std::shared_ptr<State> state_;
    bool ready_on_start_;
};

} // namespace bridge::test
