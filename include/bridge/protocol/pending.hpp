#ifndef BRIDGE_PROTOCOL_PENDING_HPP
#define BRIDGE_PROTOCOL_PENDING_HPP

#include <bridge/protocol/messages.hpp>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <future>
#include <mutex>
#include <string>
#include <unordered_map>

namespace bridge
{
namespace protocol
{

// Pending request registry - correlates in-flight request ids with the
// single-use promise each caller is waiting on.
//
// Every operation holds the registry lock only for one insert, erase or
// lookup-and-erase. Promises are fulfilled after the lock is released, so a
// caller resuming on its future never contends with the reader thread.
class PendingRegistry
{
  public:
    PendingRegistry() = default;
    ~PendingRegistry();

    // No copy
    PendingRegistry(const PendingRegistry&) = delete;
    PendingRegistry& operator=(const PendingRegistry&) = delete;

    // Register a fresh completion handle under id and return its future.
    // Throws std::logic_error if the id is already pending.
    std::future<json> register_request(std::uint64_t id);

    // Remove an entry without completing it. Returns false if id was not pending.
    bool remove(std::uint64_t id);

    // Resolve an entry from a response: a present `error` rejects with
    // RemoteError, otherwise the result (or null) is delivered.
    // Returns false if no entry was pending for response.id.
    bool complete(const Response& response);

    // Resolve an entry with success
    bool resolve(std::uint64_t id, json result);

    // Reject an entry with an exception
    bool reject(std::uint64_t id, std::exception_ptr error);

    // Reject every pending entry with ProcessClosedError(reason).
    // Returns the number of entries failed.
    std::size_t fail_all(const std::string& reason);

    bool contains(std::uint64_t id) const;
    std::size_t size() const;
    bool empty() const;

  private:
    // Lookup-and-erase; returns false if absent
    bool take(std::uint64_t id, std::promise<json>& out);

    std::unordered_map<std::uint64_t, std::promise<json>> pending_;
    mutable std::mutex mutex_;
};

} // namespace protocol
} // namespace bridge

#endif // BRIDGE_PROTOCOL_PENDING_HPP
