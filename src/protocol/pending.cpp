#include <bridge/errors.hpp>
#include <bridge/protocol/pending.hpp>
#include <stdexcept>
#include <utility>
#include <vector>

namespace bridge
{
namespace protocol
{

PendingRegistry::~PendingRegistry()
{
    // Wake anyone still waiting rather than leaving them with a broken promise
    fail_all("Bridge client shutting down");
}

std::future<json> PendingRegistry::register_request(std::uint64_t id)
{
    std::lock_guard<std::mutex> lock(mutex_);

    std::promise<json> promise;
    auto future = promise.get_future();

    if (!pending_.emplace(id, std::move(promise)).second)
        throw std::logic_error("Request id already pending: " + std::to_string(id));

    return future;
}

bool PendingRegistry::take(std::uint64_t id, std::promise<json>& out)
{
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = pending_.find(id);
    if (it == pending_.end())
        return false;

    out = std::move(it->second);
    pending_.erase(it);
    return true;
}

bool PendingRegistry::remove(std::uint64_t id)
{
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.erase(id) > 0;
}

bool PendingRegistry::complete(const Response& response)
{
    if (response.error)
        return reject(response.id, std::make_exception_ptr(RemoteError(*response.error)));
    return resolve(response.id, response.result.value_or(json(nullptr)));
}

bool PendingRegistry::resolve(std::uint64_t id, json result)
{
    std::promise<json> promise;
    if (!take(id, promise))
        return false;

    // A dropped future leaves the shared state alive; setting it is a no-op for the caller
    promise.set_value(std::move(result));
    return true;
}

bool PendingRegistry::reject(std::uint64_t id, std::exception_ptr error)
{
    std::promise<json> promise;
    if (!take(id, promise))
        return false;

    promise.set_exception(std::move(error));
    return true;
}

std::size_t PendingRegistry::fail_all(const std::string& reason)
{
    std::vector<std::promise<json>> failed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        failed.reserve(pending_.size());
        for (auto& [id, promise] : pending_)
            failed.push_back(std::move(promise));
        pending_.clear();
    }

    for (auto& promise : failed)
        promise.set_exception(std::make_exception_ptr(ProcessClosedError(reason)));

    return failed.size();
}

bool PendingRegistry::contains(std::uint64_t id) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.count(id) > 0;
}

std::size_t PendingRegistry::size() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

bool PendingRegistry::empty() const
{
    return size() == 0;
}

} // namespace protocol
} // namespace bridge
