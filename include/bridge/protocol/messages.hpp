#ifndef BRIDGE_PROTOCOL_MESSAGES_HPP
#define BRIDGE_PROTOCOL_MESSAGES_HPP

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <variant>

namespace bridge
{

// JSON type alias (also exported by types.hpp)
using json = nlohmann::json;

namespace protocol
{

// Request - sent from the app to the bridge, one per line
struct Request
{
    std::uint64_t id = 0;
    std::string method;
    json params = json::object();
};

// Response - received from the bridge, correlated to a Request by id
struct Response
{
    std::uint64_t id = 0;
    std::optional<json> result;
    std::optional<std::string> error;
};

// Event - received from the bridge, not correlated to any request
struct Event
{
    std::string event;
    json data;
};

// A line that is neither a Response nor an Event
struct UnknownMessage
{
    std::string raw;
};

using IncomingMessage = std::variant<Response, Event, UnknownMessage>;

// Serialize a request as a single newline-terminated line
std::string serialize_request(const Request& request);

// Structural parsers. Both return nullopt if the line does not have the shape.
// A Response needs an unsigned integer `id`; `result` may be any value and
// `error` must be a string or null when present.
std::optional<Response> parse_response(const std::string& line);
// An Event needs a string `event` and a `data` member of any type.
std::optional<Event> parse_event(const std::string& line);

// Classify an incoming line. The Response shape takes precedence over the
// Event shape; anything else is returned as UnknownMessage.
IncomingMessage classify_line(const std::string& line);

} // namespace protocol
} // namespace bridge

#endif // BRIDGE_PROTOCOL_MESSAGES_HPP
