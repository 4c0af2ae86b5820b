#include <bridge/protocol/messages.hpp>

namespace bridge
{
namespace protocol
{

namespace
{

std::optional<Response> response_from_json(const json& j)
{
    if (!j.is_object())
        return std::nullopt;

    auto id_it = j.find("id");
    if (id_it == j.end() || !id_it->is_number_unsigned())
        return std::nullopt;

    Response response;
    response.id = id_it->get<std::uint64_t>();

    // An explicit null counts as absent for both optional members
    auto error_it = j.find("error");
    if (error_it != j.end() && !error_it->is_null())
    {
        if (!error_it->is_string())
            return std::nullopt;
        response.error = error_it->get<std::string>();
    }

    auto result_it = j.find("result");
    if (result_it != j.end() && !result_it->is_null())
        response.result = *result_it;

    return response;
}

std::optional<Event> event_from_json(const json& j)
{
    if (!j.is_object())
        return std::nullopt;

    auto event_it = j.find("event");
    if (event_it == j.end() || !event_it->is_string())
        return std::nullopt;

    auto data_it = j.find("data");
    if (data_it == j.end())
        return std::nullopt;

    Event event;
    event.event = event_it->get<std::string>();
    event.data = *data_it;
    return event;
}

json parse_or_discarded(const std::string& line)
{
    // No exceptions: a malformed line is an expected input, not an error
    return json::parse(line, nullptr, false);
}

} // namespace

std::string serialize_request(const Request& request)
{
    json msg = {{"id", request.id}, {"method", request.method}, {"params", request.params}};
    return msg.dump() + "\n";
}

std::optional<Response> parse_response(const std::string& line)
{
    json j = parse_or_discarded(line);
    if (j.is_discarded())
        return std::nullopt;
    return response_from_json(j);
}

std::optional<Event> parse_event(const std::string& line)
{
    json j = parse_or_discarded(line);
    if (j.is_discarded())
        return std::nullopt;
    return event_from_json(j);
}

IncomingMessage classify_line(const std::string& line)
{
    json j = parse_or_discarded(line);
    if (!j.is_discarded())
    {
        if (auto response = response_from_json(j))
            return std::move(*response);
        if (auto event = event_from_json(j))
            return std::move(*event);
    }
    return UnknownMessage{line};
}

} // namespace protocol
} // namespace bridge
