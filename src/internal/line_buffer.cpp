#include "line_buffer.hpp"

#include <bridge/errors.hpp>

namespace bridge
{
namespace protocol
{

namespace
{

void strip_carriage_return(std::string& line)
{
    while (!line.empty() && line.back() == '\r')
        line.pop_back();
}

bool is_blank(const std::string& line)
{
    return line.find_first_not_of(" \t") == std::string::npos;
}

} // namespace

LineBuffer::LineBuffer(std::optional<std::size_t> max_buffer_size)
    : max_buffer_size_(max_buffer_size)
{
}

std::vector<std::string> LineBuffer::add_data(const std::string& data)
{
    return add_data(data.data(), data.size());
}

std::vector<std::string> LineBuffer::add_data(const char* data, std::size_t size)
{
    if (overflowed_)
        throw MessageFramingError("Line from bridge exceeded maximum size of " +
                                  std::to_string(*max_buffer_size_) + " bytes");

    std::vector<std::string> lines;
    buffer_.append(data, size);

    while (auto line = extract_line())
    {
        strip_carriage_return(*line);
        if (is_blank(*line))
            continue;
        lines.push_back(std::move(*line));
    }

    // Only the unterminated tail counts against the limit
    if (max_buffer_size_ && buffer_.size() > *max_buffer_size_)
    {
        buffer_.clear();
        overflowed_ = true;
    }

    return lines;
}

std::optional<std::string> LineBuffer::take_remainder()
{
    if (overflowed_)
        return std::nullopt;

    std::string rest;
    rest.swap(buffer_);
    strip_carriage_return(rest);
    if (is_blank(rest))
        return std::nullopt;
    return rest;
}

std::optional<std::string> LineBuffer::extract_line()
{
    std::size_t pos = buffer_.find('\n');
    if (pos == std::string::npos)
        return std::nullopt;

    std::string line = buffer_.substr(0, pos);
    buffer_.erase(0, pos + 1);

    return line;
}

} // namespace protocol
} // namespace bridge
