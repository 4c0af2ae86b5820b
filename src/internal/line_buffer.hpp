#ifndef BRIDGE_INTERNAL_LINE_BUFFER_HPP
#define BRIDGE_INTERNAL_LINE_BUFFER_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace bridge
{
namespace protocol
{

// Reassembles newline-delimited lines from arbitrary read chunks
class LineBuffer
{
  public:
    // No limit unless max_buffer_size is given
    explicit LineBuffer(std::optional<std::size_t> max_buffer_size = std::nullopt);

    // Append a chunk and return every line it completed, newline and trailing
    // '\r' stripped. Blank lines are skipped.
    // If the unterminated remainder outgrows the limit it is dropped and the
    // buffer is marked overflowed: lines completed by this chunk are still
    // returned, but further add_data() calls throw MessageFramingError until
    // clear_buffer().
    std::vector<std::string> add_data(const char* data, std::size_t size);
    std::vector<std::string> add_data(const std::string& data);

    // Hand out what is left once the stream ends; nullopt if nothing is buffered
    std::optional<std::string> take_remainder();

    bool overflowed() const
    {
        return overflowed_;
    }

    // Check if buffer has buffered data
    bool has_buffered_data() const
    {
        return !buffer_.empty();
    }

    // Clear buffer and any overflow
    void clear_buffer()
    {
        buffer_.clear();
        overflowed_ = false;
    }

  private:
    std::string buffer_;
    std::optional<std::size_t> max_buffer_size_;
    bool overflowed_ = false;

    // Try to extract one complete line from buffer
    std::optional<std::string> extract_line();
};

} // namespace protocol
} // namespace bridge

#endif // BRIDGE_INTERNAL_LINE_BUFFER_HPP
