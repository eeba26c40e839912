#include "line_buffer.hpp"

#include <mcpmgr/errors.hpp>

namespace mcpmgr
{
namespace internal
{

namespace
{
bool is_blank(const std::string& line)
{
    return line.find_first_not_of(" \t\r") == std::string::npos;
}
} // namespace

LineBuffer::LineBuffer(std::size_t max_buffer_size) : max_buffer_size_(max_buffer_size) {}

std::vector<std::string> LineBuffer::add_data(const std::string& data)
{
    buffer_ += data;

    std::vector<std::string> lines;
    std::size_t start = 0;
    std::size_t pos;
    while ((pos = buffer_.find('\n', start)) != std::string::npos)
    {
        std::string line = buffer_.substr(start, pos - start);
        start = pos + 1;

        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        if (!is_blank(line))
            lines.push_back(std::move(line));
    }
    buffer_.erase(0, start);

    if (buffer_.size() > max_buffer_size_)
    {
        std::size_t size = buffer_.size();
        buffer_.clear();
        throw JSONDecodeError("Buffer exceeded maximum size of " +
                              std::to_string(max_buffer_size_) + " bytes (was " +
                              std::to_string(size) + ")");
    }

    return lines;
}

std::optional<std::string> LineBuffer::take_remainder()
{
    if (buffer_.empty() || is_blank(buffer_))
    {
        buffer_.clear();
        return std::nullopt;
    }

    std::string rest;
    rest.swap(buffer_);
    if (rest.back() == '\r')
        rest.pop_back();
    return rest;
}

} // namespace internal
} // namespace mcpmgr
