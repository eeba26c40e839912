#ifndef MCPMGR_INTERNAL_LINE_BUFFER_HPP
#define MCPMGR_INTERNAL_LINE_BUFFER_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace mcpmgr
{
namespace internal
{

// Splits a byte stream into newline-terminated lines
class LineBuffer
{
  public:
    explicit LineBuffer(std::size_t max_buffer_size = 1024 * 1024);

    // Add data and return every line it completed (without '\n' or a trailing '\r').
    // Blank lines are skipped. Throws JSONDecodeError when an unterminated line
    // grows beyond the maximum size; the buffer is cleared in that case.
    std::vector<std::string> add_data(const std::string& data);

    // Partial line left when the stream ended
    std::optional<std::string> take_remainder();

    bool has_buffered_data() const
    {
        return !buffer_.empty();
    }

    void clear_buffer()
    {
        buffer_.clear();
    }

  private:
    std::string buffer_;
    std::size_t max_buffer_size_;
};

} // namespace internal
} // namespace mcpmgr

#endif // MCPMGR_INTERNAL_LINE_BUFFER_HPP
