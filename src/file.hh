#ifndef file_hh_INCLUDED
#define file_hh_INCLUDED

#include "exception.hh"
#include "string.hh"
#include "units.hh"
#include "utils.hh"

#include <cstring>
#include <exception>

namespace Tabgrid
{

struct file_access_error : runtime_error
{
    file_access_error(StringView filename, StringView error_desc);
    file_access_error(int fd, StringView error_desc);
};

bool fd_readable(int fd);
String read_fd(int fd);
String read_file(StringView filename);
void write(int fd, StringView data);
// opens filename for appending, creating it when needed
int open_append(StringView filename);

template<int buffer_size = 4096>
struct BufferedWriter
{
    BufferedWriter(int fd)
      : m_fd{fd}, m_exception_count{std::uncaught_exceptions()} {}

    ~BufferedWriter() noexcept(false)
    {
        if (m_pos != 0 and m_exception_count == std::uncaught_exceptions())
            flush();
    }

    void write(StringView data)
    {
        while (not data.empty())
        {
            const ByteCount length = data.length();
            const ByteCount write_len = clamp(length, ByteCount{0}, size - m_pos);
            memcpy(m_buffer + (int)m_pos, data.data(), (int)write_len);
            m_pos += write_len;
            if (m_pos == size)
                flush();
            data = data.substr(write_len);
        }
    }

    void flush()
    {
        Tabgrid::write(m_fd, {m_buffer, m_pos});
        m_pos = 0;
    }

private:
    static constexpr ByteCount size = buffer_size;
    int m_fd;
    int m_exception_count;
    ByteCount m_pos = 0;
    char m_buffer[(int)size];
};

}

#endif // file_hh_INCLUDED
