#include "file.hh"

#include "assert.hh"
#include "format.hh"

#include <cerrno>
#include <fcntl.h>
#include <sys/select.h>
#include <unistd.h>

namespace Tabgrid
{

file_access_error::file_access_error(StringView filename,
                                     StringView error_desc)
    : runtime_error(format("{}: {}", filename, error_desc)) {}

file_access_error::file_access_error(int fd, StringView error_desc)
    : runtime_error(format("fd {}: {}", fd, error_desc)) {}

bool fd_readable(int fd)
{
    tg_assert(fd >= 0);
    fd_set  rfds;
    FD_ZERO(&rfds);
    FD_SET(fd, &rfds);

    timeval tv{0,0};
    return select(fd+1, &rfds, nullptr, nullptr, &tv) == 1;
}

String read_fd(int fd)
{
    String content;
    constexpr size_t bufsize = 256;
    char buf[bufsize];
    while (ssize_t size = read(fd, buf, bufsize))
    {
        if (size == -1)
            throw file_access_error{fd, strerror(errno)};
        content += StringView{buf, buf + size};
    }
    return content;
}

String read_file(StringView filename)
{
    int fd = open(filename.str().c_str(), O_RDONLY);
    if (fd == -1)
        throw file_access_error(filename, strerror(errno));

    auto close_fd = on_scope_end([fd]{ close(fd); });
    return read_fd(fd);
}

void write(int fd, StringView data)
{
    const char* ptr = data.data();
    ssize_t count   = (int)data.length();

    while (count)
    {
        if (ssize_t written = ::write(fd, ptr, count); written != -1)
        {
            ptr += written;
            count -= written;
        }
        else if (errno != EINTR)
            throw file_access_error(fd, strerror(errno));
    }
}

int open_append(StringView filename)
{
    int fd = open(filename.str().c_str(), O_CREAT | O_WRONLY | O_APPEND, 0644);
    if (fd == -1)
        throw file_access_error(filename, strerror(errno));
    return fd;
}

}
