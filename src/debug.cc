#include "debug.hh"

#include "file.hh"
#include "string.hh"

namespace Tabgrid
{

namespace
{
    DebugFlags current_flags = DebugFlags::None;
    int log_fd = 2;
}

DebugFlags debug_flags()
{
    return current_flags;
}

void set_debug_flags(DebugFlags flags)
{
    current_flags = flags;
}

void set_debug_log_fd(int fd)
{
    log_fd = fd;
}

void write_to_debug_log(StringView str)
{
    const bool eol_back = not str.empty() and str.back() == '\n';
    write(log_fd, eol_back ? str.str() : str + "\n");
}

}
