#ifndef debug_hh_INCLUDED
#define debug_hh_INCLUDED

#include "enum.hh"
#include "flags.hh"
#include "meta.hh"

namespace Tabgrid
{

class StringView;

enum class DebugFlags
{
    None       = 0,
    Keys       = 1 << 0,
    Completion = 1 << 1,
};

constexpr bool with_bit_ops(Meta::Type<DebugFlags>) { return true; }

constexpr auto enum_desc(Meta::Type<DebugFlags>)
{
    return make_array<EnumDesc<DebugFlags>>({
        { DebugFlags::Keys, "keys" },
        { DebugFlags::Completion, "completion" },
    });
}

DebugFlags debug_flags();
void set_debug_flags(DebugFlags flags);

// messages go to stderr unless another descriptor is set
void set_debug_log_fd(int fd);
void write_to_debug_log(StringView str);

}

#endif // debug_hh_INCLUDED
