#ifndef enum_hh_INCLUDED
#define enum_hh_INCLUDED

#include "exception.hh"
#include "flags.hh"
#include "format.hh"
#include "meta.hh"
#include "string.hh"

#include <algorithm>

namespace Tabgrid
{

template<typename T> struct EnumDesc { T value; StringView name; };

template<typename T>
concept DescribedEnum = requires { enum_desc(Meta::Type<T>{}); };

template<DescribedEnum Enum>
StringView enum_name(Enum value)
{
    for (auto& desc : enum_desc(Meta::Type<Enum>{}))
    {
        if (desc.value == value)
            return desc.name;
    }
    return "<unknown>";
}

template<DescribedEnum Enum>
Enum enum_from_string(StringView name)
{
    for (auto& desc : enum_desc(Meta::Type<Enum>{}))
    {
        if (desc.name == name)
            return desc.value;
    }
    throw runtime_error(format("invalid value '{}'", name));
}

// parses a '|' separated list of names into a flag set
template<DescribedEnum Flags>
    requires WithBitOps<Flags>
Flags flags_from_string(StringView str)
{
    Flags res{};
    auto it = str.begin(), end = str.end();
    while (it != end)
    {
        auto sep = std::find(it, end, '|');
        res |= enum_from_string<Flags>({it, sep});
        it = sep == end ? end : sep + 1;
    }
    return res;
}

}

#endif // enum_hh_INCLUDED
