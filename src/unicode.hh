#ifndef unicode_hh_INCLUDED
#define unicode_hh_INCLUDED

#include <cwchar>

#include "units.hh"

namespace Tabgrid
{

using Codepoint = char32_t;

inline bool is_horizontal_blank(Codepoint c) noexcept
{
    return c == '\t'      or
           c == ' '       or
           c == U'\u00A0' or
           c == U'\u3000' ;
}

inline bool is_basic_alpha(Codepoint c) noexcept
{
    return (c >= 'a' and c <= 'z') or (c >= 'A' and c <= 'Z');
}

// terminal cells used to display c, control characters are drawn
// as a single replacement glyph.
inline ColumnCount codepoint_width(Codepoint c) noexcept
{
    if (c == '\n')
        return 1;
    const auto width = wcwidth((wchar_t)c);
    return width >= 0 ? width : 1;
}

inline char to_lower(char c) noexcept { return c >= 'A' and c <= 'Z' ? c - 'A' + 'a' : c; }
inline Codepoint to_upper(Codepoint c) noexcept { return c >= 'a' and c <= 'z' ? c - 'a' + 'A' : c; }

}

#endif // unicode_hh_INCLUDED
