#ifndef string_utils_hh_INCLUDED
#define string_utils_hh_INCLUDED

#include "format.hh"
#include "optional.hh"
#include "string.hh"
#include "vector.hh"

namespace Tabgrid
{

// splits str on separator, empty fields are kept
Vector<String> split(StringView str, char separator);

Vector<StringView> split_words(StringView str);

template<typename Container>
String join(const Container& container, StringView joiner)
{
    String res;
    for (const auto& str : container)
    {
        if (not res.empty())
            res += joiner;
        res += str;
    }
    return res;
}

// pads with c, or truncates, to exactly size columns
String right_pad(StringView str, ColumnCount size, Codepoint c = ' ');

int str_to_int(StringView str); // throws on error
Optional<int> str_to_int_ifp(StringView str);

}

#endif // string_utils_hh_INCLUDED
