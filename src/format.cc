#include "format.hh"

#include "exception.hh"
#include "string_utils.hh"

#include <algorithm>
#include <charconv>

namespace Tabgrid
{

template<size_t N>
InplaceString<N> to_string_impl(auto val)
{
    InplaceString<N> res;
    auto [end, errc] = std::to_chars(res.m_data, res.m_data + N, val, 10);
    if (errc != std::errc{})
        throw runtime_error("to_string error");
    res.m_length = end - res.m_data;
    return res;
}

InplaceString<15> to_string(int val)
{
    return to_string_impl<15>(val);
}

InplaceString<15> to_string(unsigned val)
{
    return to_string_impl<15>(val);
}

InplaceString<23> to_string(long int val)
{
    return to_string_impl<23>(val);
}

InplaceString<23> to_string(unsigned long val)
{
    return to_string_impl<23>(val);
}

InplaceString<7> to_string(Codepoint c)
{
    InplaceString<7> res;
    char* ptr = res.m_data;
    utf8::dump(ptr, c);
    res.m_length = (int)(ptr - res.m_data);
    return res;
}

template<typename AppendFunc>
void format_impl(StringView fmt, ArrayView<const StringView> params, AppendFunc append)
{
    int implicit_index = 0;
    for (auto it = fmt.begin(), end = fmt.end(); it != end;)
    {
        auto opening = std::find(it, end, '{');
        if (opening == end)
        {
            append(StringView{it, opening});
            break;
        }
        else if (opening != it and *(opening-1) == '\\')
        {
            append(StringView{it, opening-1});
            append(StringView{opening, 1_byte});
            it = opening + 1;
        }
        else
        {
            append(StringView{it, opening});
            auto closing = std::find(opening, end, '}');
            if (closing == end)
                throw runtime_error("format string error, unclosed '{'");

            auto width_spec = std::find(opening+1, closing, ':');
            const int index = opening+1 == width_spec ? implicit_index : str_to_int({opening+1, width_spec});

            if (index >= (int)params.size())
                throw runtime_error("format string parameter index too big");

            if (width_spec != closing)
            {
                StringView padding = " ";
                if (*(++width_spec) == '0')
                {
                    padding = "0";
                    ++width_spec;
                }
                for (ColumnCount width = str_to_int({width_spec, closing}), len = params[index].column_length();
                     width > len; --width)
                    append(padding);
            }

            append(params[index]);
            implicit_index = index+1;
            it = closing+1;
        }
    }
}

void format_with(FunctionRef<void (StringView)> append, StringView fmt, ArrayView<const StringView> params)
{
    format_impl(fmt, params, append);
}

String format(StringView fmt, ArrayView<const StringView> params)
{
    ByteCount size = fmt.length();
    for (auto& s : params) size += s.length();
    String res;
    res.reserve(size);

    format_impl(fmt, params, [&](StringView s) { res += s; });
    return res;
}

}
