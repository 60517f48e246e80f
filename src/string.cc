#include "string.hh"

#include "assert.hh"
#include "unit_tests.hh"

namespace Tabgrid
{

String::String(Codepoint cp, CharCount count)
{
    char encoded[4];
    char* end = encoded;
    utf8::dump(end, cp);
    const ByteCount size = (int)(end - encoded);
    reserve(size * (int)count);
    while (count-- > 0)
        append(encoded, size);
}

String::String(Codepoint cp, ColumnCount count)
{
    const ColumnCount cp_width = codepoint_width(cp);
    tg_assert(cp_width > 0);
    String single{cp};
    reserve(single.length() * (int)(count / cp_width));
    while (count >= cp_width)
    {
        *this += single;
        count -= cp_width;
    }
}

UnitTest test_string{[]()
{
    StringView str = "maïs mélange bientôt";
    tg_assert(str.char_length() == 20);
    tg_assert(str.length() == 23);
    tg_assert(str[3_char] == 's');
    tg_assert(str[2_char] == 0x00EF);
    tg_assert(str.substr(5_char, 7_char) == "mélange");
    tg_assert(str.substr(5_char).length() == 17);
    tg_assert(str.substr(5_byte).char_length() == 16);
    tg_assert(str.column_length() == 20);

    tg_assert(String{' ', 3_col} == "   ");
    tg_assert(String{'x', 2_char} == "xx");
    tg_assert(String{U'é'} == "é");
    tg_assert(StringView{"git-shell"}.starts_with("git"));
    tg_assert(not StringView{"gi"}.starts_with("git"));
    tg_assert(StringView{"git-shell"}.ends_with("shell"));

    tg_assert(str.back() == 't');
    tg_assert(StringView{}.empty());
}};

}
