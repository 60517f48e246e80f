#include "string_utils.hh"

#include "exception.hh"
#include "unicode.hh"
#include "unit_tests.hh"

#include <algorithm>
#include <climits>

namespace Tabgrid
{

Vector<String> split(StringView str, char separator)
{
    Vector<String> res;
    auto it = str.begin(), end = str.end();
    while (true)
    {
        auto next = std::find(it, end, separator);
        res.emplace_back(it, next);
        if (next == end)
            break;
        it = next + 1;
    }
    return res;
}

Vector<StringView> split_words(StringView str)
{
    Vector<StringView> res;
    auto is_space = [](char c) { return c == ' ' or c == '\t' or c == '\n' or c == '\r'; };
    for (auto it = str.begin(), end = str.end(); it != end; )
    {
        it = std::find_if_not(it, end, is_space);
        if (it == end)
            break;
        auto word_end = std::find_if(it, end, is_space);
        res.emplace_back(it, word_end);
        it = word_end;
    }
    return res;
}

static StringView truncate_to_columns(StringView str, ColumnCount size)
{
    auto it = str.begin(), end = str.end();
    ColumnCount col = 0;
    while (it != end)
    {
        auto next = it;
        col += codepoint_width(utf8::read_codepoint(next, end));
        if (col > size)
            break;
        it = next;
    }
    return {str.begin(), it};
}

String right_pad(StringView str, ColumnCount size, Codepoint c)
{
    return truncate_to_columns(str, size) + String(c, std::max(0_col, size - str.column_length()));
}

Optional<int> str_to_int_ifp(StringView str)
{
    bool negative = not str.empty() and str[0_byte] == '-';
    if (negative)
        str = str.substr(1_byte);
    if (str.empty())
        return {};

    unsigned int res = 0;
    for (auto c : str)
    {
        if (c < '0' or c > '9')
            return {};
        res = res * 10 + c - '0';
    }
    return negative ? -res : res;
}

int str_to_int(StringView str)
{
    if (auto val = str_to_int_ifp(str))
        return *val;
    throw runtime_error{str + " is not a number"};
}

UnitTest test_string_utils{[]()
{
    tg_assert(format("Youhou {1} {} '{0:4}' {2:04} \\{}", 10, "hehe", 5) == "Youhou hehe 5 '  10' 0005 {}");

    tg_assert(str_to_int("5") == 5);
    tg_assert(str_to_int(to_string(INT_MAX)) == INT_MAX);
    tg_assert(str_to_int(to_string(INT_MIN)) == INT_MIN);
    tg_assert(str_to_int("-0") == 0);
    tg_assert(not str_to_int_ifp("12a"));
    tg_assert(not str_to_int_ifp("-"));
    tg_expect_throw(runtime_error, str_to_int("twelve"));

    auto fields = split("ret,c-j,,tab", ',');
    tg_assert(fields.size() == 4 and fields[1] == "c-j" and fields[2].empty());
    tg_assert(join(fields, "|") == "ret|c-j||tab");

    auto words = split_words("  alpha\tbeta\n\ngamma ");
    tg_assert(words.size() == 3 and words[0] == "alpha" and words[2] == "gamma");
    tg_assert(split_words("   ").empty());

    tg_assert(right_pad("ab", 4_col) == "ab  ");
    tg_assert(right_pad("é", 3_col) == "é  ");
    tg_assert(right_pad("abcdef", 3_col) == "abc");
}};

}
