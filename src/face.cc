#include "face.hh"

#include "exception.hh"
#include "string_utils.hh"
#include "unit_tests.hh"

#include <algorithm>
#include <cstdio>
#include <iterator>

namespace Tabgrid
{

static constexpr const char* color_names[] = {
    "default",
    "black",
    "red",
    "green",
    "yellow",
    "blue",
    "magenta",
    "cyan",
    "white",
    "bright-black",
    "bright-red",
    "bright-green",
    "bright-yellow",
    "bright-blue",
    "bright-magenta",
    "bright-cyan",
    "bright-white",
};

struct AttributeAndName { char name; Attribute attribute; int sgr; };
static constexpr AttributeAndName attribute_names[] = {
    { 'u', Attribute::Underline, 4 },
    { 'r', Attribute::Reverse, 7 },
    { 'B', Attribute::Blink, 5 },
    { 'b', Attribute::Bold, 1 },
    { 'd', Attribute::Dim, 2 },
    { 'i', Attribute::Italic, 3 },
};

Color str_to_color(StringView color)
{
    auto it = std::find_if(std::begin(color_names), std::end(color_names),
                           [&](const char* c){ return color == c; });
    if (it != std::end(color_names))
        return static_cast<Color::NamedColor>(it - color_names);

    auto hval = [&color](char c) -> int
    {
        if (c >= 'A' and c <= 'F')
            return 10 + c - 'A';
        else if (c >= 'a' and c <= 'f')
            return 10 + c - 'a';
        else if (c >= '0' and c <= '9')
            return c - '0';
        throw runtime_error(format("invalid digit '{}' in '{}'", c, color));
    };

    if (color.length() == 10 and color.substr(0_byte, 4_byte) == "rgb:")
        return { (unsigned char)(hval(color[4_byte]) * 16 + hval(color[5_byte])),
                 (unsigned char)(hval(color[6_byte]) * 16 + hval(color[7_byte])),
                 (unsigned char)(hval(color[8_byte]) * 16 + hval(color[9_byte])) };

    throw runtime_error(format("unable to parse color: '{}'", color));
}

String to_string(Color color)
{
    if (color.isRGB())
    {
        char buffer[11];
        snprintf(buffer, sizeof(buffer), "rgb:%02x%02x%02x", color.r, color.g, color.b);
        return buffer;
    }
    size_t index = static_cast<size_t>(color.color);
    tg_assert(index < (size_t)(std::end(color_names) - std::begin(color_names)));
    return color_names[index];
}

Face parse_face(StringView facedesc)
{
    constexpr StringView invalid_face_error = "invalid face description, expected [<fg>][,<bg>][+<attr>]";
    auto bg_it = std::find(facedesc.begin(), facedesc.end(), ',');
    auto attr_it = std::find(facedesc.begin(), facedesc.end(), '+');
    if (bg_it != facedesc.end()
        and (attr_it < bg_it or (bg_it + 1) == facedesc.end()))
        throw runtime_error(invalid_face_error.str());
    if (attr_it != facedesc.end()
        and (attr_it + 1) == facedesc.end())
        throw runtime_error(invalid_face_error.str());

    auto parse_color = [](StringView spec) {
        return spec.empty() ? Color{Color::Default} : str_to_color(spec);
    };

    Face face;
    face.fg = parse_color({facedesc.begin(), std::min(bg_it, attr_it)});
    if (bg_it != facedesc.end())
        face.bg = parse_color({bg_it+1, attr_it});
    if (attr_it != facedesc.end())
    {
        for (++attr_it; attr_it != facedesc.end(); ++attr_it)
        {
            auto attr = std::find_if(std::begin(attribute_names), std::end(attribute_names),
                                     [&](const AttributeAndName& a) { return a.name == *attr_it; });
            if (attr == std::end(attribute_names))
                throw runtime_error(format("no such face attribute: '{}'", StringView{*attr_it}));
            face.attributes |= attr->attribute;
        }
    }
    return face;
}

String to_string(Face face)
{
    String res = to_string(face.fg);
    if (face.bg != Color::Default)
        res += "," + to_string(face.bg);
    if (face.attributes != Attribute::Normal)
    {
        res += "+";
        for (auto& attr : attribute_names)
        {
            if (face.attributes & attr.attribute)
                res.push_back(attr.name);
        }
    }
    return res;
}

String sgr(const Face& face)
{
    static constexpr int fg_table[]{ 39, 30, 31, 32, 33, 34, 35, 36, 37, 90, 91, 92, 93, 94, 95, 96, 97 };
    static constexpr int bg_table[]{ 49, 40, 41, 42, 43, 44, 45, 46, 47, 100, 101, 102, 103, 104, 105, 106, 107 };

    String res = "\033[";
    bool join = false;
    auto append = [&](StringView param) {
        if (join)
            res += ";";
        res += param;
        join = true;
    };
    auto set_color = [&](bool fg, const Color& color) {
        if (color.isRGB())
            append(format("{};2;{};{};{}", fg ? 38 : 48, color.r, color.g, color.b));
        else
            append(to_string((fg ? fg_table : bg_table)[(int)color.color]));
    };

    for (auto& attr : attribute_names)
    {
        if (face.attributes & attr.attribute)
            append(to_string(attr.sgr));
    }
    if (face.fg != Color::Default)
        set_color(true, face.fg);
    if (face.bg != Color::Default)
        set_color(false, face.bg);
    if (not join)
        append("0");
    res += "m";
    return res;
}

UnitTest test_face{[]()
{
    auto face = parse_face("black,white");
    tg_assert(face.fg == Color::Black and face.bg == Color::White and face.attributes == Attribute::Normal);
    tg_assert(sgr(face) == "\033[30;47m");

    face = parse_face("rgb:FF8000+ub");
    tg_assert(face.fg == Color(255, 128, 0) and face.bg == Color::Default);
    tg_assert(face.attributes == (Attribute::Underline | Attribute::Bold));
    tg_assert(sgr(face) == "\033[4;1;38;2;255;128;0m");
    tg_assert(to_string(face) == "rgb:ff8000+ub");

    face = parse_face(",bright-blue+r");
    tg_assert(face.fg == Color::Default and face.bg == Color::BrightBlue);
    tg_assert(sgr(face) == "\033[7;104m");

    tg_assert(sgr(parse_face("")) == "\033[0m");
    tg_assert(to_string(parse_face("red,black")) == "red,black");

    tg_expect_throw(runtime_error, parse_face("purple"));
    tg_expect_throw(runtime_error, parse_face("red,"));
    tg_expect_throw(runtime_error, parse_face("red+"));
    tg_expect_throw(runtime_error, parse_face("red+x"));
    tg_expect_throw(runtime_error, parse_face("rgb:12345z"));
}};

}
