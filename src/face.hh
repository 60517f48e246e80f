#ifndef face_hh_INCLUDED
#define face_hh_INCLUDED

#include "flags.hh"
#include "meta.hh"

namespace Tabgrid
{

class String;
class StringView;

struct Color
{
    enum NamedColor : unsigned char
    {
        Default,
        Black,
        Red,
        Green,
        Yellow,
        Blue,
        Magenta,
        Cyan,
        White,
        BrightBlack,
        BrightRed,
        BrightGreen,
        BrightYellow,
        BrightBlue,
        BrightMagenta,
        BrightCyan,
        BrightWhite,
        RGB,
    };

    NamedColor color;
    unsigned char r = 0;
    unsigned char g = 0;
    unsigned char b = 0;

    constexpr bool isRGB() const { return color == RGB; }

    constexpr Color() : Color{Default} {}
    constexpr Color(NamedColor c) : color{c} {}
    constexpr Color(unsigned char r, unsigned char g, unsigned char b)
        : color{RGB}, r{r}, g{g}, b{b} {}
};

constexpr bool operator==(Color lhs, Color rhs)
{
    return lhs.color == rhs.color and
           lhs.r == rhs.r and lhs.g == rhs.g and lhs.b == rhs.b;
}

Color str_to_color(StringView color);
String to_string(Color color);

enum class Attribute : int
{
    Normal    = 0,
    Underline = 1 << 0,
    Reverse   = 1 << 1,
    Blink     = 1 << 2,
    Bold      = 1 << 3,
    Dim       = 1 << 4,
    Italic    = 1 << 5,
};

constexpr bool with_bit_ops(Meta::Type<Attribute>) { return true; }

struct Face
{
    Color fg = Color::Default;
    Color bg = Color::Default;
    Attribute attributes = Attribute::Normal;

    friend constexpr bool operator==(const Face& lhs, const Face& rhs)
    {
        return lhs.fg == rhs.fg and
               lhs.bg == rhs.bg and
               lhs.attributes == rhs.attributes;
    }
};

// parses [<fg>][,<bg>][+<attributes>]
Face parse_face(StringView facedesc);
String to_string(Face face);

// select graphic rendition sequence switching the terminal to face
String sgr(const Face& face);
// select graphic rendition sequence back to the terminal defaults
constexpr const char* sgr_reset = "\033[0m";

}

#endif // face_hh_INCLUDED
