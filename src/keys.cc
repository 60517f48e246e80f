#include "keys.hh"

#include "exception.hh"
#include "string.hh"
#include "string_utils.hh"
#include "unit_tests.hh"
#include "utils.hh"

#include <algorithm>

namespace Tabgrid
{

struct key_parse_error : runtime_error
{
    using runtime_error::runtime_error;
};

static Key canonicalize_ifn(Key key)
{
    if (key.key > 0 and key.key < 27)
    {
        tg_assert(key.modifiers == Key::Modifiers::None);
        key.modifiers = Key::Modifiers::Control;
        key.key = key.key - 1 + 'a';
    }

    if (key.modifiers & Key::Modifiers::Shift)
    {
        if (is_basic_alpha(key.key))
        {
            // Shift + ASCII letters is just the uppercase letter.
            key.modifiers &= ~Key::Modifiers::Shift;
            key.key = to_upper(key.key);
        }
        else if (key.key < 0xD800 || key.key > 0xDFFF)
        {
            // Shift + any other printable character is not allowed.
            throw key_parse_error(format("Shift modifier only works on special keys and lowercase ASCII, not '{}'", key.key));
        }
    }

    return key;
}

Optional<Codepoint> Key::codepoint() const
{
    if (*this == Key::Tab)
        return '\t';
    if (*this == Key::Space or *this == shift(Key::Space))
        return ' ';
    if (modifiers == Modifiers::None and key > 27 and key != 127 and
        (key < 0xD800 or key > 0xDFFF)) // avoid surrogates
        return key;
    return {};
}

struct KeyAndName { const char* name; Codepoint key; };
static constexpr KeyAndName keynamemap[] = {
    { "ret", Key::Return },
    { "space", Key::Space },
    { "tab", Key::Tab },
    { "lt", '<' },
    { "gt", '>' },
    { "backspace", Key::Backspace},
    { "esc", Key::Escape },
    { "up", Key::Up },
    { "down", Key::Down},
    { "left", Key::Left },
    { "right", Key::Right },
    { "pageup", Key::PageUp },
    { "pagedown", Key::PageDown },
    { "home", Key::Home },
    { "end", Key::End },
    { "ins", Key::Insert },
    { "del", Key::Delete },
    { "plus", '+' },
    { "minus", '-' },
    { "semicolon", ';' },
    { "equal", '=' },
};

KeyList parse_keys(StringView str)
{
    KeyList result;
    for (auto it = str.begin(), str_end = str.end(); it != str_end; )
    {
        if (*it != '<')
        {
            auto convert = [](Codepoint cp) -> Codepoint {
                switch (cp)
                {
                    case '\n':   return Key::Return;
                    case '\r':   return Key::Return;
                    case '\b':   return Key::Backspace;
                    case '\t':   return Key::Tab;
                    case ' ':    return Key::Space;
                    case '\033': return Key::Escape;
                    default:     return cp;
                }
            };
            result.emplace_back(Key::Modifiers::None, convert(utf8::read_codepoint(it, str_end)));
            continue;
        }

        auto end_it = std::find(it, str_end, '>');
        if (end_it == str_end)
        {
            result.emplace_back(Key::Modifiers::None, '<');
            ++it;
            continue;
        }

        Key::Modifiers modifier = Key::Modifiers::None;

        StringView full_desc{it, end_it+1};
        StringView desc{it+1, end_it};
        for (auto dash = std::find(desc.begin(), desc.end(), '-'); dash != desc.end();
             dash = std::find(desc.begin(), desc.end(), '-'))
        {
            if (dash != desc.begin() + 1)
                throw key_parse_error(format("unable to parse modifier in '{}'",
                                             full_desc));

            switch(to_lower(desc[0_byte]))
            {
                case 'c': modifier |= Key::Modifiers::Control; break;
                case 'a': modifier |= Key::Modifiers::Alt; break;
                case 's': modifier |= Key::Modifiers::Shift; break;
                default:
                    throw key_parse_error(format("unable to parse modifier in '{}'",
                                                 full_desc));
            }
            desc = StringView{dash+1, desc.end()};
        }

        auto name_it = std::find_if(std::begin(keynamemap), std::end(keynamemap),
                                    [&desc](const KeyAndName& item) { return item.name == desc; });
        if (name_it != std::end(keynamemap))
            result.push_back(canonicalize_ifn({ modifier, name_it->key }));
        else if (desc.char_length() == 1)
            result.push_back(canonicalize_ifn({ modifier, desc[0_char] }));
        else
            throw key_parse_error(format("unable to parse '{}'", full_desc));

        it = end_it + 1;
    }
    return result;
}

String to_string(Key key)
{
    bool named = false;
    String res;
    auto it = std::find_if(std::begin(keynamemap), std::end(keynamemap),
                           [&key](const KeyAndName& item) { return item.key == key.key; });
    if (it != std::end(keynamemap))
    {
        named = true;
        res = it->name;
    }
    else
        res = String{key.key};

    if (key.modifiers & Key::Modifiers::Shift)   { res = "s-" + res; named = true; }
    if (key.modifiers & Key::Modifiers::Alt)     { res = "a-" + res; named = true; }
    if (key.modifiers & Key::Modifiers::Control) { res = "c-" + res; named = true; }

    if (named)
        res = "<" + res + ">";
    return res;
}

UnitTest test_keys{[]()
{
    KeyList keys{
         {Key::Space},
         { 'c' },
         {Key::Up},
         alt('j'),
         ctrl('r'),
         shift(Key::Up),
         shift(Key::Tab),
         ctrl('['),
         ctrl(']'),
    };
    String keys_as_str;
    for (auto& key : keys)
        keys_as_str += to_string(key);
    auto parsed_keys = parse_keys(keys_as_str);
    tg_assert(keys == parsed_keys);
    tg_assert(parse_keys("a<c-a-b>c") == KeyList{'a', ctrl(alt({'b'})), 'c'});

    tg_assert(parse_keys("x") == KeyList{ {'x'} });
    tg_assert(parse_keys("<x>") == KeyList{ {'x'} });
    tg_assert(parse_keys("<s-x>") == KeyList{ {'X'} });
    tg_assert(parse_keys("<X>") == KeyList{ {'X'} });
    tg_assert(parse_keys("<s-up>") == KeyList{ shift({Key::Up}) });
    tg_assert(parse_keys("<s-tab>") == KeyList{ shift({Key::Tab}) });
    tg_assert(parse_keys("<C-n>") == KeyList{ ctrl({'n'}) });
    tg_assert(parse_keys("\n") == KeyList{ Key::Return });
    tg_assert(parse_keys("é<") == (KeyList{ {U'é'}, {'<'} }));

    tg_assert(to_string(shift({Key::Tab})) == "<s-tab>");
    tg_assert(to_string(ctrl({'g'})) == "<c-g>");
    tg_assert(to_string(Key{'x'}) == "x");

    tg_assert(Key{'a'}.codepoint() == Optional<Codepoint>{'a'});
    tg_assert(not ctrl({'a'}).codepoint());
    tg_assert(not Key{Key::Return}.codepoint());

    tg_expect_throw(key_parse_error, parse_keys("<-x>"));
    tg_expect_throw(key_parse_error, parse_keys("<xy-z>"));
    tg_expect_throw(key_parse_error, parse_keys("<x-y>"));
    tg_expect_throw(key_parse_error, parse_keys("<s-/>"));
    tg_expect_throw(key_parse_error, parse_keys("<s-lt>"));
    tg_expect_throw(key_parse_error, parse_keys("<backtab>"));
    tg_expect_throw(key_parse_error, parse_keys("<invalidkey>"));
}};

}
