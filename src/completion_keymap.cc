#include "completion_keymap.hh"

#include "exception.hh"
#include "string_utils.hh"
#include "unit_tests.hh"

#include <algorithm>

namespace Tabgrid
{

CompletionKeymap::CompletionKeymap()
{
    struct DefaultBinding { const char* keys; CompletionKey action; };
    static constexpr DefaultBinding defaults[] = {
        { "<tab>", CompletionKey::Trigger },
        { "<ret><c-j>", CompletionKey::Accept },
        { "<c-g><c-c><esc>", CompletionKey::Cancel },
        { "<c-f><right>", CompletionKey::Advance },
        { "<c-b><left><s-tab>", CompletionKey::Retreat },
        { "<c-a><home>", CompletionKey::RowStart },
        { "<c-e><end>", CompletionKey::RowEnd },
        { "<c-p><up>", CompletionKey::Up },
        { "<c-n><down>", CompletionKey::Down },
        { "<backspace>", CompletionKey::Back },
    };
    for (auto& binding : defaults)
    {
        for (auto key : parse_keys(binding.keys))
            map_key(key, binding.action);
    }
}

void CompletionKeymap::map_key(Key key, CompletionKey action)
{
    if (action == CompletionKey::Unrecognized)
        return unmap_key(key);

    auto it = std::find_if(m_mapping.begin(), m_mapping.end(),
                           [&](const Mapping& m) { return m.key == key; });
    if (it != m_mapping.end())
        it->action = action;
    else
        m_mapping.push_back({key, action});
}

void CompletionKeymap::unmap_key(Key key)
{
    m_mapping.erase(std::remove_if(m_mapping.begin(), m_mapping.end(),
                                   [&](const Mapping& m) { return m.key == key; }),
                    m_mapping.end());
}

CompletionKey CompletionKeymap::lookup(Key key) const
{
    auto it = std::find_if(m_mapping.begin(), m_mapping.end(),
                           [&](const Mapping& m) { return m.key == key; });
    return it != m_mapping.end() ? it->action : CompletionKey::Unrecognized;
}

void CompletionKeymap::parse_mappings(StringView mappings)
{
    for (auto& mapping : split(mappings, ';'))
    {
        if (mapping.empty())
            continue;

        // keys and action are split on the last '='
        const char* eq = nullptr;
        for (auto it = mapping.begin(); it != mapping.end(); ++it)
        {
            if (*it == '=')
                eq = it;
        }
        if (eq == nullptr or eq == mapping.begin() or eq + 1 == mapping.end())
            throw runtime_error(format("invalid mapping '{}', expected <keys>=<action>", mapping));

        StringView action_name{eq + 1, mapping.end()};
        const auto action = action_name == "none" ? CompletionKey::Unrecognized
                                                  : enum_from_string<CompletionKey>(action_name);
        for (auto key : parse_keys({mapping.begin(), eq}))
            map_key(key, action);
    }
}

KeyList CompletionKeymap::get_mapped_keys(CompletionKey action) const
{
    KeyList res;
    for (auto& mapping : m_mapping)
    {
        if (mapping.action == action)
            res.push_back(mapping.key);
    }
    return res;
}

UnitTest test_completion_keymap{[]()
{
    CompletionKeymap keymap;
    tg_assert(keymap.lookup(Key::Tab) == CompletionKey::Trigger);
    tg_assert(keymap.lookup(Key::Return) == CompletionKey::Accept);
    tg_assert(keymap.lookup(ctrl('j')) == CompletionKey::Accept);
    tg_assert(keymap.lookup(Key::Escape) == CompletionKey::Cancel);
    tg_assert(keymap.lookup(shift(Key::Tab)) == CompletionKey::Retreat);
    tg_assert(keymap.lookup(ctrl('n')) == CompletionKey::Down);
    tg_assert(keymap.lookup(Key::Home) == CompletionKey::RowStart);
    tg_assert(keymap.lookup(Key::Backspace) == CompletionKey::Back);
    tg_assert(keymap.lookup('x') == CompletionKey::Unrecognized);
    tg_assert(keymap.get_mapped_keys(CompletionKey::Up) == KeyList{ctrl('p'), Key::Up});

    keymap.parse_mappings("<c-space>=trigger;<tab>=advance;<c-g>=none");
    tg_assert(keymap.lookup(ctrl(Key::Space)) == CompletionKey::Trigger);
    tg_assert(keymap.lookup(Key::Tab) == CompletionKey::Advance);
    tg_assert(keymap.lookup(ctrl('g')) == CompletionKey::Unrecognized);

    keymap.parse_mappings("==row-end");
    tg_assert(keymap.lookup('=') == CompletionKey::RowEnd);

    tg_expect_throw(runtime_error, keymap.parse_mappings("<tab>"));
    tg_expect_throw(runtime_error, keymap.parse_mappings("<tab>=jump"));
    tg_expect_throw(runtime_error, keymap.parse_mappings("=trigger"));
}};

}
