#ifndef completion_keymap_hh_INCLUDED
#define completion_keymap_hh_INCLUDED

#include "enum.hh"
#include "keys.hh"
#include "meta.hh"
#include "string.hh"
#include "vector.hh"

namespace Tabgrid
{

// semantic keys understood by the completion engine
enum class CompletionKey
{
    Trigger,
    Accept,
    Cancel,
    Advance,
    Retreat,
    RowStart,
    RowEnd,
    Up,
    Down,
    Back,
    Unrecognized,
};

constexpr auto enum_desc(Meta::Type<CompletionKey>)
{
    return make_array<EnumDesc<CompletionKey>>({
        { CompletionKey::Trigger, "trigger" },
        { CompletionKey::Accept, "accept" },
        { CompletionKey::Cancel, "cancel" },
        { CompletionKey::Advance, "advance" },
        { CompletionKey::Retreat, "retreat" },
        { CompletionKey::RowStart, "row-start" },
        { CompletionKey::RowEnd, "row-end" },
        { CompletionKey::Up, "up" },
        { CompletionKey::Down, "down" },
        { CompletionKey::Back, "back" },
    });
}

class CompletionKeymap
{
public:
    // starts with the readline style bindings
    CompletionKeymap();

    void map_key(Key key, CompletionKey action);
    void unmap_key(Key key);

    // Unrecognized for unmapped keys
    CompletionKey lookup(Key key) const;

    // applies a ';' separated list of <keys>=<action> bindings
    void parse_mappings(StringView mappings);

    KeyList get_mapped_keys(CompletionKey action) const;

private:
    struct Mapping
    {
        Key key;
        CompletionKey action;
    };
    Vector<Mapping> m_mapping;
};

}

#endif // completion_keymap_hh_INCLUDED
