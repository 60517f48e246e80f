#ifndef line_buffer_hh_INCLUDED
#define line_buffer_hh_INCLUDED

#include "string.hh"
#include "units.hh"

namespace Tabgrid
{

// The editable input line the completion engine works on
class LineBuffer
{
public:
    virtual ~LineBuffer() = default;

    virtual StringView line() const = 0;
    virtual CharCount cursor_pos() const = 0;

    // inserts text at the cursor, leaving the cursor after it
    virtual void insert(StringView text) = 0;
    virtual void erase_before(CharCount count) = 0;
    virtual void erase_after(CharCount count) = 0;

    // screen rows used by the prompt and the line when wrapped at width,
    // counting the row holding a cursor placed past the last character
    virtual LineCount screen_line_count(ColumnCount width) const = 0;
    // display columns before the cursor, prompt included
    virtual ColumnCount cursor_column() const = 0;
};

}

#endif // line_buffer_hh_INCLUDED
