#ifndef line_editor_hh_INCLUDED
#define line_editor_hh_INCLUDED

#include "keys.hh"
#include "line_buffer.hh"
#include "output_sink.hh"
#include "string.hh"

namespace Tabgrid
{

// Single line input with a prompt, drawn in place on the terminal
class LineEditor : public LineBuffer
{
public:
    LineEditor(OutputSink& sink, String prompt);

    // returns false if key is not an editing key
    bool handle_key(Key key);

    StringView line() const override { return m_line; }
    CharCount cursor_pos() const override { return m_cursor_pos; }

    void insert(StringView text) override;
    void erase_before(CharCount count) override;
    void erase_after(CharCount count) override;

    LineCount screen_line_count(ColumnCount width) const override;
    ColumnCount cursor_column() const override;

    // rewrites prompt and line from the first input row, clearing
    // everything below, and puts the cursor back in place
    void redraw(ColumnCount width);
    bool dirty() const { return m_dirty; }

    // forgets the current line, the next redraw starts on the cursor row
    void reset();

private:
    void set_line(String line, CharCount cursor_pos);

    OutputSink& m_sink;
    String m_prompt;
    String m_line;
    String m_clipboard;
    CharCount m_cursor_pos = 0;
    // screen row of the cursor relative to the first input row, as last drawn
    LineCount m_cursor_row = 0;
    bool m_dirty = true;
};

}

#endif // line_editor_hh_INCLUDED
