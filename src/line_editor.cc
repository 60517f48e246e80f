#include "line_editor.hh"

#include "format.hh"
#include "unicode.hh"
#include "unit_tests.hh"

#include <algorithm>

namespace Tabgrid
{

LineEditor::LineEditor(OutputSink& sink, String prompt)
    : m_sink{sink}, m_prompt{std::move(prompt)}
{
}

static CharCount previous_word_begin(StringView line, CharCount pos)
{
    while (pos > 0 and is_horizontal_blank(line[pos-1]))
        --pos;
    while (pos > 0 and not is_horizontal_blank(line[pos-1]))
        --pos;
    return pos;
}

bool LineEditor::handle_key(Key key)
{
    const CharCount length = m_line.char_length();
    if (key == Key::Left or key == ctrl('b'))
    {
        if (m_cursor_pos > 0)
            set_line(std::move(m_line), m_cursor_pos - 1);
    }
    else if (key == Key::Right or key == ctrl('f'))
    {
        if (m_cursor_pos < length)
            set_line(std::move(m_line), m_cursor_pos + 1);
    }
    else if (key == Key::Home or key == ctrl('a'))
        set_line(std::move(m_line), 0);
    else if (key == Key::End or key == ctrl('e'))
        set_line(std::move(m_line), length);
    else if (key == Key::Backspace or key == ctrl('h'))
        erase_before(1);
    else if (key == Key::Delete or key == ctrl('d'))
        erase_after(1);
    else if (key == ctrl('k'))
    {
        m_clipboard = m_line.substr(m_cursor_pos).str();
        erase_after(length - m_cursor_pos);
    }
    else if (key == ctrl('u'))
    {
        m_clipboard = m_line.substr(0_char, m_cursor_pos).str();
        erase_before(m_cursor_pos);
    }
    else if (key == ctrl('w'))
    {
        const CharCount word_begin = previous_word_begin(m_line, m_cursor_pos);
        m_clipboard = m_line.substr(word_begin, m_cursor_pos - word_begin).str();
        erase_before(m_cursor_pos - word_begin);
    }
    else if (key == ctrl('y'))
        insert(m_clipboard);
    else if (auto cp = key.codepoint())
        insert(String{*cp});
    else
        return false;
    return true;
}

void LineEditor::set_line(String line, CharCount cursor_pos)
{
    m_line = std::move(line);
    m_cursor_pos = cursor_pos;
    m_dirty = true;
}

void LineEditor::insert(StringView text)
{
    set_line(m_line.substr(0_char, m_cursor_pos) + text + m_line.substr(m_cursor_pos),
             m_cursor_pos + text.char_length());
}

void LineEditor::erase_before(CharCount count)
{
    count = std::min(count, m_cursor_pos);
    if (count <= 0)
        return;
    set_line(m_line.substr(0_char, m_cursor_pos - count) + m_line.substr(m_cursor_pos),
             m_cursor_pos - count);
}

void LineEditor::erase_after(CharCount count)
{
    count = std::min(count, m_line.char_length() - m_cursor_pos);
    if (count <= 0)
        return;
    set_line(m_line.substr(0_char, m_cursor_pos) + m_line.substr(m_cursor_pos + count),
             m_cursor_pos);
}

LineCount LineEditor::screen_line_count(ColumnCount width) const
{
    tg_assert(width > 0);
    return (int)((m_prompt.column_length() + m_line.column_length()) / width) + 1;
}

ColumnCount LineEditor::cursor_column() const
{
    return m_prompt.column_length() + m_line.substr(0_char, m_cursor_pos).column_length();
}

void LineEditor::redraw(ColumnCount width)
{
    width = std::max(width, 1_col);
    auto write = [this](StringView s) { m_sink.write(s); };

    if (m_cursor_row > 0)
        format_with(write, "\033[{}A", m_cursor_row);
    m_sink.write("\r");
    m_sink.write(m_prompt);
    m_sink.write(m_line);

    const ColumnCount end_column = m_prompt.column_length() + m_line.column_length();
    // the terminal does not wrap until the next character is written
    if (end_column > 0 and end_column % width == 0)
        m_sink.write("\r\n");
    m_sink.write("\033[J");

    const ColumnCount column = cursor_column();
    m_cursor_row = (int)(column / width);
    if (const LineCount up = (int)(end_column / width) - m_cursor_row; up > 0)
        format_with(write, "\033[{}A", up);
    m_sink.write("\r");
    if (const ColumnCount right = column % width; right > 0)
        format_with(write, "\033[{}C", right);
    m_sink.flush();
    m_dirty = false;
}

void LineEditor::reset()
{
    set_line({}, 0);
    m_clipboard.clear();
    m_cursor_row = 0;
}

UnitTest test_line_editor{[]()
{
    StringOutputSink sink;
    LineEditor editor{sink, "> "};
    for (auto key : parse_keys("git<space>sta"))
        tg_assert(editor.handle_key(key));
    tg_assert(editor.line() == "git sta" and editor.cursor_pos() == 7);
    tg_assert(editor.cursor_column() == 9);
    tg_assert(editor.dirty());

    editor.handle_key(Key::Left);
    editor.handle_key(Key::Left);
    tg_assert(editor.cursor_pos() == 5);
    editor.erase_after(1);
    tg_assert(editor.line() == "git sa" and editor.cursor_pos() == 5);
    editor.erase_before(2);
    tg_assert(editor.line() == "gita" and editor.cursor_pos() == 3);
    editor.insert("-shell ");
    tg_assert(editor.line() == "git-shell a" and editor.cursor_pos() == 10);

    editor.handle_key(ctrl('w'));
    tg_assert(editor.line() == "a" and editor.cursor_pos() == 0);
    editor.handle_key(ctrl('y'));
    tg_assert(editor.line() == "git-shell a" and editor.cursor_pos() == 10);
    editor.handle_key(ctrl('k'));
    tg_assert(editor.line() == "git-shell " and editor.cursor_pos() == 10);
    editor.handle_key(ctrl('a'));
    tg_assert(editor.cursor_pos() == 0);
    editor.erase_before(3);
    tg_assert(editor.line() == "git-shell ");
    editor.handle_key(ctrl('e'));
    editor.handle_key(ctrl('u'));
    tg_assert(editor.line().empty() and editor.cursor_pos() == 0);

    tg_assert(not editor.handle_key(Key::Up));
    tg_assert(not editor.handle_key(ctrl('g')));

    editor.insert("élan");
    tg_assert(editor.cursor_pos() == 4 and editor.cursor_column() == 6);

    sink.clear();
    editor.redraw(80);
    tg_assert(sink.content() == "\r> élan\033[J\r\033[6C");
    tg_assert(not editor.dirty());

    // 2 + 10 columns on a 5 columns wide terminal: rows 0 to 2, the
    // cursor after 'c' sits on row 1
    editor.reset();
    editor.insert("abcdefghij");
    editor.handle_key(Key::Home);
    editor.handle_key(Key::Right);
    editor.handle_key(Key::Right);
    editor.handle_key(Key::Right);
    tg_assert(editor.screen_line_count(5) == 3);
    tg_assert(editor.cursor_column() == 5);
    sink.clear();
    editor.redraw(5);
    tg_assert(sink.content() == "\r> abcdefghij\033[J\033[1A\r");

    // the next redraw starts from the first input row
    sink.clear();
    editor.redraw(5);
    tg_assert(sink.content() == "\033[1A\r> abcdefghij\033[J\033[1A\r");

    // line ending on the last column moves to the next row itself
    editor.reset();
    editor.insert("abc");
    sink.clear();
    editor.redraw(5);
    tg_assert(sink.content() == "\r> abc\r\n\033[J\r");
    tg_assert(editor.screen_line_count(5) == 2);
}};

}
