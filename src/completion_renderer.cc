#include "completion_renderer.hh"

#include "format.hh"
#include "string_utils.hh"
#include "unit_tests.hh"

#include <algorithm>

namespace Tabgrid
{

CompletionRenderer::CompletionRenderer(OutputSink& sink, Face selected_face)
    : m_sink{sink}, m_selected_sgr{sgr(selected_face)}
{
}

GridLayout CompletionRenderer::layout(ConstArrayView<Candidate> candidates, ColumnCount width)
{
    ColumnCount widest = 0;
    for (auto& candidate : candidates)
        widest = std::max(widest, candidate.display.column_length());
    return compute_grid_layout(widest, (int)candidates.size(), width);
}

LineCount CompletionRenderer::rows_below_cursor(const LineBuffer& buffer, ColumnCount width)
{
    return buffer.screen_line_count(width) - (int)(buffer.cursor_column() / width);
}

void CompletionRenderer::move_back(const LineBuffer& buffer, ColumnCount width, LineCount rows)
{
    format_with([this](StringView s) { m_sink.write(s); }, "\033[{}A\r", rows);
    if (const ColumnCount column = buffer.cursor_column() % width; column > 0)
        format_with([this](StringView s) { m_sink.write(s); }, "\033[{}C", column);
}

GridLayout CompletionRenderer::draw(const LineBuffer& buffer, ColumnCount width,
                                    ConstArrayView<Candidate> candidates, int selected)
{
    auto grid = layout(candidates, width);
    if (grid.columns == 0)
        return grid;

    const LineCount line_count = rows_below_cursor(buffer, width);
    for (LineCount i = 0; i < line_count; ++i)
        m_sink.write("\r\n");
    m_sink.write("\033[J");

    LineCount lines = 1;
    int column = 0;
    for (int i = 0; i < (int)candidates.size(); ++i)
    {
        const auto& display = candidates[i].display;
        const bool is_selected = i == selected;
        if (is_selected)
            m_sink.write(m_selected_sgr);
        m_sink.write(right_pad(display, grid.column_width));
        if (is_selected)
            m_sink.write(sgr_reset);

        if (++column == grid.columns)
        {
            m_sink.write("\r\n");
            ++lines;
            column = 0;
        }
    }

    move_back(buffer, width, line_count - 1 + lines);
    m_sink.flush();
    return grid;
}

void CompletionRenderer::erase(const LineBuffer& buffer, ColumnCount width)
{
    const LineCount line_count = rows_below_cursor(buffer, width);
    for (LineCount i = 0; i < line_count; ++i)
        m_sink.write("\r\n");
    m_sink.write("\033[J");
    move_back(buffer, width, line_count);
    m_sink.flush();
}

namespace
{

// single row input line: prompt and text with the cursor at a given column
struct TestLineBuffer : LineBuffer
{
    TestLineBuffer(String text, ColumnCount cursor_column)
        : text{std::move(text)}, column{cursor_column} {}

    StringView line() const override { return text; }
    CharCount cursor_pos() const override { return text.char_length(); }
    void insert(StringView) override {}
    void erase_before(CharCount) override {}
    void erase_after(CharCount) override {}
    LineCount screen_line_count(ColumnCount width) const override { return (int)(column / width) + 1; }
    ColumnCount cursor_column() const override { return column; }

    String text;
    ColumnCount column;
};

}

UnitTest test_completion_renderer{[]()
{
    const CandidateList candidates{{"go", "o"}, {"git", "it"}, {"git-shell", "it-shell"}, {"grep", "rep"}};
    TestLineBuffer buffer{"g", 3};
    StringOutputSink sink;
    CompletionRenderer renderer{sink, parse_face("black,white")};

    // widest label is 8 columns wide, 3 columns of 9 fit in 30 - 1 with 2 spare
    auto grid = renderer.draw(buffer, 30, candidates, -1);
    tg_assert(grid.columns == 3 and grid.column_width == 9 and grid.rows == 2);
    tg_assert(sink.content() ==
              "\r\n\033[J"
              "o        it       it-shell \r\n"
              "rep      "
              "\033[2A\r\033[3C");
    tg_assert(sink.flush_count() == 1);

    // redrawing the same state writes the same bytes
    const String first = sink.content();
    sink.clear();
    renderer.draw(buffer, 30, candidates, -1);
    tg_assert(sink.content() == first);

    sink.clear();
    renderer.draw(buffer, 30, candidates, 1);
    tg_assert(sink.content() ==
              "\r\n\033[J"
              "o        \033[30;47mit       \033[0mit-shell \r\n"
              "rep      "
              "\033[2A\r\033[3C");

    // a full last row still ends with a row break
    sink.clear();
    renderer.draw(buffer, 40, candidates, 3);
    tg_assert(sink.content() ==
              "\r\n\033[J"
              "o        it       it-shell \033[30;47mrep      \033[0m\r\n"
              "\033[2A\r\033[3C");

    // cursor in the first column is not moved right
    sink.clear();
    TestLineBuffer empty_prompt{"", 0};
    renderer.draw(empty_prompt, 10, CandidateList{{"a", "a"}, {"b", "b"}}, -1);
    tg_assert(sink.content() == "\r\n\033[Ja b \033[1A\r");

    // labels wider than the terminal draw nothing
    sink.clear();
    grid = renderer.draw(buffer, 8, candidates, -1);
    tg_assert(grid.columns == 0 and sink.content().empty() and sink.flush_count() == 0);

    // wrapped input, cursor on the second of three rows
    sink.clear();
    struct WrappedBuffer : TestLineBuffer
    {
        using TestLineBuffer::TestLineBuffer;
        LineCount screen_line_count(ColumnCount) const override { return 3; }
    } three_rows{"", 25};
    renderer.draw(three_rows, 20, CandidateList{{"a", "a"}, {"b", "b"}}, -1);
    tg_assert(sink.content() == "\r\n\r\n\033[Ja b \033[2A\r\033[5C");

    sink.clear();
    renderer.erase(buffer, 30);
    tg_assert(sink.content() == "\r\n\033[J\033[1A\r\033[3C");

    // wide labels are padded by their display width
    sink.clear();
    const CandidateList wide{{"x", "日本"}, {"y", "ab"}};
    grid = renderer.draw(empty_prompt, 20, wide, -1);
    const ColumnCount wide_width = StringView{"日本"}.column_length();
    tg_assert(grid.column_width >= wide_width + 1);
    tg_assert(sink.content() == format("\r\n\033[J日本{}ab{}\033[1A\r",
                                       String{' ', grid.column_width - wide_width},
                                       String{' ', grid.column_width - 2}));
}};

}
