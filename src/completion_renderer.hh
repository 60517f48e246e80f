#ifndef completion_renderer_hh_INCLUDED
#define completion_renderer_hh_INCLUDED

#include "array_view.hh"
#include "candidate.hh"
#include "face.hh"
#include "grid_layout.hh"
#include "line_buffer.hh"
#include "output_sink.hh"

namespace Tabgrid
{

// Draws the candidate grid on the rows below the input line with escape
// sequences, leaving the cursor where the line editor had it.
class CompletionRenderer
{
public:
    CompletionRenderer(OutputSink& sink, Face selected_face);

    static GridLayout layout(ConstArrayView<Candidate> candidates, ColumnCount width);

    // selected is -1 when no cell is highlighted, nothing is written when
    // the returned layout has no column
    GridLayout draw(const LineBuffer& buffer, ColumnCount width,
                    ConstArrayView<Candidate> candidates, int selected);

    // clears everything below the input line
    void erase(const LineBuffer& buffer, ColumnCount width);

private:
    // rows between the cursor and the first row below the input
    static LineCount rows_below_cursor(const LineBuffer& buffer, ColumnCount width);
    void move_back(const LineBuffer& buffer, ColumnCount width, LineCount rows);

    OutputSink& m_sink;
    String m_selected_sgr;
};

}

#endif // completion_renderer_hh_INCLUDED
