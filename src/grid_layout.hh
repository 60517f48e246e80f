#ifndef grid_layout_hh_INCLUDED
#define grid_layout_hh_INCLUDED

#include "units.hh"

namespace Tabgrid
{

// Candidates are laid out row major, the last row may be short
struct GridLayout
{
    ColumnCount column_width = 0;
    // 0 when the widest label does not fit the terminal
    int columns = 0;
    LineCount rows = 0;

    friend bool operator==(const GridLayout&, const GridLayout&) = default;
};

GridLayout compute_grid_layout(ColumnCount widest_label, int item_count,
                               ColumnCount terminal_width);

enum class GridMove
{
    Advance,
    Retreat,
    RowStart,
    RowEnd,
    Up,
    Down,
};

// index reached from index by move, always in [0, item_count),
// a column count below one is handled as a single column
int grid_move(int index, int columns, int item_count, GridMove move);

}

#endif // grid_layout_hh_INCLUDED
