#include "grid_layout.hh"

#include "assert.hh"
#include "unit_tests.hh"

#include <algorithm>

namespace Tabgrid
{

template<typename T>
static T div_round_up(T a, T b)
{
    return (a - T(1)) / b + T(1);
}

GridLayout compute_grid_layout(ColumnCount widest_label, int item_count,
                               ColumnCount terminal_width)
{
    GridLayout layout;
    layout.column_width = widest_label + 1;
    // keep the last terminal column free so the cursor never wraps
    const ColumnCount usable_width = terminal_width - 1;
    layout.columns = std::max(0, (int)(usable_width / layout.column_width));
    if (layout.columns == 0)
        return layout;

    layout.column_width += (usable_width - layout.column_width * layout.columns) / layout.columns;
    layout.rows = item_count > 0 ? div_round_up(item_count, layout.columns) : 0;
    return layout;
}

int grid_move(int index, int columns, int item_count, GridMove move)
{
    tg_assert(item_count > 0);
    if (item_count <= 0)
        return index;

    const int cols = std::max(columns, 1);
    const int grid_size = div_round_up(item_count, cols) * cols;

    switch (move)
    {
        case GridMove::Advance:
            return (index + 1) % item_count;
        case GridMove::Retreat:
        {
            const int res = (index - 1) % item_count;
            return res < 0 ? res + item_count : res;
        }
        case GridMove::RowStart:
            return index - index % cols;
        case GridMove::RowEnd:
            return std::min(index + (cols - index % cols - 1), item_count - 1);
        case GridMove::Down:
        {
            int res = index + cols;
            if (res >= grid_size)
                res -= grid_size;
            else if (res >= item_count) // short last row, wrap to the top
                res += cols - grid_size;
            return res;
        }
        case GridMove::Up:
        {
            int res = index - cols;
            if (res < 0)
            {
                res += grid_size;
                if (res >= item_count)
                    res -= cols;
            }
            return res;
        }
    }
    tg_assert(false);
    return index;
}

UnitTest test_grid_layout{[]()
{
    tg_assert((compute_grid_layout(5, 4, 80) == GridLayout{6, 13, 1}));
    tg_assert((compute_grid_layout(5, 4, 20) == GridLayout{6, 3, 2}));
    tg_assert((compute_grid_layout(9, 5, 30) == GridLayout{14, 2, 3}));
    tg_assert(compute_grid_layout(5, 4, 6).columns == 0);
    tg_assert(compute_grid_layout(5, 4, 0).columns == 0);
    tg_assert(compute_grid_layout(0, 3, 1).columns == 0);

    // every column fills the usable width exactly once redistributed
    for (int width = 2; width < 100; ++width)
    {
        for (int widest = 1; widest < 12; ++widest)
        {
            auto layout = compute_grid_layout(widest, 7, width);
            if (layout.columns == 0)
                continue;
            tg_assert(layout.column_width > widest);
            tg_assert(layout.column_width * layout.columns <= width - 1);
            tg_assert((width - 1) - layout.column_width * layout.columns < layout.columns);
        }
    }
}};

UnitTest test_grid_move{[]()
{
    // 10 candidates in 4 columns:
    //  0 1 2 3
    //  4 5 6 7
    //  8 9
    tg_assert(grid_move(9, 4, 10, GridMove::Advance) == 0);
    tg_assert(grid_move(0, 4, 10, GridMove::Retreat) == 9);
    tg_assert(grid_move(6, 4, 10, GridMove::RowStart) == 4);
    tg_assert(grid_move(5, 4, 10, GridMove::RowEnd) == 7);
    tg_assert(grid_move(8, 4, 10, GridMove::RowEnd) == 9);
    tg_assert(grid_move(9, 4, 10, GridMove::Down) == 1);
    tg_assert(grid_move(6, 4, 10, GridMove::Down) == 2);
    tg_assert(grid_move(2, 4, 10, GridMove::Up) == 6);
    tg_assert(grid_move(1, 4, 10, GridMove::Up) == 9);
    tg_assert(grid_move(-1, 4, 10, GridMove::Advance) == 0);
    tg_assert(grid_move(3, 0, 5, GridMove::Down) == 4);
    tg_assert(grid_move(3, 0, 5, GridMove::RowEnd) == 3);

    constexpr GridMove moves[] = { GridMove::Advance, GridMove::Retreat, GridMove::RowStart,
                                   GridMove::RowEnd, GridMove::Up, GridMove::Down };
    for (int count = 1; count <= 12; ++count)
    {
        for (int columns = 1; columns <= 5; ++columns)
        {
            const int rows = div_round_up(count, columns);
            for (int index = 0; index < count; ++index)
            {
                for (auto move : moves)
                {
                    const int res = grid_move(index, columns, count, move);
                    tg_assert(res >= 0 and res < count);
                }

                int res = index;
                for (int i = 0; i < count; ++i)
                    res = grid_move(res, columns, count, GridMove::Advance);
                tg_assert(res == index);

                res = index;
                for (int i = 0; i < count; ++i)
                    res = grid_move(res, columns, count, GridMove::Retreat);
                tg_assert(res == index);

                res = index;
                for (int i = 0; i < rows; ++i)
                {
                    res = grid_move(res, columns, count, GridMove::Down);
                    tg_assert(res % columns == index % columns);
                }

                tg_assert(grid_move(grid_move(index, columns, count, GridMove::Down),
                                    columns, count, GridMove::Up) == index);
                tg_assert(grid_move(grid_move(index, columns, count, GridMove::Up),
                                    columns, count, GridMove::Down) == index);
                tg_assert(grid_move(index, columns, count, GridMove::RowStart) / columns == index / columns);
                tg_assert(grid_move(index, columns, count, GridMove::RowEnd) / columns == index / columns);
            }
        }
    }
}};

}
