#pragma once

/// Clue numbering for a finished grid.
///
/// Cells are visited left to right, top to bottom.  A cell that starts
/// an across run, a down run, or both (runs of length ≥ 2 only) takes
/// the next number; both directions share it.

#include "grid/grid.h"

#include <cstddef>
#include <string>
#include <vector>

namespace crossgen {

struct NumberedEntry {
    std::size_t number = 0;
    int x = 0;
    int y = 0;
    bool vertical = false;
    std::string answer;
};

struct NumberedLayout {
    std::vector<NumberedEntry> across;
    std::vector<NumberedEntry> down;

    /// Number shown in each cell (0 = none), indexed like Grid::cells().
    std::vector<std::size_t> cell_numbers;
};

NumberedLayout number_grid(const Grid& grid);

} // namespace crossgen
