#include "layout/numbering.h"

namespace crossgen {

NumberedLayout number_grid(const Grid& grid) {
    NumberedLayout layout;
    layout.cell_numbers.assign(grid.cells().size(), 0);

    std::size_t next = 1;
    for (int y = 0; y < grid.height(); ++y) {
        for (int x = 0; x < grid.width(); ++x) {
            const bool across = grid.starts_word(x, y, false);
            const bool down   = grid.starts_word(x, y, true);
            if (!across && !down) continue;

            const std::size_t n = next++;
            layout.cell_numbers[grid.index_of(x, y)] = n;
            if (across) {
                layout.across.push_back(
                    NumberedEntry{n, x, y, false, grid.read_run(x, y, false)});
            }
            if (down) {
                layout.down.push_back(
                    NumberedEntry{n, x, y, true, grid.read_run(x, y, true)});
            }
        }
    }
    return layout;
}

} // namespace crossgen
