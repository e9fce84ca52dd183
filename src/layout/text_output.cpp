#include "layout/text_output.h"

#include <ostream>

namespace crossgen {

void write_grid(std::ostream& os, const Grid& grid) {
    for (int y = 0; y < grid.height(); ++y) {
        for (int x = 0; x < grid.width(); ++x) {
            const char c = grid.char_at(x, y);
            os << (c == EMPTY_CELL ? '.' : c);
        }
        os << '\n';
    }
}

static void write_section(std::ostream& os, const char* title,
                          const std::vector<NumberedEntry>& entries) {
    os << title << '\n';
    for (const auto& e : entries) {
        os << "  " << e.number << ". " << e.answer
           << " (" << e.x << ',' << e.y << ")\n";
    }
}

void write_entries(std::ostream& os, const NumberedLayout& layout) {
    write_section(os, "Across", layout.across);
    write_section(os, "Down", layout.down);
}

} // namespace crossgen
