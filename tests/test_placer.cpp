/// Tests for the intersection index and the placer:
///   - anchor eligibility and the horizontal-first priority
///   - fits(): overwrite, crossings, side contact, end caps, bounds
///   - place(): candidate enumeration, wrap

#include "grid/grid.h"
#include "search/intersection_index.h"
#include "search/placer.h"

#include <cassert>
#include <cstdio>
#include <string>
#include <vector>

using namespace crossgen;

// ── Helpers ─────────────────────────────────────────────────────────

static Config make_config(std::size_t w, std::size_t h, bool wrap = false) {
    Config c;
    c.width = w;
    c.height = h;
    c.wrap = wrap;
    return c;
}

/// 5×5 grid with CAT across row 2, columns 1–3.
static Grid cat_grid() {
    return Grid(make_config(5, 5)).with_word_placed(1, 2, false, "CAT");
}

/// cat_grid() plus TAR down column 3 from the shared T.
static Grid cat_tar_grid() {
    return cat_grid().with_word_placed(3, 2, true, "TAR");
}

// ════════════════════════════════════════════════════════════════════
//  Intersection index
// ════════════════════════════════════════════════════════════════════

static void test_index_across_word_offers_down_anchors() {
    std::printf("  across word -> vertical anchors\n");

    IntersectionIndex idx(cat_grid());
    assert(idx.size() == 3);
    for (char c : std::string("CAT")) {
        const auto& pts = idx.points_for(c);
        assert(pts.size() == 1);
        assert(pts[0].direction == Direction::VERTICAL);
        assert(pts[0].ch == c);
        assert(pts[0].y == 2);
    }
    assert(idx.points_for('A')[0].x == 2);
    assert(idx.points_for('Z').empty());
}

static void test_index_horizontal_priority() {
    std::printf("  isolated letter -> horizontal only\n");

    Grid g = Grid(make_config(5, 5)).with_word_placed(2, 2, false, "A");
    assert(is_crossable(g, 2, 2, Direction::HORIZONTAL));
    assert(is_crossable(g, 2, 2, Direction::VERTICAL));

    IntersectionIndex idx(g);
    assert(idx.size() == 1);
    assert(idx.points_for('A')[0].direction == Direction::HORIZONTAL);
}

static void test_index_omits_blocked_cells() {
    std::printf("  no open direction -> omitted\n");

    // A 1×1 grid leaves no room on either side.
    Grid tiny = Grid(make_config(1, 1)).with_word_placed(0, 0, false, "A");
    assert(IntersectionIndex(tiny).empty());

    // The shared T of CAT/TAR has filled neighbours both ways.
    IntersectionIndex idx(cat_tar_grid());
    for (const auto& p : idx.points_for('T')) {
        assert(!(p.x == 3 && p.y == 2));
    }
}

static void test_index_empty_grid() {
    std::printf("  empty grid -> empty index\n");

    IntersectionIndex idx(Grid(make_config(4, 4)));
    assert(idx.empty());
    assert(idx.size() == 0);
}

// ════════════════════════════════════════════════════════════════════
//  fits
// ════════════════════════════════════════════════════════════════════

static void test_fits_valid_crossing() {
    std::printf("  crossing through a shared letter\n");

    Grid g = cat_grid();
    assert(fits(g, "TAR", true, 3, 2));
    assert(fits(g, "AX", true, 2, 2));
    assert(fits(g, "ART", true, 3, 0));
}

static void test_fits_rejects_overwrite() {
    std::printf("  different letter already present\n");

    // DOG down column 2 would put G on A.
    assert(!fits(cat_grid(), "DOG", true, 2, 0));
}

static void test_fits_rejects_no_crossing() {
    std::printf("  zero crossings\n");

    Grid g = cat_grid();
    assert(!fits(g, "DOG", false, 0, 0));
    assert(!fits(g, "DOG", true, 0, 0));
}

static void test_fits_rejects_nothing_new() {
    std::printf("  every letter already on the grid\n");

    Grid g = cat_grid();
    // A one-letter word sitting on a matching letter adds no cell.
    assert(!fits(g, "A", true, 2, 2));
    assert(!fits(g, "A", false, 2, 2));
    assert(place(g, "A").empty());
    assert(place(g, "T").empty());

    // Neither does a word lying along CAT itself.
    assert(!fits(g, "CAT", false, 1, 2));
}

static void test_fits_rejects_parallel_overlap() {
    std::printf("  word running through a parallel word\n");

    // CATS over CAT: the caps are open and S is new, but C, A, T are
    // CAT's own cells, not crossings.
    assert(!fits(cat_grid(), "CATS", false, 1, 2));
    assert(!fits(cat_grid(), "SCAT", false, 0, 2));

    // STAR down column 3 would swallow TAR; across through TAR's R is
    // the only legal placement.
    assert(!fits(cat_tar_grid(), "STAR", true, 3, 1));
    auto star = place(cat_tar_grid(), "STAR");
    assert(star.size() == 1);
    const auto& p = star[0].placements().back();
    assert(!p.vertical && p.x == 0 && p.y == 4);
}

static void test_fits_rejects_side_contact() {
    std::printf("  new letter beside another word\n");

    // AX down column 2 is fine on its own, but with TAR in column 3
    // the X would touch TAR's A.
    assert(fits(cat_grid(), "AX", true, 2, 2));
    assert(!fits(cat_tar_grid(), "AX", true, 2, 2));
}

static void test_fits_rejects_end_contact() {
    std::printf("  word touching another along its own line\n");

    Grid g = cat_tar_grid();
    // ET down column 3 ends on TAR's T and runs into its A.
    assert(!fits(g, "ET", true, 3, 1));
    // CA across over CAT is followed by T.
    assert(!fits(g, "CA", false, 1, 2));
    // OC down through C of CAT has open cells at both ends.
    assert(fits(g, "OC", true, 1, 1));
}

static void test_fits_rejects_out_of_bounds() {
    std::printf("  span off the grid\n");

    Grid g = cat_grid();
    assert(!fits(g, "TOWERS", true, 3, 2));
    assert(!fits(g, "ABCAT", false, -2, 2));
    assert(!span_in_bounds(g, 6, true, 3, 0));
    assert(span_in_bounds(g, 5, true, 3, 0));
    assert(!span_in_bounds(g, 0, false, 0, 0));
}

// ════════════════════════════════════════════════════════════════════
//  place
// ════════════════════════════════════════════════════════════════════

static void test_place_enumerates_every_anchor() {
    std::printf("  TAR / ART on CAT: two candidates each\n");

    Grid g = cat_grid();

    auto tar = place(g, "TAR");
    assert(tar.size() == 2);
    for (const auto& c : tar) {
        assert(c.contains_word("TAR"));
        assert(c.contains_word("CAT"));
        assert(c.num_words() == 2);
        assert(c.density() == 6.0 / 25.0);
    }
    // Through T at column 3, or through A with T above it.
    assert(tar[0].char_at(3, 4) == 'R' || tar[1].char_at(3, 4) == 'R');
    assert(tar[0].char_at(2, 1) == 'T' || tar[1].char_at(2, 1) == 'T');

    auto art = place(g, "ART");
    assert(art.size() == 2);

    // The parent is never modified.
    assert(g.num_words() == 1);
}

static void test_place_matches_find_placements() {
    std::printf("  place() agrees with find_placements()\n");

    Grid g = cat_grid();
    IntersectionIndex idx(g);
    auto spans = find_placements(g, idx, "ART");
    auto grids = place(g, idx, "ART");
    assert(spans.size() == grids.size());
    for (std::size_t i = 0; i < spans.size(); ++i) {
        const auto& p = grids[i].placements().back();
        assert(p.x == spans[i].x && p.y == spans[i].y);
        assert(p.vertical == spans[i].vertical);
        assert(fits(g, "ART", spans[i].vertical, spans[i].x, spans[i].y));
    }
}

static void test_place_nothing_legal() {
    std::printf("  no candidates\n");

    Grid g = cat_grid();
    assert(place(g, "TOWERS").empty());   // only T, and it runs off
    assert(place(g, "DOG").empty());      // no shared letter
    assert(place(g, "").empty());
    assert(place(Grid(make_config(5, 5)), "CAT").empty());
}

static void test_place_keeps_density_in_range() {
    std::printf("  no candidate may push word letters past the cell count\n");

    //   CB
    //   .A
    //   .E      BE across the bottom row would be legal geometry,
    //           but 3 words of 7 letters on 6 cells is density 7/6.
    Grid g = Grid(make_config(2, 3))
                 .with_word_placed(1, 0, true, "BAE")
                 .with_word_placed(0, 0, false, "CB");
    assert(g.word_letters() == 5);
    assert(fits(g, "BE", false, 0, 2));
    assert(place(g, "BE").empty());

    // One letter fewer fits the budget.
    Grid h = Grid(make_config(2, 3)).with_word_placed(1, 0, true, "BAE");
    auto grids = place(h, "BE");
    assert(!grids.empty());
    for (const auto& c : grids) assert(c.density() <= 1.0);
}

static void test_place_wrap_negative_start() {
    std::printf("  wrap: negative start accepted when the span fits\n");

    // AB down column 0 of a 6-wide cylinder.
    Grid g = Grid(make_config(6, 3, true)).with_word_placed(0, 0, true, "AB");
    IntersectionIndex idx(g);
    assert(idx.points_for('A')[0].direction == Direction::HORIZONTAL);
    assert(idx.points_for('B')[0].direction == Direction::HORIZONTAL);

    // CRAB through A at (0,0): starts at x = -2, i.e. column 4.
    assert(fits(g, "CRAB", false, -2, 0));

    auto grids = place(g, idx, "CRAB");
    assert(grids.size() == 2);
    const Grid& first = grids[0];
    const auto& p = first.placements().back();
    assert(p.word == "CRAB" && !p.vertical && p.x == 4 && p.y == 0);
    assert(first.char_at(4, 0) == 'C');
    assert(first.char_at(5, 0) == 'R');
    assert(first.char_at(0, 0) == 'A');
    assert(first.char_at(1, 0) == 'B');

    // Same shape without wrap runs off the left edge.
    Grid flat = Grid(make_config(6, 3)).with_word_placed(0, 0, true, "AB");
    assert(!fits(flat, "CRAB", false, -2, 0));

    // A wrapped word must be shorter than the row.
    assert(span_in_bounds(g, 5, false, -2, 0));
    assert(!span_in_bounds(g, 6, false, 0, 0));
}

// ════════════════════════════════════════════════════════════════════
//  main
// ════════════════════════════════════════════════════════════════════

int main() {
    std::printf("=== Placer tests ===\n\n");

    std::printf("Intersection index:\n");
    test_index_across_word_offers_down_anchors();
    test_index_horizontal_priority();
    test_index_omits_blocked_cells();
    test_index_empty_grid();

    std::printf("\nfits:\n");
    test_fits_valid_crossing();
    test_fits_rejects_overwrite();
    test_fits_rejects_no_crossing();
    test_fits_rejects_nothing_new();
    test_fits_rejects_parallel_overlap();
    test_fits_rejects_side_contact();
    test_fits_rejects_end_contact();
    test_fits_rejects_out_of_bounds();

    std::printf("\nplace:\n");
    test_place_enumerates_every_anchor();
    test_place_matches_find_placements();
    test_place_nothing_legal();
    test_place_keeps_density_in_range();
    test_place_wrap_negative_start();

    std::printf("\nAll placer tests passed.\n");
    return 0;
}
