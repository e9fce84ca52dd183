#include "search/generation.h"
#include "search/intersection_index.h"
#include "search/placer.h"

#include <iterator>
#include <utility>

namespace crossgen {

std::optional<Grid> seed_grid(const Config& config, const std::string& word,
                              bool vertical) {
    Grid grid(config);
    const int along = vertical ? grid.height() : grid.width();
    const int across = vertical ? grid.width() : grid.height();
    const int len = static_cast<int>(word.size());

    if (word.size() < MIN_WORD_LENGTH || len > along) return std::nullopt;

    const int start = (along - len) / 2;
    const int x = vertical ? across / 2 : start;
    const int y = vertical ? start : across / 2;
    if (!span_in_bounds(grid, word.size(), vertical, x, y))
        return std::nullopt;

    return grid.with_word_placed(x, y, vertical, word);
}

TrialResult run_generation(Grid grid, std::deque<std::string> pending,
                           std::mt19937_64& rng) {
    TrialResult result{std::move(grid), {}};
    std::vector<std::string> deferred;

    // Valid for result.grid only; dropped whenever the grid advances.
    std::optional<IntersectionIndex> index;

    while (!pending.empty()) {
        ++result.stats.iterations;
        std::string word = std::move(pending.front());
        pending.pop_front();

        if (word.size() < MIN_WORD_LENGTH) continue;
        if (result.grid.contains_word(word)) continue;

        if (!index) index.emplace(result.grid);
        auto candidates = find_placements(result.grid, *index, word);
        if (candidates.empty()) {
            ++result.stats.deferrals;
            deferred.push_back(std::move(word));
            continue;
        }

        std::uniform_int_distribution<std::size_t> pick(
            0, candidates.size() - 1);
        const Placement& chosen = candidates[pick(rng)];
        result.grid = result.grid.with_word_placed(
            chosen.x, chosen.y, chosen.vertical, word);
        ++result.stats.placements;
        index.reset();

        // Requeue: deferred ++ tail.
        pending.insert(pending.begin(),
                       std::make_move_iterator(deferred.begin()),
                       std::make_move_iterator(deferred.end()));
        deferred.clear();
    }
    return result;
}

/// Seed with the first word that fits along the given axis; the rest
/// of the list, in ranked order, becomes the pending queue.
static TrialResult run_seeded(const Config& config,
                              const std::vector<std::string>& ranked_words,
                              bool vertical,
                              std::mt19937_64& rng) {
    for (std::size_t k = 0; k < ranked_words.size(); ++k) {
        auto seeded = seed_grid(config, ranked_words[k], vertical);
        if (!seeded) continue;

        std::deque<std::string> pending;
        for (std::size_t i = 0; i < ranked_words.size(); ++i) {
            if (i != k) pending.push_back(ranked_words[i]);
        }
        return run_generation(std::move(*seeded), std::move(pending), rng);
    }

    // Nothing fits: the trial is the empty grid.
    return TrialResult{Grid(config), {}};
}

std::vector<TrialResult> run_trial(const Config& config,
                                   const std::vector<std::string>& ranked_words,
                                   std::mt19937_64& rng) {
    std::vector<TrialResult> results;
    results.reserve(2);
    results.push_back(run_seeded(config, ranked_words, false, rng));
    results.push_back(run_seeded(config, ranked_words, true, rng));
    return results;
}

} // namespace crossgen
