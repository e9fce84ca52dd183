#include "rank/word_ranker.h"

#include <algorithm>
#include <cstddef>
#include <utility>

namespace crossgen {

/// Occurrences of each character over all words.
static std::unordered_map<char, std::size_t>
character_counts(const std::vector<std::string>& words, std::size_t& total) {
    std::unordered_map<char, std::size_t> counts;
    total = 0;
    for (const auto& w : words) {
        for (char c : w) ++counts[c];
        total += w.size();
    }
    return counts;
}

std::unordered_map<char, double>
character_frequencies(const std::vector<std::string>& words) {
    std::size_t total = 0;
    const auto counts = character_counts(words, total);

    std::unordered_map<char, double> freq;
    if (total == 0) return freq;
    for (const auto& [c, n] : counts) {
        freq[c] = static_cast<double>(n) / static_cast<double>(total);
    }
    return freq;
}

double word_score(const std::string& word,
                  const std::unordered_map<char, double>& frequencies) {
    double score = 0.0;
    for (char c : word) {
        auto it = frequencies.find(c);
        if (it != frequencies.end()) score += it->second;
    }
    return score;
}

std::vector<std::string> rank_words(std::vector<std::string> words) {
    // All frequencies share the denominator `total`, so ordering by the
    // summed counts is ordering by score, with exact ties.
    std::size_t total = 0;
    const auto counts = character_counts(words, total);

    std::vector<std::pair<std::size_t, std::string>> scored;
    scored.reserve(words.size());
    for (auto& w : words) {
        std::size_t s = 0;
        for (char c : w) s += counts.at(c);
        scored.emplace_back(s, std::move(w));
    }

    std::stable_sort(scored.begin(), scored.end(),
                     [](const auto& a, const auto& b) {
                         return a.first > b.first;
                     });

    std::vector<std::string> ranked;
    ranked.reserve(scored.size());
    for (auto& [s, w] : scored) ranked.push_back(std::move(w));
    return ranked;
}

} // namespace crossgen
