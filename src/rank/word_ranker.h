#pragma once

/// Word ranking by corpus character frequency.
///
/// A word's score is the sum, over its characters, of each character's
/// relative frequency across the whole input list.  Words built from
/// common letters offer more crossing opportunities to the words placed
/// after them, so generation places high scorers first.

#include <string>
#include <unordered_map>
#include <vector>

namespace crossgen {

/// Relative frequency of every character over all characters of `words`.
/// Empty if `words` holds no characters.
std::unordered_map<char, double>
character_frequencies(const std::vector<std::string>& words);

/// Score of `word` under a frequency table; characters absent from
/// the table contribute nothing.
double word_score(const std::string& word,
                  const std::unordered_map<char, double>& frequencies);

/// `words` reordered by descending score.  The sort is stable, so equal
/// scores keep their input order.
std::vector<std::string> rank_words(std::vector<std::string> words);

} // namespace crossgen
