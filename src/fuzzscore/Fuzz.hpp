#pragma once

#include <optional>
#include <string_view>

namespace fuzzscore
{

/**
 * @brief A UTF-8 argument that may be absent.
 *
 * std::nullopt is the absent value; every scorer returns 0 for it. Non-string
 * values go through toText() (Preprocessor.hpp) first.
 */
using Text = std::optional<std::string_view>;

// Basic scoring. No preprocessing; identical inputs score 100, an empty input 0.

/// Similarity of the two full strings, 0-100.
int ratio(Text s1, Text s2);

/// Similarity of the most similar substring, 0-100.
int partialRatio(Text s1, Text s2);

// Token scoring. With full_process the inputs are normalized first and an input
// that normalizes to nothing scores 0.

/// ratio after sorting the tokens of each string.
int tokenSortRatio(Text s1, Text s2, bool force_ascii = true, bool full_process = true);

/// partialRatio after sorting the tokens of each string.
int partialTokenSortRatio(Text s1, Text s2, bool force_ascii = true, bool full_process = true);

/// Best ratio among the shared token set and each side's shared-plus-extra tokens.
int tokenSetRatio(Text s1, Text s2, bool force_ascii = true, bool full_process = true);

/// tokenSetRatio with partialRatio comparisons.
int partialTokenSetRatio(Text s1, Text s2, bool force_ascii = true, bool full_process = true);

// Combination API. Inputs that are empty after processing always score 0.

/**
 * @brief Quick ratio: normalize, reject empty results, then ratio.
 *
 * @param force_ascii Drop non-ASCII code points while normalizing
 * @param full_process Normalize inputs; pass false when they are already normalized
 */
int QRatio(Text s1, Text s2, bool force_ascii = true, bool full_process = true);

/// QRatio keeping full Unicode.
int UQRatio(Text s1, Text s2, bool full_process = true);

/**
 * @brief Weighted ratio: the best of several heuristics, chosen by the length ratio of the inputs.
 *
 * See CompositeScorer for the weighting. Partial results are discounted so only
 * full-string matches reach 100.
 */
int WRatio(Text s1, Text s2, bool force_ascii = true, bool full_process = true);

/// WRatio keeping full Unicode.
int UWRatio(Text s1, Text s2, bool full_process = true);

} // namespace fuzzscore
