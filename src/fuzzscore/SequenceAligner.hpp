#pragma once

#include <cstddef>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace fuzzscore
{

/**
 * @brief A run of symbols common to both sequences: a[pos_a, pos_a + length) == b[pos_b, pos_b + length).
 */
struct MatchingBlock
{
    size_t pos_a = 0;
    size_t pos_b = 0;
    size_t length = 0;

    bool operator==(const MatchingBlock& other) const
    {
        return pos_a == other.pos_a && pos_b == other.pos_b && length == other.length;
    }
    bool operator!=(const MatchingBlock& other) const { return !(*this == other); }
};

/**
 * @brief Tuning of the longest-match search.
 *
 * autojunk: for b of at least kAutojunkMinLength symbols, symbols occurring more
 * than len(b) / 100 + 1 times are not indexed when locating candidate runs. Found
 * runs are still extended across them. This bounds runtime on repetitive input
 * and changes scores there, so it is exposed as a setting.
 */
struct AlignerOptions
{
    static constexpr size_t kAutojunkMinLength = 200;

    bool autojunk = true;
};

/**
 * @brief Ratcliff-Obershelp matching over two code point sequences.
 *
 * Finds the longest common run, then searches the unmatched regions to its left
 * and right until no common run remains. The regions are kept on an explicit work
 * stack. Both views must outlive the aligner.
 *
 * Example:
 * @code
 * SequenceAligner aligner(U"abxcd", U"abcd");
 * aligner.matchingBlocks(); // {0,0,2}, {3,2,2}, {5,4,0}
 * aligner.ratio();          // 2 * 4 / 9
 * @endcode
 */
class SequenceAligner
{
public:
    SequenceAligner(std::u32string_view a, std::u32string_view b, AlignerOptions options = {});

    /**
     * @brief Longest common run within a[alo, ahi) and b[blo, bhi).
     *
     * Ties go to the earliest start in a, then the earliest start in b. A zero-length
     * result is reported at (alo, blo).
     */
    MatchingBlock findLongestMatch(size_t alo, size_t ahi, size_t blo, size_t bhi);

    /**
     * @brief Non-overlapping blocks in ascending order, adjacent runs merged.
     *
     * The list always ends with the sentinel (len(a), len(b), 0).
     */
    const std::vector<MatchingBlock>& matchingBlocks();

    /// 2 * M / T, where M is the matched symbol count and T = len(a) + len(b). 1.0 when both are empty.
    double ratio();

    /// True when the symbol was excluded from the index by the autojunk heuristic.
    bool isPopular(char32_t symbol) const;

private:
    std::u32string_view a_;
    std::u32string_view b_;
    AlignerOptions options_;

    std::unordered_map<char32_t, std::vector<size_t>> b2j_;
    std::unordered_set<char32_t> popular_;

    // Latest row of the run-length table: run_length_[j + 1] is the length of the
    // common run ending at the current a position and b[j].
    std::vector<size_t> run_length_;

    std::vector<MatchingBlock> blocks_;
    bool blocks_ready_ = false;
};

} // namespace fuzzscore
