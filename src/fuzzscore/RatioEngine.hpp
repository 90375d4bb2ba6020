#pragma once

#include "SequenceAligner.hpp"

#include <string_view>

namespace fuzzscore
{

/// Round a 0-100 value to an integer score, ties to even (12.5 -> 12, 37.5 -> 38).
int toScore(double value);

/**
 * @brief Full-string and best-window ratios on top of SequenceAligner.
 *
 * Both operations short-circuit before alignment: identical inputs score 100
 * (even when both are empty), otherwise an empty input scores 0.
 */
class RatioEngine
{
public:
    explicit RatioEngine(AlignerOptions options = {});

    /// round(100 * 2M / T) over the two full sequences.
    [[nodiscard]] int ratio(std::u32string_view s1, std::u32string_view s2) const;

    /**
     * @brief Best ratio of the shorter input against an equally long window of the longer one.
     *
     * Windows are anchored on the matching blocks of align(shorter, longer). A window
     * scoring above 0.995 ends the search with 100.
     */
    [[nodiscard]] int partialRatio(std::u32string_view s1, std::u32string_view s2) const;

    [[nodiscard]] const AlignerOptions& options() const { return options_; }

private:
    AlignerOptions options_;
};

} // namespace fuzzscore
