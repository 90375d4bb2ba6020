#include "RatioEngine.hpp"

#include <algorithm>
#include <cmath>

namespace fuzzscore
{

namespace
{

constexpr double kExactWindowRatio = 0.995;

} // namespace

int toScore(double value)
{
    // nearbyint honours the current rounding mode, which is round-to-nearest-even by default.
    return static_cast<int>(std::nearbyint(value));
}

RatioEngine::RatioEngine(AlignerOptions options) : options_(options)
{
}

int RatioEngine::ratio(std::u32string_view s1, std::u32string_view s2) const
{
    if (s1 == s2)
        return 100;
    if (s1.empty() || s2.empty())
        return 0;

    SequenceAligner aligner(s1, s2, options_);
    return toScore(100.0 * aligner.ratio());
}

int RatioEngine::partialRatio(std::u32string_view s1, std::u32string_view s2) const
{
    if (s1 == s2)
        return 100;
    if (s1.empty() || s2.empty())
        return 0;

    const std::u32string_view shorter = s1.size() <= s2.size() ? s1 : s2;
    const std::u32string_view longer = s1.size() <= s2.size() ? s2 : s1;

    SequenceAligner aligner(shorter, longer, options_);

    double best = 0.0;
    for (const auto& block : aligner.matchingBlocks())
    {
        const size_t start = block.pos_b > block.pos_a ? block.pos_b - block.pos_a : 0;
        const std::u32string_view window = longer.substr(start, shorter.size());

        SequenceAligner window_aligner(shorter, window, options_);
        const double window_ratio = window_aligner.ratio();
        if (window_ratio > kExactWindowRatio)
            return 100;

        best = std::max(best, window_ratio);
    }

    return toScore(100.0 * best);
}

} // namespace fuzzscore
