#include "CompositeScorer.hpp"

#include <algorithm>

namespace fuzzscore
{

CompositeScorer::CompositeScorer(const RatioEngine& engine, const TokenNormalizer& tokens)
    : engine_(engine), tokens_(tokens)
{
}

int CompositeScorer::wRatio(std::u32string_view s1, std::u32string_view s2) const
{
    if (s1.empty() || s2.empty())
        return 0;

    const double base = engine_.ratio(s1, s2);
    const double len_ratio = static_cast<double>(std::max(s1.size(), s2.size())) /
                             static_cast<double>(std::min(s1.size(), s2.size()));

    if (len_ratio < kPartialThreshold)
    {
        const double tsor = tokens_.tokenSortRatio(s1, s2, false) * kTokenScale;
        const double tser = tokens_.tokenSetRatio(s1, s2, false) * kTokenScale;
        return toScore(std::max({base, tsor, tser}));
    }

    const double partial_scale = len_ratio > kFarPartialThreshold ? kFarPartialScale : kPartialScale;

    const double partial = engine_.partialRatio(s1, s2) * partial_scale;
    const double ptsor = tokens_.tokenSortRatio(s1, s2, true) * kTokenScale * partial_scale;
    const double ptser = tokens_.tokenSetRatio(s1, s2, true) * kTokenScale * partial_scale;
    return toScore(std::max({base, partial, ptsor, ptser}));
}

} // namespace fuzzscore
