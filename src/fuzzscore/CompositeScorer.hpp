#pragma once

#include "RatioEngine.hpp"
#include "TokenNormalizer.hpp"

#include <string_view>

namespace fuzzscore
{

/**
 * @brief Length-adaptive combination of the ratio heuristics (WRatio).
 *
 * Steps:
 * 1. Empty input scores 0.
 * 2. base = ratio(s1, s2).
 * 3. len_ratio = longer / shorter length.
 *    - below 1.5: token sort and token set ratios, scaled by 0.95.
 *    - otherwise: partial, partial token sort and partial token set ratios,
 *      scaled by 0.9 (0.6 when len_ratio exceeds 8); token based ones also by 0.95.
 * 4. The highest value wins, rounded half to even.
 *
 * Scaling keeps 100 reserved for full-string matches.
 */
class CompositeScorer
{
public:
    static constexpr double kPartialThreshold = 1.5;
    static constexpr double kFarPartialThreshold = 8.0;
    static constexpr double kTokenScale = 0.95;
    static constexpr double kPartialScale = 0.9;
    static constexpr double kFarPartialScale = 0.6;

    CompositeScorer(const RatioEngine& engine, const TokenNormalizer& tokens);

    [[nodiscard]] int wRatio(std::u32string_view s1, std::u32string_view s2) const;

private:
    const RatioEngine& engine_;
    const TokenNormalizer& tokens_;
};

} // namespace fuzzscore
