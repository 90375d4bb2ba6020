#pragma once

#include "RatioEngine.hpp"

#include <string>
#include <string_view>

namespace fuzzscore
{

/// Whitespace tokens sorted by code point, joined with single spaces.
std::u32string sortTokens(std::u32string_view text);

/**
 * @brief Token-order and token-repetition insensitive scoring.
 *
 * Token sort compares the alphabetized token strings. Token set compares the
 * shared vocabulary against each side's shared vocabulary plus its extra tokens:
 * @code
 * sect       = sorted(tokens1 & tokens2)
 * combined_1 = sect + " " + sorted(tokens1 - tokens2)
 * combined_2 = sect + " " + sorted(tokens2 - tokens1)
 * score      = max(f(sect, combined_1), f(sect, combined_2), f(combined_1, combined_2))
 * @endcode
 * where f is ratio or partialRatio.
 */
class TokenNormalizer
{
public:
    explicit TokenNormalizer(const RatioEngine& engine);

    [[nodiscard]] int tokenSortRatio(std::u32string_view s1, std::u32string_view s2, bool partial) const;
    [[nodiscard]] int tokenSetRatio(std::u32string_view s1, std::u32string_view s2, bool partial) const;

private:
    int compare(std::u32string_view s1, std::u32string_view s2, bool partial) const;

    const RatioEngine& engine_;
};

} // namespace fuzzscore
