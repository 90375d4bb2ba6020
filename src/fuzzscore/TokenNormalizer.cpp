#include "TokenNormalizer.hpp"
#include "TextUtils.hpp"

#include <algorithm>
#include <iterator>
#include <set>
#include <vector>

namespace fuzzscore
{

namespace
{

using TokenSet = std::set<std::u32string>;

TokenSet toTokenSet(std::u32string_view text)
{
    auto tokens = splitTokens(std::u32string(text));
    return TokenSet(std::make_move_iterator(tokens.begin()), std::make_move_iterator(tokens.end()));
}

// std::set iterates in code point order, so the joined result is already sorted.
std::u32string joinSorted(const TokenSet& tokens)
{
    return joinTokens(std::vector<std::u32string>(tokens.begin(), tokens.end()));
}

std::u32string combine(const std::u32string& sect, const std::u32string& rest)
{
    return trim(sect + U" " + rest);
}

} // namespace

std::u32string sortTokens(std::u32string_view text)
{
    auto tokens = splitTokens(std::u32string(text));
    std::sort(tokens.begin(), tokens.end());
    return trim(joinTokens(tokens));
}

TokenNormalizer::TokenNormalizer(const RatioEngine& engine) : engine_(engine)
{
}

int TokenNormalizer::compare(std::u32string_view s1, std::u32string_view s2, bool partial) const
{
    return partial ? engine_.partialRatio(s1, s2) : engine_.ratio(s1, s2);
}

int TokenNormalizer::tokenSortRatio(std::u32string_view s1, std::u32string_view s2, bool partial) const
{
    const std::u32string sorted1 = sortTokens(s1);
    const std::u32string sorted2 = sortTokens(s2);
    return compare(sorted1, sorted2, partial);
}

int TokenNormalizer::tokenSetRatio(std::u32string_view s1, std::u32string_view s2, bool partial) const
{
    if (s1 == s2)
        return 100;
    if (s1.empty() || s2.empty())
        return 0;

    const TokenSet tokens1 = toTokenSet(s1);
    const TokenSet tokens2 = toTokenSet(s2);

    TokenSet intersection;
    TokenSet diff1to2;
    TokenSet diff2to1;
    std::set_intersection(tokens1.begin(), tokens1.end(), tokens2.begin(), tokens2.end(),
                          std::inserter(intersection, intersection.end()));
    std::set_difference(tokens1.begin(), tokens1.end(), tokens2.begin(), tokens2.end(),
                        std::inserter(diff1to2, diff1to2.end()));
    std::set_difference(tokens2.begin(), tokens2.end(), tokens1.begin(), tokens1.end(),
                        std::inserter(diff2to1, diff2to1.end()));

    const std::u32string sorted_sect = joinSorted(intersection);
    const std::u32string combined_1to2 = combine(sorted_sect, joinSorted(diff1to2));
    const std::u32string combined_2to1 = combine(sorted_sect, joinSorted(diff2to1));

    return std::max({compare(sorted_sect, combined_1to2, partial), compare(sorted_sect, combined_2to1, partial),
                     compare(combined_1to2, combined_2to1, partial)});
}

} // namespace fuzzscore
