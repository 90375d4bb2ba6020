#include "RapidfuzzBackend.hpp"

#include <rapidfuzz/fuzz.hpp>
#include <algorithm>

namespace fuzzscore
{

RapidfuzzBackend::RapidfuzzBackend() = default;

RapidfuzzBackend::~RapidfuzzBackend() = default;

double RapidfuzzBackend::ratio(std::u32string_view s1, std::u32string_view s2) const
{
    return callRapidfuzzAlgorithm(s1, s2, Algorithm::Ratio);
}

double RapidfuzzBackend::partialRatio(std::u32string_view s1, std::u32string_view s2) const
{
    return callRapidfuzzAlgorithm(s1, s2, Algorithm::PartialRatio);
}

double RapidfuzzBackend::tokenSortRatio(std::u32string_view s1, std::u32string_view s2) const
{
    return callRapidfuzzAlgorithm(s1, s2, Algorithm::TokenSortRatio);
}

double RapidfuzzBackend::partialTokenSortRatio(std::u32string_view s1, std::u32string_view s2) const
{
    return callRapidfuzzAlgorithm(s1, s2, Algorithm::PartialTokenSortRatio);
}

double RapidfuzzBackend::tokenSetRatio(std::u32string_view s1, std::u32string_view s2) const
{
    return callRapidfuzzAlgorithm(s1, s2, Algorithm::TokenSetRatio);
}

double RapidfuzzBackend::partialTokenSetRatio(std::u32string_view s1, std::u32string_view s2) const
{
    return callRapidfuzzAlgorithm(s1, s2, Algorithm::PartialTokenSetRatio);
}

double RapidfuzzBackend::wRatio(std::u32string_view s1, std::u32string_view s2) const
{
    return callRapidfuzzAlgorithm(s1, s2, Algorithm::WRatio);
}

double RapidfuzzBackend::callRapidfuzzAlgorithm(std::u32string_view s1, std::u32string_view s2,
                                                Algorithm algorithm) const
{
    double rapidfuzz_score = 0.0;

    switch (algorithm)
    {
    case Algorithm::Ratio:
        rapidfuzz_score = rapidfuzz::fuzz::ratio(s1, s2);
        break;

    case Algorithm::PartialRatio:
        rapidfuzz_score = rapidfuzz::fuzz::partial_ratio(s1, s2);
        break;

    case Algorithm::TokenSortRatio:
        rapidfuzz_score = rapidfuzz::fuzz::token_sort_ratio(s1, s2);
        break;

    case Algorithm::PartialTokenSortRatio:
        rapidfuzz_score = rapidfuzz::fuzz::partial_token_sort_ratio(s1, s2);
        break;

    case Algorithm::TokenSetRatio:
        rapidfuzz_score = rapidfuzz::fuzz::token_set_ratio(s1, s2);
        break;

    case Algorithm::PartialTokenSetRatio:
        rapidfuzz_score = rapidfuzz::fuzz::partial_token_set_ratio(s1, s2);
        break;

    case Algorithm::WRatio:
        rapidfuzz_score = rapidfuzz::fuzz::WRatio(s1, s2);
        break;
    }

    return std::clamp(rapidfuzz_score, 0.0, 100.0);
}

} // namespace fuzzscore
