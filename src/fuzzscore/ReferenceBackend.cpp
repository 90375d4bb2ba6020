#include "ReferenceBackend.hpp"

namespace fuzzscore
{

ReferenceBackend::ReferenceBackend(AlignerOptions options)
    : engine_(options), tokens_(engine_), composite_(engine_, tokens_)
{
}

ReferenceBackend::~ReferenceBackend() = default;

double ReferenceBackend::ratio(std::u32string_view s1, std::u32string_view s2) const
{
    return engine_.ratio(s1, s2);
}

double ReferenceBackend::partialRatio(std::u32string_view s1, std::u32string_view s2) const
{
    return engine_.partialRatio(s1, s2);
}

double ReferenceBackend::tokenSortRatio(std::u32string_view s1, std::u32string_view s2) const
{
    return tokens_.tokenSortRatio(s1, s2, false);
}

double ReferenceBackend::partialTokenSortRatio(std::u32string_view s1, std::u32string_view s2) const
{
    return tokens_.tokenSortRatio(s1, s2, true);
}

double ReferenceBackend::tokenSetRatio(std::u32string_view s1, std::u32string_view s2) const
{
    return tokens_.tokenSetRatio(s1, s2, false);
}

double ReferenceBackend::partialTokenSetRatio(std::u32string_view s1, std::u32string_view s2) const
{
    return tokens_.tokenSetRatio(s1, s2, true);
}

double ReferenceBackend::wRatio(std::u32string_view s1, std::u32string_view s2) const
{
    return composite_.wRatio(s1, s2);
}

} // namespace fuzzscore
