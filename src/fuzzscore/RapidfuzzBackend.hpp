#pragma once

#include "IScoringBackend.hpp"

namespace fuzzscore
{

/**
 * @brief Accelerated backend delegating to rapidfuzz-cpp.
 *
 * rapidfuzz scores with the normalized Indel similarity (2 * LCS / total length)
 * rather than block matching, so its scores are not those of ReferenceBackend.
 * The two agree on identical, disjoint and contained inputs and on reordered
 * tokens. Elsewhere they differ: "tide" vs "diet" is 50 here in either order,
 * 25 or 50 on the reference.
 */
class RapidfuzzBackend : public IScoringBackend
{
public:
    RapidfuzzBackend();
    ~RapidfuzzBackend() override;

    [[nodiscard]] const char* name() const override { return "rapidfuzz"; }

    [[nodiscard]] double ratio(std::u32string_view s1, std::u32string_view s2) const override;
    [[nodiscard]] double partialRatio(std::u32string_view s1, std::u32string_view s2) const override;
    [[nodiscard]] double tokenSortRatio(std::u32string_view s1, std::u32string_view s2) const override;
    [[nodiscard]] double partialTokenSortRatio(std::u32string_view s1, std::u32string_view s2) const override;
    [[nodiscard]] double tokenSetRatio(std::u32string_view s1, std::u32string_view s2) const override;
    [[nodiscard]] double partialTokenSetRatio(std::u32string_view s1, std::u32string_view s2) const override;
    [[nodiscard]] double wRatio(std::u32string_view s1, std::u32string_view s2) const override;

private:
    enum class Algorithm
    {
        Ratio,
        PartialRatio,
        TokenSortRatio,
        PartialTokenSortRatio,
        TokenSetRatio,
        PartialTokenSetRatio,
        WRatio
    };

    /**
     * @brief Call the matching rapidfuzz scorer and clamp the result to [0, 100].
     */
    double callRapidfuzzAlgorithm(std::u32string_view s1, std::u32string_view s2, Algorithm algorithm) const;
};

} // namespace fuzzscore
