#pragma once

#include "CompositeScorer.hpp"
#include "IScoringBackend.hpp"
#include "RatioEngine.hpp"
#include "TokenNormalizer.hpp"

namespace fuzzscore
{

/**
 * @brief Backend built on SequenceAligner (Ratcliff-Obershelp block matching).
 *
 * Scores are integral; the fractional return type only satisfies the interface.
 */
class ReferenceBackend : public IScoringBackend
{
public:
    explicit ReferenceBackend(AlignerOptions options = {});
    ~ReferenceBackend() override;

    // The scorers hold references into this object.
    ReferenceBackend(const ReferenceBackend&) = delete;
    ReferenceBackend& operator=(const ReferenceBackend&) = delete;

    [[nodiscard]] const char* name() const override { return "reference"; }

    [[nodiscard]] double ratio(std::u32string_view s1, std::u32string_view s2) const override;
    [[nodiscard]] double partialRatio(std::u32string_view s1, std::u32string_view s2) const override;
    [[nodiscard]] double tokenSortRatio(std::u32string_view s1, std::u32string_view s2) const override;
    [[nodiscard]] double partialTokenSortRatio(std::u32string_view s1, std::u32string_view s2) const override;
    [[nodiscard]] double tokenSetRatio(std::u32string_view s1, std::u32string_view s2) const override;
    [[nodiscard]] double partialTokenSetRatio(std::u32string_view s1, std::u32string_view s2) const override;
    [[nodiscard]] double wRatio(std::u32string_view s1, std::u32string_view s2) const override;

    [[nodiscard]] const AlignerOptions& options() const { return engine_.options(); }

private:
    RatioEngine engine_;
    TokenNormalizer tokens_;
    CompositeScorer composite_;
};

} // namespace fuzzscore
