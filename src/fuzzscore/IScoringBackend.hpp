#pragma once

#include <string_view>

namespace fuzzscore
{

/**
 * @brief Primitive scoring operations behind the public API.
 *
 * Exactly one implementation is bound per process (see Backend.hpp). Inputs are
 * already decoded and, where the caller asked for it, preprocessed. Every
 * operation returns a score in [0.0, 100.0]; the public layer rounds it.
 *
 * Implementations must be stateless from the caller's point of view so they can
 * be shared across threads without locking.
 */
class IScoringBackend
{
public:
    virtual ~IScoringBackend() = default;

    /// Human-readable backend name ("reference", "rapidfuzz").
    [[nodiscard]] virtual const char* name() const = 0;

    /// Similarity of the two full strings.
    [[nodiscard]] virtual double ratio(std::u32string_view s1, std::u32string_view s2) const = 0;

    /// Similarity of the shorter string to its best-aligned window of the longer one.
    [[nodiscard]] virtual double partialRatio(std::u32string_view s1, std::u32string_view s2) const = 0;

    /// ratio after alphabetizing whitespace tokens.
    [[nodiscard]] virtual double tokenSortRatio(std::u32string_view s1, std::u32string_view s2) const = 0;

    /// partialRatio after alphabetizing whitespace tokens.
    [[nodiscard]] virtual double partialTokenSortRatio(std::u32string_view s1, std::u32string_view s2) const = 0;

    /// ratio over intersection/difference token sets.
    [[nodiscard]] virtual double tokenSetRatio(std::u32string_view s1, std::u32string_view s2) const = 0;

    /// partialRatio over intersection/difference token sets.
    [[nodiscard]] virtual double partialTokenSetRatio(std::u32string_view s1, std::u32string_view s2) const = 0;

    /// Length-adaptive combination of the above.
    [[nodiscard]] virtual double wRatio(std::u32string_view s1, std::u32string_view s2) const = 0;
};

} // namespace fuzzscore
