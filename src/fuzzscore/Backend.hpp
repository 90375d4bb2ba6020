#pragma once

#include "IScoringBackend.hpp"
#include "SequenceAligner.hpp"

#include <memory>
#include <optional>
#include <string_view>

namespace fuzzscore::backend
{

enum class Kind
{
    Reference, // SequenceAligner based, exact reference scores
    Rapidfuzz  // rapidfuzz-cpp, Indel based
};

[[nodiscard]] const char* ToString(Kind kind);

/// Accepts "reference" and "rapidfuzz" (case-insensitive).
[[nodiscard]] std::optional<Kind> ParseKind(std::string_view name);

/// Construct a standalone backend. The aligner options only apply to Kind::Reference.
[[nodiscard]] std::unique_ptr<IScoringBackend> Create(Kind kind, AlignerOptions options = {});

/**
 * @brief Bind the process-wide backend.
 *
 * The first bind wins, whether it comes from Initialize() or from the default
 * bind performed by Active(). Later calls leave the binding untouched and return false.
 */
bool Initialize(Kind kind, AlignerOptions options = {});

/// The bound backend. Binds the reference backend with default options if nothing is bound yet.
[[nodiscard]] const IScoringBackend& Active();

[[nodiscard]] bool IsBound();

} // namespace fuzzscore::backend
