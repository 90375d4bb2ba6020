#include "Fuzz.hpp"
#include "Backend.hpp"
#include "Diagnostics.hpp"
#include "Preprocessor.hpp"
#include "RatioEngine.hpp"
#include "TextUtils.hpp"

#include <string>

namespace fuzzscore
{

namespace
{

using BackendOp = double (IScoringBackend::*)(std::u32string_view, std::u32string_view) const;

int trace(const char* operation, Text s1, Text s2, int score)
{
    return Diagnostics::Trace(operation, s1.value_or(""), s2.value_or(""), score);
}

// Guard pipeline shared by ratio and partialRatio: equivalence first, then emptiness.
int guarded(const std::u32string& p1, const std::u32string& p2, BackendOp op)
{
    if (p1 == p2)
        return 100;
    if (p1.empty() || p2.empty())
        return 0;
    return toScore((backend::Active().*op)(p1, p2));
}

int tokenScore(const char* operation, Text s1, Text s2, bool force_ascii, bool full_process, BackendOp op)
{
    if (!s1 || !s2)
        return 0;

    const std::u32string p1 = preprocess(*s1, force_ascii, full_process);
    const std::u32string p2 = preprocess(*s2, force_ascii, full_process);

    if (full_process && (!validateString(p1) || !validateString(p2)))
        return trace(operation, s1, s2, 0);

    return trace(operation, s1, s2, toScore((backend::Active().*op)(p1, p2)));
}

} // namespace

int ratio(Text s1, Text s2)
{
    if (!s1 || !s2)
        return 0;

    const int score = guarded(utf8ToUtf32(*s1), utf8ToUtf32(*s2), &IScoringBackend::ratio);
    return trace("ratio", s1, s2, score);
}

int partialRatio(Text s1, Text s2)
{
    if (!s1 || !s2)
        return 0;

    const int score = guarded(utf8ToUtf32(*s1), utf8ToUtf32(*s2), &IScoringBackend::partialRatio);
    return trace("partialRatio", s1, s2, score);
}

int tokenSortRatio(Text s1, Text s2, bool force_ascii, bool full_process)
{
    return tokenScore("tokenSortRatio", s1, s2, force_ascii, full_process, &IScoringBackend::tokenSortRatio);
}

int partialTokenSortRatio(Text s1, Text s2, bool force_ascii, bool full_process)
{
    return tokenScore("partialTokenSortRatio", s1, s2, force_ascii, full_process,
                      &IScoringBackend::partialTokenSortRatio);
}

int tokenSetRatio(Text s1, Text s2, bool force_ascii, bool full_process)
{
    return tokenScore("tokenSetRatio", s1, s2, force_ascii, full_process, &IScoringBackend::tokenSetRatio);
}

int partialTokenSetRatio(Text s1, Text s2, bool force_ascii, bool full_process)
{
    return tokenScore("partialTokenSetRatio", s1, s2, force_ascii, full_process,
                      &IScoringBackend::partialTokenSetRatio);
}

int QRatio(Text s1, Text s2, bool force_ascii, bool full_process)
{
    if (!s1 || !s2)
        return 0;

    const std::u32string p1 = preprocess(*s1, force_ascii, full_process);
    const std::u32string p2 = preprocess(*s2, force_ascii, full_process);

    if (!validateString(p1) || !validateString(p2))
        return trace("QRatio", s1, s2, 0);

    return trace("QRatio", s1, s2, guarded(p1, p2, &IScoringBackend::ratio));
}

int UQRatio(Text s1, Text s2, bool full_process)
{
    return QRatio(s1, s2, false, full_process);
}

int WRatio(Text s1, Text s2, bool force_ascii, bool full_process)
{
    if (!s1 || !s2)
        return 0;

    const std::u32string p1 = preprocess(*s1, force_ascii, full_process);
    const std::u32string p2 = preprocess(*s2, force_ascii, full_process);

    if (!validateString(p1) || !validateString(p2))
        return trace("WRatio", s1, s2, 0);

    return trace("WRatio", s1, s2, toScore(backend::Active().wRatio(p1, p2)));
}

int UWRatio(Text s1, Text s2, bool full_process)
{
    return WRatio(s1, s2, false, full_process);
}

} // namespace fuzzscore
