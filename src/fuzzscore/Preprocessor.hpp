#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace fuzzscore
{

/**
 * @brief Normalizes raw text into the canonical form used for comparison.
 *
 * Full processing:
 * - optionally drops every code point outside ASCII (force_ascii)
 * - replaces each non-alphanumeric code point with a space
 * - collapses whitespace runs and trims both ends
 * - lowercases (simple Unicode lowercase mapping)
 *
 * Example:
 * @code
 * fullProcess(U"  New York   Mets!! ", true); // U"new york mets"
 * @endcode
 */
std::u32string fullProcess(const std::u32string& text, bool force_ascii);

/// Decode UTF-8 and run fullProcess when full_process is set; otherwise decode only.
std::u32string preprocess(std::string_view raw, bool force_ascii, bool full_process);

/// A processed string is valid when it is non-empty.
inline bool validateString(const std::u32string& text)
{
    return !text.empty();
}

// Display representations for non-string values. Equal values always produce
// equal strings so the equivalence short-circuit keeps working after coercion.
std::string toText(std::string_view value);
std::string toText(const char* value);
std::string toText(bool value);
std::string toText(int value);
std::string toText(long value);
std::string toText(long long value);
std::string toText(unsigned value);
std::string toText(unsigned long value);
std::string toText(unsigned long long value);
std::string toText(double value);
std::string toText(float value);

} // namespace fuzzscore
