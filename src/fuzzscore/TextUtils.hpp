#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace fuzzscore
{

/// UTF-8 to UTF-32 conversion. Throws InvalidTextError on malformed input.
std::u32string utf8ToUtf32(std::string_view utf8_str);

/// Whitespace as used for tokenization (ASCII controls, separators, Zs/Zl/Zp)
bool isUnicodeSpace(char32_t cp);

/// Letter (L*) or number (N*) category
bool isAlphanumeric(char32_t cp);

/// Split on runs of whitespace, dropping empty tokens
std::vector<std::u32string> splitTokens(const std::u32string& text);

/// Join tokens with a single space
std::u32string joinTokens(const std::vector<std::u32string>& tokens);

/// Strip leading and trailing whitespace
std::u32string trim(const std::u32string& text);

} // namespace fuzzscore
