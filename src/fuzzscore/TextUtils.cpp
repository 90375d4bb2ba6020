#include "TextUtils.hpp"
#include "Errors.hpp"
#include <utf8proc.h>

namespace fuzzscore
{

std::u32string utf8ToUtf32(std::string_view utf8_str)
{
    std::u32string result;
    if (utf8_str.empty())
        return result;

    const utf8proc_uint8_t* str = reinterpret_cast<const utf8proc_uint8_t*>(utf8_str.data());
    utf8proc_ssize_t len = static_cast<utf8proc_ssize_t>(utf8_str.size());

    result.reserve(utf8_str.size());
    utf8proc_ssize_t pos = 0;
    while (pos < len)
    {
        utf8proc_int32_t codepoint;
        utf8proc_ssize_t bytes = utf8proc_iterate(str + pos, len - pos, &codepoint);
        if (bytes <= 0 || codepoint < 0)
        {
            throw InvalidTextError("malformed UTF-8 at byte " + std::to_string(pos) + ": " +
                                   utf8proc_errmsg(bytes < 0 ? bytes : UTF8PROC_ERROR_INVALIDUTF8));
        }
        result.push_back(static_cast<char32_t>(codepoint));
        pos += bytes;
    }
    return result;
}

bool isUnicodeSpace(char32_t cp)
{
    if ((cp >= U'\t' && cp <= U'\r') || cp == U' ')
        return true;
    if ((cp >= U'\x1C' && cp <= U'\x1F') || cp == U'\x85')
        return true;
    if (cp < 0x80)
        return false;

    switch (utf8proc_category(static_cast<utf8proc_int32_t>(cp)))
    {
    case UTF8PROC_CATEGORY_ZS:
    case UTF8PROC_CATEGORY_ZL:
    case UTF8PROC_CATEGORY_ZP:
        return true;
    default:
        return false;
    }
}

bool isAlphanumeric(char32_t cp)
{
    if (cp < 0x80)
    {
        return (cp >= U'0' && cp <= U'9') || (cp >= U'a' && cp <= U'z') || (cp >= U'A' && cp <= U'Z');
    }

    switch (utf8proc_category(static_cast<utf8proc_int32_t>(cp)))
    {
    case UTF8PROC_CATEGORY_LU:
    case UTF8PROC_CATEGORY_LL:
    case UTF8PROC_CATEGORY_LT:
    case UTF8PROC_CATEGORY_LM:
    case UTF8PROC_CATEGORY_LO:
    case UTF8PROC_CATEGORY_ND:
    case UTF8PROC_CATEGORY_NL:
    case UTF8PROC_CATEGORY_NO:
        return true;
    default:
        return false;
    }
}

std::vector<std::u32string> splitTokens(const std::u32string& text)
{
    std::vector<std::u32string> tokens;
    std::u32string current;
    for (char32_t cp : text)
    {
        if (isUnicodeSpace(cp))
        {
            if (!current.empty())
            {
                tokens.push_back(std::move(current));
                current.clear();
            }
        }
        else
        {
            current.push_back(cp);
        }
    }
    if (!current.empty())
        tokens.push_back(std::move(current));
    return tokens;
}

std::u32string joinTokens(const std::vector<std::u32string>& tokens)
{
    std::u32string out;
    for (size_t i = 0; i < tokens.size(); ++i)
    {
        if (i > 0)
            out.push_back(U' ');
        out += tokens[i];
    }
    return out;
}

std::u32string trim(const std::u32string& text)
{
    size_t begin = 0;
    size_t end = text.size();
    while (begin < end && isUnicodeSpace(text[begin]))
        ++begin;
    while (end > begin && isUnicodeSpace(text[end - 1]))
        --end;
    return text.substr(begin, end - begin);
}

} // namespace fuzzscore
