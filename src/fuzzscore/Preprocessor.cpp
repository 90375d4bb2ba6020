#include "Preprocessor.hpp"
#include "Errors.hpp"
#include "TextUtils.hpp"

#include <charconv>
#include <cmath>
#include <utf8proc.h>

namespace fuzzscore
{

namespace
{

template <typename Float>
std::string floatToText(Float value)
{
    if (std::isnan(value))
        return "nan";
    if (std::isinf(value))
        return value < 0 ? "-inf" : "inf";

    char buffer[64];
    auto [end, ec] = std::to_chars(buffer, buffer + sizeof(buffer), value);
    if (ec != std::errc())
        throw InvalidTextError("floating point value cannot be represented as text");

    std::string out(buffer, end);
    // Integral values keep a fractional part so 1.0 and 1 stay distinguishable.
    if (out.find_first_of(".e") == std::string::npos)
        out += ".0";
    return out;
}

} // namespace

std::u32string fullProcess(const std::u32string& text, bool force_ascii)
{
    std::u32string out;
    out.reserve(text.size());

    bool pending_space = false;
    for (char32_t cp : text)
    {
        if (force_ascii && cp >= 0x80)
            continue;

        if (!isAlphanumeric(cp))
        {
            pending_space = !out.empty();
            continue;
        }

        if (pending_space)
        {
            out.push_back(U' ');
            pending_space = false;
        }
        out.push_back(static_cast<char32_t>(utf8proc_tolower(static_cast<utf8proc_int32_t>(cp))));
    }

    return out;
}

std::u32string preprocess(std::string_view raw, bool force_ascii, bool full_process)
{
    std::u32string decoded = utf8ToUtf32(raw);
    if (!full_process)
        return decoded;
    return fullProcess(decoded, force_ascii);
}

std::string toText(std::string_view value)
{
    return std::string(value);
}

std::string toText(const char* value)
{
    if (value == nullptr)
        throw InvalidTextError("null C string passed for coercion");
    return std::string(value);
}

std::string toText(bool value)
{
    return value ? "True" : "False";
}

std::string toText(int value) { return std::to_string(value); }
std::string toText(long value) { return std::to_string(value); }
std::string toText(long long value) { return std::to_string(value); }
std::string toText(unsigned value) { return std::to_string(value); }
std::string toText(unsigned long value) { return std::to_string(value); }
std::string toText(unsigned long long value) { return std::to_string(value); }

std::string toText(double value)
{
    return floatToText(value);
}

std::string toText(float value)
{
    return floatToText(value);
}

} // namespace fuzzscore
