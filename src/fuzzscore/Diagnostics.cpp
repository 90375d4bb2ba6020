#include "Diagnostics.hpp"

#include <plog/Log.h>

namespace fuzzscore
{

std::atomic<bool> Diagnostics::enabled_{ false };
std::atomic<std::size_t> Diagnostics::preview_bytes_{ 160 };

void Diagnostics::SetVerbose(bool enabled) noexcept
{
    enabled_.store(enabled, std::memory_order_relaxed);
}

bool Diagnostics::IsVerbose() noexcept { return enabled_.load(std::memory_order_relaxed); }

void Diagnostics::SetMaxPreview(std::size_t bytes) noexcept
{
    preview_bytes_.store(bytes == 0 ? 1 : bytes, std::memory_order_relaxed);
}

std::size_t Diagnostics::MaxPreview() noexcept { return preview_bytes_.load(std::memory_order_relaxed); }

std::string Diagnostics::Preview(std::string_view text)
{
    const std::size_t cut = cutPoint(text, MaxPreview());

    std::string out;
    out.reserve(cut + 24);
    for (char ch : text.substr(0, cut))
        appendEscaped(out, ch);

    if (cut < text.size())
    {
        out += "... (";
        out += std::to_string(text.size());
        out += " bytes)";
    }
    return out;
}

int Diagnostics::Trace(const char* operation, std::string_view s1, std::string_view s2, int score)
{
    if (IsVerbose())
    {
        PLOGV_(kLogInstance) << operation << "(\"" << Preview(s1) << "\", \"" << Preview(s2) << "\") = " << score;
    }
    return score;
}

// Largest prefix length <= limit that does not end inside a UTF-8 sequence.
std::size_t Diagnostics::cutPoint(std::string_view text, std::size_t limit)
{
    if (text.size() <= limit)
        return text.size();

    std::size_t cut = limit;
    while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80)
        --cut;
    return cut;
}

void Diagnostics::appendEscaped(std::string& out, char ch)
{
    const auto byte = static_cast<unsigned char>(ch);
    switch (ch)
    {
    case '\n':
        out += "\\n";
        break;
    case '\r':
        out += "\\r";
        break;
    case '\t':
        out += "\\t";
        break;
    case '"':
        out += "\\\"";
        break;
    default:
        out.push_back(byte < 0x20 || byte == 0x7F ? '?' : ch);
        break;
    }
}

} // namespace fuzzscore
