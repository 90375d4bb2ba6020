#pragma once

#include <atomic>
#include <cstddef>
#include <string>
#include <string_view>

namespace fuzzscore
{

/**
 * @brief Opt-in tracing of individual scoring calls.
 *
 * Traces go to the plog instance kLogInstance so they can be routed to their own
 * file and left off in normal operation. Register that instance with
 * utils::LogManager before enabling verbose mode, otherwise traces are dropped.
 */
class Diagnostics
{
public:
    static constexpr int kLogInstance = 1;

    static void SetVerbose(bool enabled) noexcept;
    [[nodiscard]] static bool IsVerbose() noexcept;

    static void SetMaxPreview(std::size_t bytes) noexcept;
    [[nodiscard]] static std::size_t MaxPreview() noexcept;

    /// Bounded, single-line rendering of input text for log lines.
    [[nodiscard]] static std::string Preview(std::string_view text);

    /**
     * @brief Log `operation("s1", "s2") = score` when verbose.
     * @return score, unchanged
     */
    static int Trace(const char* operation, std::string_view s1, std::string_view s2, int score);

private:
    static std::size_t cutPoint(std::string_view text, std::size_t limit);
    static void appendEscaped(std::string& out, char ch);

    static std::atomic<bool> enabled_;
    static std::atomic<std::size_t> preview_bytes_;
};

} // namespace fuzzscore
