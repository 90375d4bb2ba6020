#pragma once

#include "../fuzzscore/Backend.hpp"
#include "../fuzzscore/SequenceAligner.hpp"

#include <cstddef>
#include <string>
#include <string_view>

#include <plog/Severity.h>

namespace config
{

struct LoggingSettings
{
    plog::Severity level = plog::info;
    std::string file = "logs/fuzzscore.log"; // empty: no file appender
    bool append = true;
    bool console = false;
    size_t max_file_size = 10 * 1024 * 1024;
    size_t backup_count = 3;

    bool verbose = false; // per-call scoring traces
    std::string diagnostics_file = "logs/fuzzscore_diagnostics.log";
    size_t max_preview = 160;
};

struct Settings
{
    fuzzscore::backend::Kind backend = fuzzscore::backend::Kind::Reference;
    fuzzscore::AlignerOptions aligner;
    LoggingSettings logging;
};

/**
 * @brief Parse settings from TOML text.
 *
 * Recognized tables: [scoring] backend, [aligner] autojunk, [logging] level/file/
 * append/console/max_file_size/backup_count/verbose/diagnostics_file/max_preview.
 * Missing keys keep their defaults. Malformed TOML or invalid values are reported
 * through utils::ErrorReporter and the affected settings keep their defaults.
 */
[[nodiscard]] Settings ParseSettings(std::string_view toml_text);

/// ParseSettings on a file. A missing file yields defaults.
[[nodiscard]] Settings LoadSettings(const std::string& path);

/**
 * @brief Register the loggers and bind the scoring backend.
 *
 * Call once at startup, before the first scoring call. Returns false when a part
 * could not be applied (e.g. a backend was already bound); the rest still applies.
 */
bool ApplySettings(const Settings& settings);

} // namespace config
