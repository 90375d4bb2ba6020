#include "Settings.hpp"
#include "../fuzzscore/Diagnostics.hpp"
#include "../utils/ErrorReporter.hpp"
#include "../utils/LogManager.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <filesystem>
#include <optional>

#include <plog/Log.h>
#include <toml++/toml.h>

namespace config
{

namespace
{

using utils::ErrorCategory;
using utils::ErrorReporter;

std::optional<plog::Severity> parseSeverity(const toml::node_view<const toml::node>& node)
{
    if (auto level = node.value<int64_t>())
    {
        if (*level >= plog::none && *level <= plog::verbose)
            return static_cast<plog::Severity>(*level);
        return std::nullopt;
    }

    if (auto name = node.value<std::string>())
    {
        std::string upper = *name;
        std::transform(upper.begin(), upper.end(), upper.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        if (upper == "NONE")
            return plog::none;
        plog::Severity severity = plog::severityFromString(upper.c_str());
        if (severity != plog::none)
            return severity;
    }

    return std::nullopt;
}

std::optional<size_t> parseSize(const toml::node_view<const toml::node>& node, const char* key)
{
    auto value = node.value<int64_t>();
    if (!value)
        return std::nullopt;
    if (*value <= 0)
    {
        ErrorReporter::ReportWarning(ErrorCategory::Configuration, "Ignoring non-positive setting",
                                     std::string("logging.") + key + " = " + std::to_string(*value));
        return std::nullopt;
    }
    return static_cast<size_t>(*value);
}

void readScoring(const toml::table& root, Settings& settings)
{
    const auto scoring = root["scoring"];
    if (auto name = scoring["backend"].value<std::string>())
    {
        if (auto kind = fuzzscore::backend::ParseKind(*name))
        {
            settings.backend = *kind;
        }
        else
        {
            ErrorReporter::ReportWarning(ErrorCategory::Configuration, "Unknown scoring backend, using reference",
                                         "scoring.backend = " + *name);
        }
    }

    if (auto autojunk = root["aligner"]["autojunk"].value<bool>())
    {
        settings.aligner.autojunk = *autojunk;
    }
}

void readLogging(const toml::table& root, LoggingSettings& logging)
{
    const auto section = root["logging"];

    if (section["level"])
    {
        if (auto level = parseSeverity(section["level"]))
        {
            logging.level = *level;
        }
        else
        {
            ErrorReporter::ReportWarning(ErrorCategory::Configuration, "Invalid logging level, keeping default",
                                         "expected 0-6 or a severity name");
        }
    }

    if (auto file = section["file"].value<std::string>())
        logging.file = *file;
    if (auto append = section["append"].value<bool>())
        logging.append = *append;
    if (auto console = section["console"].value<bool>())
        logging.console = *console;
    if (auto size = parseSize(section["max_file_size"], "max_file_size"))
        logging.max_file_size = *size;
    if (auto count = parseSize(section["backup_count"], "backup_count"))
        logging.backup_count = *count;
    if (auto verbose = section["verbose"].value<bool>())
        logging.verbose = *verbose;
    if (auto file = section["diagnostics_file"].value<std::string>())
        logging.diagnostics_file = *file;
    if (auto preview = parseSize(section["max_preview"], "max_preview"))
        logging.max_preview = *preview;
}

Settings fromTable(const toml::table& root)
{
    Settings settings;
    readScoring(root, settings);
    readLogging(root, settings.logging);
    return settings;
}

} // namespace

Settings ParseSettings(std::string_view toml_text)
{
    try
    {
        toml::table root = toml::parse(toml_text);
        return fromTable(root);
    }
    catch (const toml::parse_error& pe)
    {
        ErrorReporter::ReportError(ErrorCategory::Configuration, "Failed to parse settings, using defaults",
                                   std::string(pe.description()));
        return Settings{};
    }
}

Settings LoadSettings(const std::string& path)
{
    std::error_code ec;
    if (!std::filesystem::exists(path, ec))
    {
        PLOG_INFO << "Settings file '" << path << "' not found, using defaults";
        return Settings{};
    }

    try
    {
        toml::table root = toml::parse_file(path);
        return fromTable(root);
    }
    catch (const toml::parse_error& pe)
    {
        ErrorReporter::ReportError(ErrorCategory::Configuration, "Failed to parse settings file '" + path + "'",
                                   std::string(pe.description()));
        return Settings{};
    }
}

bool ApplySettings(const Settings& settings)
{
    bool ok = utils::LogManager::RegisterLogger<0>({ .name = "main",
                                                     .filepath = settings.logging.file,
                                                     .append = settings.logging.append,
                                                     .level = settings.logging.level,
                                                     .max_file_size = settings.logging.max_file_size,
                                                     .backup_count = settings.logging.backup_count,
                                                     .add_console_appender = settings.logging.console });

    fuzzscore::Diagnostics::SetMaxPreview(settings.logging.max_preview);
    if (settings.logging.verbose)
    {
        ok = utils::LogManager::RegisterLogger<fuzzscore::Diagnostics::kLogInstance>(
                 { .name = "diagnostics",
                   .filepath = settings.logging.diagnostics_file,
                   .append = settings.logging.append,
                   .level = plog::verbose,
                   .max_file_size = settings.logging.max_file_size,
                   .backup_count = settings.logging.backup_count,
                   .add_console_appender = false }) &&
             ok;
    }
    fuzzscore::Diagnostics::SetVerbose(settings.logging.verbose);

    if (!fuzzscore::backend::Initialize(settings.backend, settings.aligner))
    {
        ErrorReporter::ReportWarning(ErrorCategory::Initialization,
                                     "Scoring backend already bound, settings change ignored",
                                     std::string("requested ") + fuzzscore::backend::ToString(settings.backend));
        ok = false;
    }

    return ok;
}

} // namespace config
