#include "LogManager.hpp"
#include "ErrorReporter.hpp"
#include "../fuzzscore/Diagnostics.hpp"

#include <filesystem>
#include <fstream>

#include <plog/Log.h>
#include <plog/Init.h>
#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Appenders/RollingFileAppender.h>
#include <plog/Formatters/TxtFormatter.h>

namespace utils
{

std::mutex LogManager::s_mutex;
std::set<int> LogManager::s_registered;
std::vector<std::unique_ptr<plog::IAppender>> LogManager::s_appenders;

template <int InstanceId>
bool LogManager::RegisterLogger(const LoggerConfig& config)
{
    std::lock_guard<std::mutex> lock(s_mutex);

    if (s_registered.count(InstanceId) > 0)
    {
        PLOG_DEBUG << "Logger instance " << InstanceId << " already registered, keeping it for " << config.name;
        return true;
    }

    try
    {
        plog::Logger<InstanceId>& logger = plog::init<InstanceId>(config.level);

        if (!config.filepath.empty())
        {
            if (!PrepareLogDirectory(config.filepath))
                return false;

            if (!config.append)
            {
                std::ofstream(config.filepath, std::ios::trunc).close();
            }

            auto file_appender = std::make_unique<plog::RollingFileAppender<plog::TxtFormatter>>(
                config.filepath.c_str(), config.max_file_size, static_cast<int>(config.backup_count));
            logger.addAppender(file_appender.get());
            s_appenders.push_back(std::move(file_appender));
        }

        if (config.add_console_appender)
        {
            auto console_appender = std::make_unique<plog::ConsoleAppender<plog::TxtFormatter>>();
            logger.addAppender(console_appender.get());
            s_appenders.push_back(std::move(console_appender));
        }

        s_registered.insert(InstanceId);
        return true;
    }
    catch (const std::exception& ex)
    {
        ErrorReporter::ReportError(ErrorCategory::Initialization, "Failed to register logger: " + config.name,
                                   ex.what());
        return false;
    }
}

template <int InstanceId>
bool LogManager::IsRegistered()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    return s_registered.count(InstanceId) > 0;
}

template bool LogManager::RegisterLogger<0>(const LoggerConfig&);
template bool LogManager::RegisterLogger<fuzzscore::Diagnostics::kLogInstance>(const LoggerConfig&);
template bool LogManager::IsRegistered<0>();
template bool LogManager::IsRegistered<fuzzscore::Diagnostics::kLogInstance>();

bool LogManager::PrepareLogDirectory(const std::string& filepath)
{
    const std::filesystem::path parent = std::filesystem::path(filepath).parent_path();
    if (parent.empty())
        return true;

    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec)
    {
        ErrorReporter::ReportWarning(ErrorCategory::Initialization, "Unable to prepare log directory",
                                     parent.string() + ": " + ec.message());
        return false;
    }
    return true;
}

} // namespace utils
