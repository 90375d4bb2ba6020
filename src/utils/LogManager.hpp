#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>
#include <plog/Severity.h>

namespace plog
{
class IAppender;
}

namespace utils
{

class LogManager
{
public:
    struct LoggerConfig
    {
        std::string name;
        std::string filepath; // empty: no file appender
        bool append = true;
        plog::Severity level = plog::info;
        size_t max_file_size = 10 * 1024 * 1024;
        size_t backup_count = 3;
        bool add_console_appender = false;
    };

    /**
     * @brief Initialize the plog instance InstanceId with the configured appenders.
     *
     * An instance is registered once per process; repeated calls keep the first
     * configuration and return true.
     */
    template<int InstanceId = 0>
    static bool RegisterLogger(const LoggerConfig& config);

    template<int InstanceId = 0>
    static bool IsRegistered();

    static bool PrepareLogDirectory(const std::string& filepath);

private:
    LogManager() = default;

    static std::mutex s_mutex;
    static std::set<int> s_registered;
    static std::vector<std::unique_ptr<plog::IAppender>> s_appenders;
};

} // namespace utils
