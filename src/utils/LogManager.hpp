#pragma once

#include <string>
#include <vector>
#include <memory>
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
        std::string filepath;                  // Empty: console only
        plog::Severity level = plog::warning;
        size_t max_file_size = 1024 * 1024;
        size_t backup_count = 3;
        bool add_console_appender = true;      // Console output goes to stderr
    };

    // Sets up logger instance 0. May be called again after Shutdown() with a new config.
    static bool Initialize(const LoggerConfig& config);

    static void Shutdown();

private:
    LogManager() = default;

    static bool s_initialized;
    static std::vector<std::unique_ptr<plog::IAppender>> s_appenders;
};

} // namespace utils
