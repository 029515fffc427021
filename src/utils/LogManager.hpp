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
        plog::Severity level = plog::info;
        std::string filepath; // empty: console only
        size_t max_file_size = 1024 * 1024;
        size_t backup_count = 3;
        bool add_console_appender = true; // writes to stderr
    };

    static bool Initialize(const LoggerConfig& config);
    static void Shutdown();

    // Applied once the full configuration is known
    static void SetLevel(plog::Severity level);
    static bool AttachFile(const LoggerConfig& config);

    // Maps 0..6 (none..verbose) onto plog severities
    static plog::Severity SeverityFromInt(long long level, plog::Severity fallback);

private:
    LogManager() = default;

    static bool PrepareLogDirectory(const std::string& filepath);

    static bool s_initialized;
    static std::vector<std::unique_ptr<plog::IAppender>> s_appenders;
};

} // namespace utils
