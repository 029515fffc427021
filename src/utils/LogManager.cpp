#include "LogManager.hpp"
#include "ErrorReporter.hpp"

#include <filesystem>

#include <plog/Log.h>
#include <plog/Init.h>
#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Appenders/RollingFileAppender.h>
#include <plog/Formatters/TxtFormatter.h>

namespace utils
{

bool LogManager::s_initialized = false;
std::vector<std::unique_ptr<plog::IAppender>> LogManager::s_appenders;

bool LogManager::Initialize(const LoggerConfig& config)
{
    if (s_initialized)
        return true;

    try
    {
        plog::Logger<PLOG_DEFAULT_INSTANCE_ID>& logger = plog::init(config.level);

        if (config.add_console_appender)
        {
            auto console_appender = std::make_unique<plog::ConsoleAppender<plog::TxtFormatter>>(plog::streamStdErr);
            logger.addAppender(console_appender.get());
            s_appenders.push_back(std::move(console_appender));
        }

        s_initialized = true;
        return AttachFile(config);
    }
    catch (const std::exception& ex)
    {
        ErrorReporter::ReportError(ErrorCategory::Configuration, "Failed to initialize logging", ex.what());
        return false;
    }
}

bool LogManager::AttachFile(const LoggerConfig& config)
{
    if (config.filepath.empty())
        return true;
    auto* logger = plog::get();
    if (!logger || !PrepareLogDirectory(config.filepath))
        return false;

    try
    {
        auto file_appender = std::make_unique<plog::RollingFileAppender<plog::TxtFormatter>>(
            config.filepath.c_str(), config.max_file_size, config.backup_count);
        logger->addAppender(file_appender.get());
        s_appenders.push_back(std::move(file_appender));
        return true;
    }
    catch (const std::exception& ex)
    {
        ErrorReporter::ReportWarning(ErrorCategory::Configuration, "Failed to open log file",
                                     config.filepath + ": " + ex.what());
        return false;
    }
}

void LogManager::SetLevel(plog::Severity level)
{
    if (auto* logger = plog::get())
        logger->setMaxSeverity(level);
}

void LogManager::Shutdown()
{
    if (auto* logger = plog::get())
        logger->setMaxSeverity(plog::none);
    s_appenders.clear();
    s_initialized = false;
}

plog::Severity LogManager::SeverityFromInt(long long level, plog::Severity fallback)
{
    if (level >= plog::none && level <= plog::verbose)
        return static_cast<plog::Severity>(level);
    return fallback;
}

bool LogManager::PrepareLogDirectory(const std::string& filepath)
{
    std::filesystem::path parent = std::filesystem::path(filepath).parent_path();
    if (parent.empty())
        return true;

    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec)
    {
        ErrorReporter::ReportWarning(ErrorCategory::Configuration, "Unable to prepare log directory",
                                     parent.string() + ": " + ec.message());
        return false;
    }
    return true;
}

} // namespace utils
