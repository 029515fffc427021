#include "Application.hpp"
#include "ExitCodes.hpp"
#include "Version.hpp"
#include "config/ConfigLoader.hpp"
#include "net/PageFetcher.hpp"
#include "notify/ChangeNotifier.hpp"
#include "notify/ResendTransport.hpp"
#include "pipeline/WatchPipeline.hpp"
#include "storage/FileFingerprintStore.hpp"
#include "utils/ErrorReporter.hpp"
#include "utils/LogManager.hpp"

#include <plog/Log.h>

#include <cstring>
#include <iostream>

Application::Application(int argc, char** argv)
    : argc_(argc)
    , argv_(argv)
{
}

Application::~Application() { utils::LogManager::Shutdown(); }

void Application::printUsage() const
{
    std::cerr << "pagewatch " << PAGEWATCH_VERSION_STRING << "\n"
              << "Checks one web page for visible changes and mails a diff when it changes.\n\n"
              << "Usage: pagewatch [--config <file.toml>] [--help] [--version]\n\n"
              << "Settings (environment overrides the config file):\n"
              << "  WATCH_URL        page to watch (required)\n"
              << "  RESEND_API_KEY   Resend API key (required)\n"
              << "  TO_EMAIL         comma-separated recipients (required)\n"
              << "  FROM_EMAIL       verified sender identity (required)\n"
              << "  STATE_DIR        state directory (default .watch_state)\n"
              << "  REQUEST_TIMEOUT  HTTP timeout in seconds (default 20)\n"
              << "  SUBJECT_PREFIX   mail subject prefix (default \"[Page Watch]\")\n"
              << "  USER_AGENT       custom User-Agent for the page request\n"
              << "  MAX_DIFF_LINES   diff line limit, 0 for none (default 2000)\n"
              << "  LOG_LEVEL        0..6, plog severity (default 4 = info)\n"
              << "  LOG_FILE         optional rolling log file\n\n"
              << "Exit codes: 0 no change, 1 fetch failed, 2 config error, 3 bootstrapped,\n"
              << "            4 change notified, 5 notify failed, 6 persist failed, 7 state unreadable,\n"
              << "            8 internal error\n";
}

Application::ArgsResult Application::parseCommandLineArgs()
{
    for (int i = 1; i < argc_; ++i)
    {
        const char* arg = argv_[i];
        if (std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0)
        {
            printUsage();
            return ArgsResult::ExitOk;
        }
        if (std::strcmp(arg, "--version") == 0)
        {
            std::cout << PAGEWATCH_VERSION_STRING << "\n";
            return ArgsResult::ExitOk;
        }
        if (std::strcmp(arg, "--config") == 0)
        {
            if (i + 1 >= argc_)
            {
                PLOG_ERROR << "--config requires a file path";
                return ArgsResult::UsageError;
            }
            config_path_ = argv_[++i];
            continue;
        }
        PLOG_ERROR << "Unknown argument: " << arg;
        printUsage();
        return ArgsResult::UsageError;
    }

    if (config_path_.empty())
    {
        if (auto env_path = ConfigLoader::systemEnvironment("PAGEWATCH_CONFIG"))
            config_path_ = *env_path;
    }
    return ArgsResult::Run;
}

bool Application::initializeLogging()
{
    utils::LogManager::LoggerConfig log_cfg;
    log_cfg.level = plog::info;
    return utils::LogManager::Initialize(log_cfg);
}

bool Application::initializeConfig()
{
    ConfigLoader loader;
    if (!loader.load(config_path_, config_))
    {
        utils::ErrorReporter::ReportFatal(utils::ErrorCategory::Configuration, "Invalid configuration",
                                          loader.lastError());
        return false;
    }

    utils::LogManager::SetLevel(utils::LogManager::SeverityFromInt(config_.log_level, plog::info));
    if (!config_.log_file.empty())
    {
        utils::LogManager::LoggerConfig log_cfg;
        log_cfg.filepath = config_.log_file;
        if (!utils::LogManager::AttachFile(log_cfg))
            PLOG_WARNING << "Could not open log file " << config_.log_file << ", logging to stderr only";
    }
    return true;
}

void Application::printErrorSummary() const
{
    if (!utils::ErrorReporter::HasPendingErrors())
        return;

    auto errors = utils::ErrorReporter::GetPendingErrors();

    PLOG_INFO << errors.size() << " problem(s) during this run:";
    for (const auto& report : errors)
    {
        PLOG_INFO << "  [" << utils::ErrorReporter::SeverityToString(report.severity) << "] ["
                  << utils::ErrorReporter::CategoryToString(report.category) << "] " << report.message;
    }
}

int Application::run()
{
    if (!initializeLogging())
    {
        std::cerr << "pagewatch: failed to initialize logging\n";
        return app::kExitInternalError;
    }

    switch (parseCommandLineArgs())
    {
    case ArgsResult::ExitOk:
        return app::kExitNoChange;
    case ArgsResult::UsageError:
        return app::kExitConfigError;
    case ArgsResult::Run:
        break;
    }

    if (!initializeConfig())
        return app::kExitConfigError;

    PLOG_DEBUG << "pagewatch " << PAGEWATCH_VERSION_STRING << " watching " << config_.url << " (state in "
               << config_.state_dir << ")";

    try
    {
        net::HttpPageFetcher fetcher(config_.timeout_seconds, config_.user_agent);
        storage::FileFingerprintStore store;
        notify::ResendTransport transport(config_.api_key, config_.endpoint, config_.timeout_seconds);

        notify::NotifierSettings settings;
        settings.sender = config_.sender;
        settings.recipients = config_.recipients;
        settings.subject_prefix = config_.subject_prefix;
        notify::ChangeNotifier notifier(std::move(settings), transport);

        pipeline::WatchPipeline watch(config_, fetcher, store, notifier);
        pipeline::RunReport report = watch.run();

        PLOG_INFO << "Run finished for " << config_.url << ": " << pipeline::to_string(report.outcome) << " ("
                  << pipeline::to_string(report.finalState()) << ")";
        printErrorSummary();
        return app::exit_code_for(report.outcome);
    }
    catch (const std::exception& ex)
    {
        // Only reachable on failures outside the pipeline's own handling (e.g. allocation)
        utils::ErrorReporter::ReportFatal(utils::ErrorCategory::Unknown, "Watcher aborted", ex.what());
        printErrorSummary();
        return app::kExitInternalError;
    }
}
