#pragma once

#include "../config/WatchConfig.hpp"

#include <string>

class Application
{
public:
    Application(int argc, char** argv);
    ~Application();

    int run();

private:
    enum class ArgsResult
    {
        Run,
        ExitOk,
        UsageError
    };

    ArgsResult parseCommandLineArgs();
    bool initializeConfig();
    bool initializeLogging();
    void printUsage() const;
    void printErrorSummary() const;

    WatchConfig config_;
    std::string config_path_;

    int argc_ = 0;
    char** argv_ = nullptr;
};
