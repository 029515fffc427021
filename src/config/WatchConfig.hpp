#pragma once

#include <optional>
#include <string>
#include <vector>

// Process-wide settings, built once at startup and passed by const reference.
struct WatchConfig
{
    // [watch]
    std::string url;
    std::string api_key;
    std::vector<std::string> recipients;
    std::string sender;
    std::string state_dir = ".watch_state";
    int timeout_seconds = 20;
    std::string subject_prefix = "[Page Watch]";
    std::optional<std::string> user_agent;
    int max_diff_lines = 2000;
    std::string endpoint = "https://api.resend.com/emails";

    // [log]
    int log_level = 4; // plog::info
    std::string log_file;
};
