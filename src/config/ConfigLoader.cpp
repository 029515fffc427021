#include "ConfigLoader.hpp"
#include "../processing/TextNormalizer.hpp"

#include <plog/Log.h>

#include <charconv>
#include <cstdlib>
#include <filesystem>
#include <limits>
#include <sstream>

namespace
{

void set_string(const toml::table& tbl, const char* key, std::string& out)
{
    if (auto v = tbl[key].value<std::string>())
        out = *v;
}

} // namespace

ConfigLoader::ConfigLoader(EnvLookup env)
    : env_(std::move(env))
{
}

std::optional<std::string> ConfigLoader::systemEnvironment(const char* name)
{
    const char* value = std::getenv(name);
    if (!value || !*value)
        return std::nullopt;
    return std::string(value);
}

std::vector<std::string> ConfigLoader::parseRecipients(const std::string& list)
{
    std::vector<std::string> out;
    std::istringstream ss(list);
    std::string item;
    while (std::getline(ss, item, ','))
    {
        std::string trimmed = processing::trim(item);
        if (!trimmed.empty())
            out.push_back(std::move(trimmed));
    }
    return out;
}

bool ConfigLoader::load(const std::string& toml_path, WatchConfig& out)
{
    errors_.clear();
    missing_.clear();
    last_error_.clear();

    WatchConfig cfg;
    if (!toml_path.empty())
    {
        std::error_code ec;
        if (!std::filesystem::exists(toml_path, ec))
        {
            last_error_ = "config file not found: " + toml_path;
            return false;
        }
        try
        {
            applyTable(toml::parse_file(toml_path), cfg);
            PLOG_DEBUG << "Loaded config file " << toml_path;
        }
        catch (const toml::parse_error& pe)
        {
            last_error_ = "config parse error in " + toml_path + " at line " +
                          std::to_string(pe.source().begin.line) + ": " + std::string(pe.description());
            return false;
        }
    }

    applyEnvironment(cfg);
    if (!finish(cfg))
        return false;
    out = std::move(cfg);
    return true;
}

bool ConfigLoader::loadFromString(std::string_view toml_text, WatchConfig& out)
{
    errors_.clear();
    missing_.clear();
    last_error_.clear();

    WatchConfig cfg;
    try
    {
        applyTable(toml::parse(toml_text), cfg);
    }
    catch (const toml::parse_error& pe)
    {
        last_error_ = "config parse error at line " + std::to_string(pe.source().begin.line) + ": " +
                      std::string(pe.description());
        return false;
    }

    applyEnvironment(cfg);
    if (!finish(cfg))
        return false;
    out = std::move(cfg);
    return true;
}

void ConfigLoader::applyTable(const toml::table& root, WatchConfig& cfg)
{
    if (const toml::table* watch = root["watch"].as_table())
    {
        set_string(*watch, "url", cfg.url);
        set_string(*watch, "api_key", cfg.api_key);
        set_string(*watch, "from", cfg.sender);
        set_string(*watch, "state_dir", cfg.state_dir);
        set_string(*watch, "subject_prefix", cfg.subject_prefix);
        set_string(*watch, "endpoint", cfg.endpoint);

        if (auto ua = (*watch)["user_agent"].value<std::string>())
            cfg.user_agent = *ua;

        if (const toml::array* to = (*watch)["to"].as_array())
        {
            cfg.recipients.clear();
            for (const auto& el : *to)
            {
                if (auto addr = el.value<std::string>())
                {
                    std::string trimmed = processing::trim(*addr);
                    if (!trimmed.empty())
                        cfg.recipients.push_back(std::move(trimmed));
                }
            }
        }
        else if (auto to_list = (*watch)["to"].value<std::string>())
        {
            cfg.recipients = parseRecipients(*to_list);
        }

        if (auto timeout = (*watch)["timeout_seconds"].value<int64_t>())
            narrowInt("watch.timeout_seconds", *timeout, cfg.timeout_seconds);
        if (auto max_lines = (*watch)["max_diff_lines"].value<int64_t>())
            narrowInt("watch.max_diff_lines", *max_lines, cfg.max_diff_lines);
    }

    if (const toml::table* log = root["log"].as_table())
    {
        if (auto level = (*log)["level"].value<int64_t>())
            narrowInt("log.level", *level, cfg.log_level);
        set_string(*log, "file", cfg.log_file);
    }
}

void ConfigLoader::applyEnvironment(WatchConfig& cfg)
{
    if (auto v = env_("WATCH_URL"))
        cfg.url = *v;
    if (auto v = env_("RESEND_API_KEY"))
        cfg.api_key = *v;
    if (auto v = env_("TO_EMAIL"))
        cfg.recipients = parseRecipients(*v);
    if (auto v = env_("FROM_EMAIL"))
        cfg.sender = *v;
    if (auto v = env_("STATE_DIR"))
        cfg.state_dir = *v;
    if (auto v = env_("REQUEST_TIMEOUT"))
        parseInt("REQUEST_TIMEOUT", *v, cfg.timeout_seconds);
    if (auto v = env_("SUBJECT_PREFIX"))
        cfg.subject_prefix = *v;
    if (auto v = env_("USER_AGENT"))
        cfg.user_agent = *v;
    if (auto v = env_("MAX_DIFF_LINES"))
        parseInt("MAX_DIFF_LINES", *v, cfg.max_diff_lines);
    if (auto v = env_("RESEND_ENDPOINT"))
        cfg.endpoint = *v;
    if (auto v = env_("LOG_LEVEL"))
        parseInt("LOG_LEVEL", *v, cfg.log_level);
    if (auto v = env_("LOG_FILE"))
        cfg.log_file = *v;
}

bool ConfigLoader::parseInt(const std::string& key, const std::string& value, int& out)
{
    std::string trimmed = processing::trim(value);
    int parsed = 0;
    auto [ptr, ec] = std::from_chars(trimmed.data(), trimmed.data() + trimmed.size(), parsed);
    if (ec != std::errc() || ptr != trimmed.data() + trimmed.size() || trimmed.empty())
    {
        errors_.push_back(key + " is not an integer: '" + value + "'");
        return false;
    }
    out = parsed;
    return true;
}

void ConfigLoader::narrowInt(const std::string& key, int64_t value, int& out)
{
    if (value < std::numeric_limits<int>::min() || value > std::numeric_limits<int>::max())
    {
        errors_.push_back(key + " is out of range: " + std::to_string(value));
        return;
    }
    out = static_cast<int>(value);
}

bool ConfigLoader::finish(WatchConfig& cfg)
{
    if (cfg.url.empty())
        missing_.push_back("WATCH_URL");
    if (cfg.api_key.empty())
        missing_.push_back("RESEND_API_KEY");
    if (cfg.recipients.empty())
        missing_.push_back("TO_EMAIL");
    if (cfg.sender.empty())
        missing_.push_back("FROM_EMAIL");

    if (cfg.timeout_seconds <= 0 || cfg.timeout_seconds > kMaxTimeoutSeconds)
        errors_.push_back("timeout must be between 1 and " + std::to_string(kMaxTimeoutSeconds) + " seconds");
    if (cfg.max_diff_lines < 0)
        errors_.push_back("max_diff_lines must not be negative");
    if (cfg.log_level < 0 || cfg.log_level > 6)
        errors_.push_back("log level must be between 0 and 6");
    if (cfg.state_dir.empty())
        errors_.push_back("state_dir must not be empty");
    if (cfg.user_agent && cfg.user_agent->empty())
        cfg.user_agent.reset();

    std::string msg;
    if (!missing_.empty())
    {
        msg = "missing required setting(s):";
        for (const auto& key : missing_)
            msg += " " + key;
    }
    for (const auto& err : errors_)
    {
        if (!msg.empty())
            msg += "; ";
        msg += err;
    }
    last_error_ = msg;
    return msg.empty();
}
