#pragma once

#include "WatchConfig.hpp"
#include "../net/HttpCommon.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <toml++/toml.h>

// Builds a WatchConfig from defaults, an optional TOML file and the environment
// (in increasing precedence). Performs no network access.
class ConfigLoader
{
public:
    using EnvLookup = std::function<std::optional<std::string>(const char* name)>;

    static constexpr int kMaxTimeoutSeconds = net::SessionConfig::kMaxTimeoutSeconds;

    explicit ConfigLoader(EnvLookup env = &ConfigLoader::systemEnvironment);

    // `toml_path` may be empty. Returns false on parse errors, invalid values or
    // missing required settings; details in lastError()/missingKeys().
    bool load(const std::string& toml_path, WatchConfig& out);

    // Same as load() with the TOML document given inline
    bool loadFromString(std::string_view toml_text, WatchConfig& out);

    const char* lastError() const { return last_error_.c_str(); }
    const std::vector<std::string>& missingKeys() const { return missing_; }

    static std::optional<std::string> systemEnvironment(const char* name);

    // Splits a comma-separated address list, trimming entries and dropping empties
    static std::vector<std::string> parseRecipients(const std::string& list);

private:
    bool finish(WatchConfig& cfg);
    void applyTable(const toml::table& root, WatchConfig& cfg);
    void applyEnvironment(WatchConfig& cfg);
    bool parseInt(const std::string& key, const std::string& value, int& out);
    void narrowInt(const std::string& key, int64_t value, int& out);

    EnvLookup env_;
    std::string last_error_;
    std::vector<std::string> errors_;
    std::vector<std::string> missing_;
};
