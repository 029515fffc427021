#pragma once

#include <string>
#include <vector>

namespace net
{

struct Header
{
    std::string name;
    std::string value;
};

struct SessionConfig
{
    int connect_timeout_ms = 5000;
    int timeout_ms = 20000;

    static constexpr int kMaxTimeoutSeconds = 86400;

    // Both timeouts derived from a single user-facing value in seconds,
    // clamped to [1, kMaxTimeoutSeconds]
    static SessionConfig fromSeconds(int timeout_seconds);
};

struct HttpResponse
{
    int status_code = 0;
    std::string text;
    std::string error; // non-empty on network/transport errors

    bool ok() const { return error.empty() && status_code >= 200 && status_code < 300; }
};

// JSON POST helper
HttpResponse post_json(const std::string& url, const std::string& body, const std::vector<Header>& headers,
                       const SessionConfig& cfg);

// Simple GET helper
HttpResponse get(const std::string& url, const std::vector<Header>& headers, const SessionConfig& cfg);

} // namespace net
