#include "HttpCommon.hpp"

#include <cpr/cpr.h>

#include <algorithm>
#include <cctype>
#include <cstdint>

namespace
{

bool iequals(const std::string& a, const char* b)
{
    std::size_t i = 0;
    for (; i < a.size() && b[i] != '\0'; ++i)
    {
        char x = static_cast<char>(std::tolower(static_cast<unsigned char>(a[i])));
        char y = static_cast<char>(std::tolower(static_cast<unsigned char>(b[i])));
        if (x != y)
            return false;
    }
    return i == a.size() && b[i] == '\0';
}

void apply_common(cpr::Session& s, const net::SessionConfig& cfg)
{
    s.SetConnectTimeout(cpr::ConnectTimeout{ cfg.connect_timeout_ms });
    s.SetTimeout(cpr::Timeout{ cfg.timeout_ms });
}

cpr::Header make_header(const std::vector<net::Header>& headers, bool ensure_json)
{
    cpr::Header h;
    bool has_ct = false;
    for (const auto& kv : headers)
    {
        if (!has_ct && iequals(kv.name, "Content-Type"))
            has_ct = true;
        h.emplace(kv.name, kv.value);
    }
    if (ensure_json && !has_ct)
        h.emplace("Content-Type", "application/json");
    return h;
}

net::HttpResponse to_response(cpr::Response&& r)
{
    net::HttpResponse hr;
    if (r.error)
    {
        hr.error = r.error.message.empty() ? std::string("transport error") : r.error.message;
        return hr;
    }
    hr.status_code = static_cast<int>(r.status_code);
    hr.text = std::move(r.text);
    return hr;
}

} // namespace

namespace net
{

SessionConfig SessionConfig::fromSeconds(int timeout_seconds)
{
    SessionConfig cfg;
    const std::int64_t ms = std::clamp<std::int64_t>(timeout_seconds, 1, kMaxTimeoutSeconds) * 1000;
    cfg.timeout_ms = static_cast<int>(ms);
    cfg.connect_timeout_ms = std::min(cfg.connect_timeout_ms, cfg.timeout_ms);
    return cfg;
}

HttpResponse post_json(const std::string& url, const std::string& body, const std::vector<Header>& headers,
                       const SessionConfig& cfg)
{
    cpr::Session s;
    s.SetUrl(cpr::Url{ url });
    s.SetHeader(make_header(headers, /*ensure_json*/ true));
    s.SetBody(cpr::Body{ body });
    apply_common(s, cfg);
    return to_response(s.Post());
}

HttpResponse get(const std::string& url, const std::vector<Header>& headers, const SessionConfig& cfg)
{
    cpr::Session s;
    s.SetUrl(cpr::Url{ url });
    s.SetHeader(make_header(headers, /*ensure_json*/ false));
    apply_common(s, cfg);
    return to_response(s.Get());
}

} // namespace net
