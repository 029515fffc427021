#include "PageFetcher.hpp"

#include <plog/Log.h>

namespace net
{

HttpPageFetcher::HttpPageFetcher(int timeout_seconds, std::optional<std::string> user_agent)
    : session_(SessionConfig::fromSeconds(timeout_seconds))
    , user_agent_(std::move(user_agent))
{
}

FetchResult HttpPageFetcher::fetch(const std::string& url)
{
    std::vector<Header> headers;
    if (user_agent_ && !user_agent_->empty())
        headers.push_back({ "User-Agent", *user_agent_ });

    PLOG_DEBUG << "GET " << url << " (timeout " << session_.timeout_ms << "ms)";
    return interpret(get(url, headers, session_));
}

FetchResult HttpPageFetcher::interpret(const HttpResponse& resp)
{
    FetchResult result;
    result.status_code = resp.status_code;
    if (!resp.error.empty())
    {
        result.error = resp.error;
        return result;
    }
    if (!resp.ok())
    {
        result.error = "HTTP " + std::to_string(resp.status_code);
        return result;
    }
    result.ok = true;
    result.body = resp.text;
    return result;
}

} // namespace net
