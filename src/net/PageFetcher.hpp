#pragma once

#include "HttpCommon.hpp"

#include <optional>
#include <string>

namespace net
{

struct FetchResult
{
    bool ok = false;
    int status_code = 0;
    std::string body;
    std::string error; // transport error or "HTTP <status>" on non-2xx
};

// Retrieves the raw markup of a page. One call per pipeline run.
class IPageFetcher
{
public:
    virtual ~IPageFetcher() = default;
    virtual FetchResult fetch(const std::string& url) = 0;
};

class HttpPageFetcher : public IPageFetcher
{
public:
    HttpPageFetcher(int timeout_seconds, std::optional<std::string> user_agent);

    FetchResult fetch(const std::string& url) override;

    // Maps a raw HTTP response onto the fetch contract (non-2xx is a failure)
    static FetchResult interpret(const HttpResponse& resp);

private:
    SessionConfig session_;
    std::optional<std::string> user_agent_;
};

} // namespace net
