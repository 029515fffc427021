#include "ResendTransport.hpp"

#include <plog/Log.h>

namespace notify
{

ResendTransport::ResendTransport(std::string api_key, std::string endpoint, int timeout_seconds)
    : api_key_(std::move(api_key))
    , endpoint_(endpoint.empty() ? std::string(kResendEndpoint) : std::move(endpoint))
    , session_(net::SessionConfig::fromSeconds(timeout_seconds))
{
}

void ResendTransport::buildRequestBody(const MailMessage& message, nlohmann::json& body)
{
    body["from"] = message.from;
    body["to"] = message.to;
    body["subject"] = message.subject;
    body["html"] = message.html;
    if (message.text && !message.text->empty())
        body["text"] = *message.text;
}

SendResult ResendTransport::send(const MailMessage& message)
{
    nlohmann::json body;
    buildRequestBody(message, body);

    std::vector<net::Header> headers{ { "Authorization", std::string("Bearer ") + api_key_ },
                                      { "Content-Type", "application/json" } };

    PLOG_DEBUG << "POST " << endpoint_ << " (" << message.to.size() << " recipient(s))";
    // Page text is not guaranteed to be valid UTF-8
    const std::string payload = body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    return interpretResponse(net::post_json(endpoint_, payload, headers, session_));
}

SendResult ResendTransport::interpretResponse(const net::HttpResponse& resp)
{
    SendResult result;
    if (!resp.error.empty())
    {
        result.error = "transport error: " + resp.error;
        return result;
    }

    nlohmann::json data;
    try
    {
        data = nlohmann::json::parse(resp.text);
    }
    catch (const nlohmann::json::exception& ex)
    {
        if (resp.status_code >= 300)
            result.error = "Resend error " + std::to_string(resp.status_code) + ": " + resp.text;
        else
            result.error = std::string("malformed response: ") + ex.what();
        return result;
    }

    if (resp.status_code >= 300)
    {
        std::string detail = data.is_object() && data.contains("message") && data["message"].is_string()
                                 ? data["message"].get<std::string>()
                                 : data.dump();
        result.error = "Resend error " + std::to_string(resp.status_code) + ": " + detail;
        return result;
    }

    if (!data.is_object())
    {
        result.error = "malformed response: expected a JSON object";
        return result;
    }

    result.ok = true;
    if (data.contains("id") && data["id"].is_string())
        result.message_id = data["id"].get<std::string>();
    return result;
}

} // namespace notify
