#pragma once

#include "IMailTransport.hpp"
#include "../net/HttpCommon.hpp"

#include <nlohmann/json.hpp>

namespace notify
{

inline constexpr const char* kResendEndpoint = "https://api.resend.com/emails";

// Resend transactional email API: bearer-token POST of a JSON message
class ResendTransport : public IMailTransport
{
public:
    ResendTransport(std::string api_key, std::string endpoint, int timeout_seconds);

    SendResult send(const MailMessage& message) override;
    const char* providerName() const override { return "Resend"; }

    static void buildRequestBody(const MailMessage& message, nlohmann::json& body);

    // Any transport error, HTTP status >= 300 or non-JSON body is a failure
    static SendResult interpretResponse(const net::HttpResponse& resp);

private:
    std::string api_key_;
    std::string endpoint_;
    net::SessionConfig session_;
};

} // namespace notify
