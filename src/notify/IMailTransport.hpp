#pragma once

#include <optional>
#include <string>
#include <vector>

namespace notify
{

struct MailMessage
{
    std::string from;
    std::vector<std::string> to;
    std::string subject;
    std::string html;
    std::optional<std::string> text;
};

struct SendResult
{
    bool ok = false;
    std::string message_id; // provider id on success, may be empty
    std::string error;      // transport or provider detail on failure
};

// Delivers one message. Implementations do not retry.
class IMailTransport
{
public:
    virtual ~IMailTransport() = default;
    virtual SendResult send(const MailMessage& message) = 0;
    virtual const char* providerName() const = 0;
};

} // namespace notify
