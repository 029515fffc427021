#pragma once

#include "IMailTransport.hpp"
#include "../storage/Snapshot.hpp"

#include <string>
#include <vector>

namespace notify
{

struct NotifierSettings
{
    std::string sender;
    std::vector<std::string> recipients;
    std::string subject_prefix = "[Page Watch]";
};

struct NotifyResult
{
    bool ok = false;
    std::string error;
    std::string message_id;
};

// Escapes & < > " ' for safe interpolation into HTML text and attributes
[[nodiscard]] std::string html_escape(const std::string& text);

// Turns a detected change into a mail and hands it to the transport.
// Exactly one send per call and no retries; failures come back in the result.
class ChangeNotifier
{
public:
    ChangeNotifier(NotifierSettings settings, IMailTransport& transport);

    NotifyResult notify(const storage::WatchTarget& target, const std::string& previous_text,
                        const std::string& current_text, const std::string& diff_text,
                        const std::string& timestamp);

    MailMessage buildMessage(const storage::WatchTarget& target, const std::string& previous_text,
                             const std::string& current_text, const std::string& diff_text,
                             const std::string& timestamp) const;

private:
    NotifierSettings settings_;
    IMailTransport& transport_;
};

} // namespace notify
