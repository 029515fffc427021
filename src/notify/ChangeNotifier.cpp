#include "ChangeNotifier.hpp"
#include "../processing/TextNormalizer.hpp"

#include <plog/Log.h>

#include <sstream>

namespace notify
{

std::string html_escape(const std::string& text)
{
    std::string out;
    out.reserve(text.size() + text.size() / 8);
    for (char c : text)
    {
        switch (c)
        {
        case '&':
            out += "&amp;";
            break;
        case '<':
            out += "&lt;";
            break;
        case '>':
            out += "&gt;";
            break;
        case '"':
            out += "&quot;";
            break;
        case '\'':
            out += "&#x27;";
            break;
        default:
            out.push_back(c);
            break;
        }
    }
    return out;
}

ChangeNotifier::ChangeNotifier(NotifierSettings settings, IMailTransport& transport)
    : settings_(std::move(settings))
    , transport_(transport)
{
}

MailMessage ChangeNotifier::buildMessage(const storage::WatchTarget& target, const std::string& previous_text,
                                         const std::string& current_text, const std::string& diff_text,
                                         const std::string& timestamp) const
{
    const size_t previous_lines = processing::split_lines(previous_text).size();
    const size_t current_lines = processing::split_lines(current_text).size();

    MailMessage msg;
    msg.from = settings_.sender;
    msg.to = settings_.recipients;
    msg.subject = settings_.subject_prefix.empty() ? "Change detected @ " + timestamp
                                                   : settings_.subject_prefix + " Change detected @ " + timestamp;

    const std::string url = html_escape(target.url);
    std::ostringstream html;
    html << "<div>\n"
         << "  <p>Change detected on <a href=\"" << url << "\">" << url << "</a> at " << html_escape(timestamp)
         << ".</p>\n"
         << "  <p>Page text went from " << previous_lines << " to " << current_lines << " lines.</p>\n"
         << "  <p><strong>Unified diff</strong> (previous &rarr; current):</p>\n"
         << "  <pre style=\"white-space:pre-wrap; word-wrap:break-word;\">" << html_escape(diff_text) << "</pre>\n"
         << "</div>\n";
    msg.html = html.str();

    std::ostringstream text;
    text << "Change detected on " << target.url << " at " << timestamp << ".\n"
         << "Page text went from " << previous_lines << " to " << current_lines << " lines.\n\n"
         << "Unified diff (previous -> current):\n\n"
         << diff_text;
    msg.text = text.str();
    return msg;
}

NotifyResult ChangeNotifier::notify(const storage::WatchTarget& target, const std::string& previous_text,
                                    const std::string& current_text, const std::string& diff_text,
                                    const std::string& timestamp)
{
    NotifyResult result;
    if (settings_.recipients.empty())
    {
        result.error = "no recipients configured";
        return result;
    }

    MailMessage msg = buildMessage(target, previous_text, current_text, diff_text, timestamp);

    SendResult sent;
    try
    {
        sent = transport_.send(msg);
    }
    catch (const std::exception& ex)
    {
        sent.ok = false;
        sent.error = std::string("transport threw: ") + ex.what();
    }

    if (!sent.ok)
    {
        result.error = std::string(transport_.providerName()) + ": " + sent.error;
        return result;
    }

    PLOG_INFO << "Sent alert via " << transport_.providerName()
              << (sent.message_id.empty() ? std::string() : " (id " + sent.message_id + ")");
    result.ok = true;
    result.message_id = std::move(sent.message_id);
    return result;
}

} // namespace notify
