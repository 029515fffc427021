#include "TextNormalizer.hpp"

namespace processing
{

namespace
{

bool is_space(char c)
{
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

} // namespace

std::string normalize_line_endings(const std::string& text)
{
    if (text.empty())
        return text;
    std::string out;
    out.reserve(text.size());

    for (size_t i = 0; i < text.size(); ++i)
    {
        char c = text[i];
        if (c == '\r')
        {
            // \r\n and lone \r both become a single \n
            if (i + 1 < text.size() && text[i + 1] == '\n')
                ++i;
            out.push_back('\n');
        }
        else
        {
            out.push_back(c);
        }
    }

    return out;
}

std::string trim(std::string_view text)
{
    size_t begin = 0;
    size_t end = text.size();
    while (begin < end && is_space(text[begin]))
        ++begin;
    while (end > begin && is_space(text[end - 1]))
        --end;
    return std::string(text.substr(begin, end - begin));
}

std::vector<std::string> split_lines(std::string_view text)
{
    std::vector<std::string> out;
    std::string cur;
    for (const char c : text)
    {
        if (c == '\n')
        {
            out.push_back(std::move(cur));
            cur.clear();
        }
        else
        {
            cur.push_back(c);
        }
    }
    if (!cur.empty())
        out.push_back(std::move(cur));
    return out;
}

std::string collapse_blank_lines(const std::string& text)
{
    std::string result;
    result.reserve(text.size());

    for (const auto& line : split_lines(normalize_line_endings(text)))
    {
        std::string trimmed = trim(line);
        if (trimmed.empty())
            continue;
        if (!result.empty())
            result.push_back('\n');
        result += trimmed;
    }

    return result;
}

} // namespace processing
