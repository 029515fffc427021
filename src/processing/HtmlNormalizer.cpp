#include "HtmlNormalizer.hpp"
#include "TextNormalizer.hpp"

#include <array>
#include <cctype>
#include <cstdint>
#include <unordered_map>
#include <unordered_set>

namespace processing
{

namespace
{

struct NamedEntity
{
    const char* name;
    const char* utf8;
};

// &nbsp; maps to a plain space so it takes part in whitespace collapsing.
constexpr std::array<NamedEntity, 40> kNamedEntities = { {
    { "amp", "&" },       { "lt", "<" },         { "gt", ">" },         { "quot", "\"" },
    { "apos", "'" },      { "nbsp", " " },       { "ensp", " " },       { "emsp", " " },
    { "thinsp", " " },    { "shy", "" },         { "copy", "\xC2\xA9" }, { "reg", "\xC2\xAE" },
    { "trade", "\xE2\x84\xA2" }, { "hellip", "\xE2\x80\xA6" }, { "mdash", "\xE2\x80\x94" },
    { "ndash", "\xE2\x80\x93" }, { "lsquo", "\xE2\x80\x98" }, { "rsquo", "\xE2\x80\x99" },
    { "ldquo", "\xE2\x80\x9C" }, { "rdquo", "\xE2\x80\x9D" }, { "laquo", "\xC2\xAB" },
    { "raquo", "\xC2\xBB" },     { "bull", "\xE2\x80\xA2" },  { "middot", "\xC2\xB7" },
    { "euro", "\xE2\x82\xAC" },  { "pound", "\xC2\xA3" },     { "yen", "\xC2\xA5" },
    { "cent", "\xC2\xA2" },      { "deg", "\xC2\xB0" },       { "times", "\xC3\x97" },
    { "divide", "\xC3\xB7" },    { "sect", "\xC2\xA7" },      { "para", "\xC2\xB6" },
    { "iexcl", "\xC2\xA1" },     { "iquest", "\xC2\xBF" },    { "larr", "\xE2\x86\x90" },
    { "rarr", "\xE2\x86\x92" },  { "uarr", "\xE2\x86\x91" },  { "darr", "\xE2\x86\x93" },
    { "plusmn", "\xC2\xB1" },
} };

const std::unordered_map<std::string_view, std::string_view>& named_entity_map()
{
    static const std::unordered_map<std::string_view, std::string_view> map = []
    {
        std::unordered_map<std::string_view, std::string_view> m;
        for (const auto& e : kNamedEntities)
            m.emplace(e.name, e.utf8);
        return m;
    }();
    return map;
}

// Subtrees whose content is never visible text.
const std::unordered_set<std::string>& hidden_elements()
{
    static const std::unordered_set<std::string> set = { "script", "style", "noscript", "template" };
    return set;
}

const std::unordered_set<std::string>& block_elements()
{
    static const std::unordered_set<std::string> set = {
        "address", "article", "aside",   "blockquote", "body",     "br",      "caption", "center",
        "dd",      "details", "dialog",  "dir",        "div",      "dl",      "dt",      "fieldset",
        "figcaption", "figure", "footer", "form",      "h1",       "h2",      "h3",      "h4",
        "h5",      "h6",      "head",    "header",     "hgroup",   "hr",      "html",    "legend",
        "li",      "main",    "menu",    "nav",        "ol",       "option",  "p",       "pre",
        "section", "summary", "table",   "tbody",      "td",       "textarea", "tfoot",  "th",
        "thead",   "title",   "tr",      "ul",
    };
    return set;
}

bool is_space(char c)
{
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

bool is_name_char(char c)
{
    return std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == ':' || c == '_';
}

char lower(char c)
{
    return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

bool starts_with_ci(std::string_view s, size_t pos, std::string_view prefix)
{
    if (pos + prefix.size() > s.size())
        return false;
    for (size_t i = 0; i < prefix.size(); ++i)
    {
        if (lower(s[pos + i]) != lower(prefix[i]))
            return false;
    }
    return true;
}

void append_utf8(std::string& out, std::uint32_t cp)
{
    if (cp == 0 || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF))
        cp = 0xFFFD;

    if (cp < 0x80)
    {
        out.push_back(static_cast<char>(cp));
    }
    else if (cp < 0x800)
    {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
    else if (cp < 0x10000)
    {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
    else
    {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

// Parses the reference starting at text[pos] == '&'. On success appends the
// decoded value and returns the index after ';', otherwise returns pos.
size_t decode_reference(std::string_view text, size_t pos, std::string& out)
{
    constexpr size_t kMaxReferenceLength = 32;
    const std::string_view window = text.substr(pos, kMaxReferenceLength + 1);
    const size_t rel = window.find(';', 1);
    if (rel == std::string_view::npos || rel == 1)
        return pos;
    const size_t semi = pos + rel;

    std::string_view body = text.substr(pos + 1, semi - pos - 1);
    if (body[0] == '#')
    {
        bool hex = body.size() > 1 && (body[1] == 'x' || body[1] == 'X');
        std::string_view digits = body.substr(hex ? 2 : 1);
        if (digits.empty())
            return pos;

        std::uint32_t cp = 0;
        for (char c : digits)
        {
            int v;
            if (c >= '0' && c <= '9')
                v = c - '0';
            else if (hex && c >= 'a' && c <= 'f')
                v = c - 'a' + 10;
            else if (hex && c >= 'A' && c <= 'F')
                v = c - 'A' + 10;
            else
                return pos;
            cp = cp * (hex ? 16 : 10) + static_cast<std::uint32_t>(v);
            if (cp > 0x10FFFF)
                cp = 0x110000; // clamp, replaced below
        }
        append_utf8(out, cp);
        return semi + 1;
    }

    const auto& map = named_entity_map();
    auto it = map.find(body);
    if (it == map.end())
        return pos;
    out.append(it->second);
    return semi + 1;
}

// Finds the end '>' of a tag, skipping over quoted attribute values.
size_t find_tag_end(std::string_view markup, size_t pos)
{
    char quote = 0;
    for (size_t i = pos; i < markup.size(); ++i)
    {
        char c = markup[i];
        if (quote)
        {
            if (c == quote)
                quote = 0;
        }
        else if (c == '"' || c == '\'')
        {
            quote = c;
        }
        else if (c == '>')
        {
            return i;
        }
    }
    // Unbalanced quote: fall back to the first '>' after the tag start
    return markup.find('>', pos);
}

bool is_tag_boundary(std::string_view s, size_t pos)
{
    return pos >= s.size() || is_space(s[pos]) || s[pos] == '/' || s[pos] == '>';
}

// Returns the index just past the closing tag of a raw-text element, or the end
// of input when the element is never closed.
//
// Script bodies follow the escaped states of the HTML tokenizer: inside
// "<!-- ... -->" a nested "<script>...</script>" pair does not end the element.
size_t skip_raw_text(std::string_view markup, size_t pos, const std::string& name)
{
    enum class Escape
    {
        None,
        Escaped,
        DoubleEscaped
    };

    const std::string needle = "</" + name;
    const bool is_script = name == "script";
    Escape escape = Escape::None;

    for (size_t i = pos; i < markup.size(); ++i)
    {
        if (is_script)
        {
            if (escape == Escape::None && markup.compare(i, 4, "<!--") == 0)
            {
                escape = Escape::Escaped;
                i += 3;
                continue;
            }
            if (escape != Escape::None && markup.compare(i, 3, "-->") == 0)
            {
                escape = Escape::None;
                i += 2;
                continue;
            }
            if (escape == Escape::Escaped && starts_with_ci(markup, i, "<script") && is_tag_boundary(markup, i + 7))
            {
                escape = Escape::DoubleEscaped;
                i += 6;
                continue;
            }
            if (escape == Escape::DoubleEscaped)
            {
                if (starts_with_ci(markup, i, "</script") && is_tag_boundary(markup, i + 8))
                {
                    escape = Escape::Escaped;
                    i += 7;
                }
                continue;
            }
        }

        if (markup[i] != '<' || !starts_with_ci(markup, i, needle))
            continue;
        size_t after = i + needle.size();
        if (after < markup.size() && is_name_char(markup[after]))
            continue;
        size_t end = markup.find('>', after);
        return end == std::string_view::npos ? markup.size() : end + 1;
    }
    return markup.size();
}

class TextCollector
{
public:
    void appendText(std::string_view raw)
    {
        std::string decoded = decode_entities(raw);
        for (char c : decoded)
        {
            if (pre_depth_ > 0)
            {
                if (c == '\r')
                    continue;
                out_.push_back(c == '\n' ? '\n' : (is_space(c) ? ' ' : c));
            }
            else if (is_space(c))
            {
                if (!out_.empty() && out_.back() != ' ' && out_.back() != '\n')
                    out_.push_back(' ');
            }
            else
            {
                out_.push_back(c);
            }
        }
    }

    void lineBreak()
    {
        if (!out_.empty() && out_.back() != '\n')
            out_.push_back('\n');
    }

    void enterPre() { ++pre_depth_; }
    void leavePre()
    {
        if (pre_depth_ > 0)
            --pre_depth_;
    }

    std::string finish() const { return collapse_blank_lines(out_); }

private:
    std::string out_;
    int pre_depth_ = 0;
};

} // namespace

std::string decode_entities(std::string_view text)
{
    std::string out;
    out.reserve(text.size());
    size_t i = 0;
    while (i < text.size())
    {
        if (text[i] == '&')
        {
            size_t next = decode_reference(text, i, out);
            if (next != i)
            {
                i = next;
                continue;
            }
        }
        out.push_back(text[i]);
        ++i;
    }
    return out;
}

std::string normalize_html(std::string_view markup)
{
    TextCollector text;
    size_t i = 0;
    size_t text_start = 0;

    auto flush_text = [&](size_t end)
    {
        if (end > text_start)
            text.appendText(markup.substr(text_start, end - text_start));
    };

    while (i < markup.size())
    {
        if (markup[i] != '<')
        {
            ++i;
            continue;
        }

        // Comments, CDATA, doctype and processing instructions carry no visible text
        if (markup.compare(i, 4, "<!--") == 0)
        {
            flush_text(i);
            size_t end = markup.find("-->", i + 4);
            i = end == std::string_view::npos ? markup.size() : end + 3;
            text_start = i;
            continue;
        }
        if (starts_with_ci(markup, i, "<![CDATA["))
        {
            flush_text(i);
            size_t end = markup.find("]]>", i + 9);
            i = end == std::string_view::npos ? markup.size() : end + 3;
            text_start = i;
            continue;
        }
        if (i + 1 < markup.size() && (markup[i + 1] == '!' || markup[i + 1] == '?'))
        {
            flush_text(i);
            size_t end = markup.find('>', i + 2);
            i = end == std::string_view::npos ? markup.size() : end + 1;
            text_start = i;
            continue;
        }

        size_t name_pos = i + 1;
        bool closing = name_pos < markup.size() && markup[name_pos] == '/';
        if (closing)
            ++name_pos;

        if (name_pos >= markup.size() || !std::isalpha(static_cast<unsigned char>(markup[name_pos])))
        {
            if (closing)
            {
                // "</3" style bogus end tag: dropped up to the next '>'
                flush_text(i);
                size_t end = markup.find('>', name_pos);
                i = end == std::string_view::npos ? markup.size() : end + 1;
                text_start = i;
            }
            else
            {
                // A bare '<' in text, e.g. "a < b"
                ++i;
            }
            continue;
        }

        size_t name_end = name_pos;
        while (name_end < markup.size() && is_name_char(markup[name_end]))
            ++name_end;

        size_t tag_end = find_tag_end(markup, name_end);
        if (tag_end == std::string_view::npos)
        {
            // Unterminated tag: keep the remainder as text
            ++i;
            continue;
        }

        flush_text(i);

        std::string name;
        name.reserve(name_end - name_pos);
        for (size_t k = name_pos; k < name_end; ++k)
            name.push_back(lower(markup[k]));

        bool self_closing = tag_end > name_end && markup[tag_end - 1] == '/';
        i = tag_end + 1;

        if (!closing && !self_closing && hidden_elements().count(name))
        {
            i = skip_raw_text(markup, i, name);
            text_start = i;
            continue;
        }

        if (block_elements().count(name))
            text.lineBreak();

        if (name == "pre" || name == "textarea")
        {
            if (closing)
                text.leavePre();
            else if (!self_closing)
                text.enterPre();
        }

        text_start = i;
    }

    flush_text(markup.size());
    return text.finish();
}

} // namespace processing
