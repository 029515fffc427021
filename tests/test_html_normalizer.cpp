#include <catch2/catch_test_macros.hpp>
#include <string>

#include "processing/HtmlNormalizer.hpp"
#include "processing/TextNormalizer.hpp"

using processing::decode_entities;
using processing::normalize_html;

TEST_CASE("normalize_html extracts body text", "[normalizer]")
{
    REQUIRE(normalize_html("<html><body>Hello</body></html>") == "Hello");
    REQUIRE(normalize_html("") == "");
    REQUIRE(normalize_html("plain text, no markup") == "plain text, no markup");
}

TEST_CASE("normalize_html is deterministic", "[normalizer]")
{
    const std::string page = "<html><head><title>T</title></head><body><p>A &amp; B</p><ul><li>x</li><li>y</li>"
                             "</ul><script>var now = Date.now();</script></body></html>";
    REQUIRE(normalize_html(page) == normalize_html(page));
}

TEST_CASE("normalize_html drops invisible subtrees", "[normalizer]")
{
    const std::string base = "<html><body><p>Price: 10</p><p>In stock</p></body></html>";
    const std::string expected = "Price: 10\nIn stock";
    REQUIRE(normalize_html(base) == expected);

    SECTION("script anywhere does not change the output")
    {
        REQUIRE(normalize_html("<script>var t = 1712;</script>" + base) == expected);
        REQUIRE(normalize_html("<html><body><p>Price: 10</p><script type=\"text/javascript\">"
                               "if (a < b && c > d) { document.write('<p>nonce 42</p>'); }"
                               "</script><p>In stock</p></body></html>") == expected);
        REQUIRE(normalize_html(base + "<SCRIPT>tracker()</SCRIPT>") == expected);
    }

    SECTION("comment-escaped script bodies")
    {
        REQUIRE(normalize_html("<p>A</p><script><!-- document.write(\"<script></script>\"); --></script><p>B</p>") ==
                "A\nB");
        REQUIRE(normalize_html("<p>A</p><script><!-- x(); --></script><p>B</p>") == "A\nB");
        REQUIRE(normalize_html("<p>A</p><script>if (a<!--b) {}</script><p>B</p>") == "A\nB");
    }

    SECTION("style, noscript and template are removed")
    {
        REQUIRE(normalize_html("<style>p { color: red; }</style>" + base) == expected);
        REQUIRE(normalize_html("<html><body><noscript>Enable JS</noscript><p>Price: 10</p><p>In stock</p>"
                               "</body></html>") == expected);
        REQUIRE(normalize_html("<template><p>hidden</p></template>" + base) == expected);
    }

    SECTION("comments, doctype and CDATA are removed")
    {
        REQUIRE(normalize_html("<!DOCTYPE html><!-- build 2024-01-01 -->" + base) == expected);
        REQUIRE(normalize_html("<?xml version=\"1.0\"?>" + base + "<![CDATA[raw]]>") == expected);
    }
}

TEST_CASE("normalize_html collapses whitespace", "[normalizer]")
{
    const std::string minified = "<html><body><h1>Title</h1><p>First paragraph text.</p><div>Second</div></body></html>";
    const std::string pretty = R"(
<html>
    <body>

        <h1>
            Title
        </h1>


        <p>First
           paragraph     text.</p>
        	<div>  Second  </div>
    </body>
</html>
)";
    REQUIRE(normalize_html(pretty) == normalize_html(minified));
    REQUIRE(normalize_html(minified) == "Title\nFirst paragraph text.\nSecond");
}

TEST_CASE("normalize_html line structure", "[normalizer]")
{
    SECTION("block elements break lines, inline elements do not")
    {
        REQUIRE(normalize_html("<p>Hello <b>bold</b> <a href=\"/x\">link</a></p><p>Next</p>") ==
                "Hello bold link\nNext");
        REQUIRE(normalize_html("<div>Hello</div><div>World</div>") == "Hello\nWorld");
    }

    SECTION("br is a line break")
    {
        REQUIRE(normalize_html("line one<br>line two<br/>line three") == "line one\nline two\nline three");
    }

    SECTION("pre keeps its source lines")
    {
        REQUIRE(normalize_html("<pre>a\n  b\n\nc</pre>") == "a\nb\nc");
    }

    SECTION("table cells are separate lines")
    {
        REQUIRE(normalize_html("<table><tr><td>1</td><td>2</td></tr></table>") == "1\n2");
    }
}

TEST_CASE("normalize_html tolerates malformed markup", "[normalizer]")
{
    SECTION("unterminated comment hides the rest")
    {
        REQUIRE(normalize_html("<p>Visible</p><!-- never closed <p>gone</p>") == "Visible");
    }

    SECTION("unterminated script hides the rest")
    {
        REQUIRE(normalize_html("<p>Visible</p><script>var x = 1;") == "Visible");
    }

    SECTION("unterminated tag keeps trailing text")
    {
        REQUIRE_NOTHROW(normalize_html("<p>Visible</p><div class=\"x"));
        REQUIRE(normalize_html("<p>Visible</p><div class=\"x").find("Visible") == 0);
    }

    SECTION("stray angle brackets are text")
    {
        REQUIRE(normalize_html("<p>1 < 2 and 3 > 2</p>") == "1 < 2 and 3 > 2");
    }

    SECTION("unbalanced and unknown tags")
    {
        REQUIRE(normalize_html("</div></p>Text<foo-bar>more</foo-bar>") == "Textmore");
        REQUIRE(normalize_html("<p>a</3>b</p>") == "ab");
    }

    SECTION("quoted attributes may contain >")
    {
        REQUIRE(normalize_html("<a title=\"a > b\">Link</a>") == "Link");
    }
}

TEST_CASE("decode_entities", "[normalizer][entities]")
{
    REQUIRE(decode_entities("A &amp; B &lt;tag&gt; &quot;q&quot; &apos;s&apos;") == "A & B <tag> \"q\" 's'");
    REQUIRE(decode_entities("&#65;&#x42;&#X43;") == "ABC");
    REQUIRE(decode_entities("caf&#233;") == "caf\xC3\xA9");
    REQUIRE(decode_entities("&euro;5") == "\xE2\x82\xAC" "5");
    REQUIRE(decode_entities("&#x1F600;") == "\xF0\x9F\x98\x80");

    SECTION("unknown or broken references are kept")
    {
        REQUIRE(decode_entities("&bogus; & &amp") == "&bogus; & &amp");
        REQUIRE(decode_entities("&#xZZ;") == "&#xZZ;");
    }

    SECTION("invalid code points become U+FFFD")
    {
        REQUIRE(decode_entities("&#0;") == "\xEF\xBF\xBD");
        REQUIRE(decode_entities("&#xD800;") == "\xEF\xBF\xBD");
        REQUIRE(decode_entities("&#99999999;") == "\xEF\xBF\xBD");
    }

    SECTION("reference length is bounded")
    {
        const std::string name(31, 'a');
        REQUIRE(decode_entities("&" + name + ";") == "&" + name + ";");
        REQUIRE(decode_entities("&#" + std::string(28, '0') + "65;") == "A");
        REQUIRE(decode_entities("&#" + std::string(29, '0') + "65;") == "&#" + std::string(29, '0') + "65;");
    }

    SECTION("long runs of ampersands without a terminator")
    {
        const std::string amps(300000, '&');
        REQUIRE(decode_entities(amps) == amps);
        REQUIRE(normalize_html("<p>" + amps + "</p>") == amps);
    }

    SECTION("nbsp collapses like a space in page text")
    {
        REQUIRE(normalize_html("<p>&nbsp;&nbsp;Hello&nbsp;&nbsp;world&nbsp;</p>") == "Hello world");
    }

    SECTION("decoded markup is not reparsed")
    {
        REQUIRE(normalize_html("<p>&lt;script&gt;alert(1)&lt;/script&gt;</p>") == "<script>alert(1)</script>");
    }
}

TEST_CASE("collapse_blank_lines", "[normalizer][text]")
{
    REQUIRE(processing::collapse_blank_lines("  a  \r\n\r\n\t b\n\n\n") == "a\nb");
    REQUIRE(processing::collapse_blank_lines("\n \n") == "");
    REQUIRE(processing::normalize_line_endings("a\rb\r\nc") == "a\nb\nc");
}
