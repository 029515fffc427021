#pragma once

#include <string>
#include <string_view>

namespace processing
{

// Converts page markup into the text used for change comparison.
//
// script/style/noscript/template subtrees, comments, doctype and processing
// instructions are dropped. Block-level element boundaries and <br> become line
// breaks, whitespace inside text collapses to a single space (source newlines are
// kept inside <pre>/<textarea>), and character references are decoded. The result
// is the sequence of trimmed, non-empty lines joined with \n.
//
// Pure and deterministic. Malformed markup never throws; unterminated constructs
// degrade to best-effort extraction.
[[nodiscard]] std::string normalize_html(std::string_view markup);

// Decodes named (common subset) and numeric character references. Unknown or
// unterminated references are copied through verbatim.
[[nodiscard]] std::string decode_entities(std::string_view text);

} // namespace processing
