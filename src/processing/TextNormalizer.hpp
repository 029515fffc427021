#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace processing
{

// Converts \r\n and \r to \n
[[nodiscard]] std::string normalize_line_endings(const std::string& text);

// Strips ASCII whitespace from both ends
[[nodiscard]] std::string trim(std::string_view text);

// Splits on \n; a trailing newline does not produce an empty last line
[[nodiscard]] std::vector<std::string> split_lines(std::string_view text);

// Trims every line, drops empty ones and joins the rest with \n
[[nodiscard]] std::string collapse_blank_lines(const std::string& text);

} // namespace processing
