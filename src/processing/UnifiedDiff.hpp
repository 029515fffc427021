#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace processing
{

inline constexpr int kDefaultMaxDiffLines = 2000;
inline constexpr int kDefaultContextLines = 3;
inline constexpr const char* kTruncationMarker = "... (diff truncated) ...";

// Line-level unified diff of `a` against `b`: "---"/"+++" headers, "@@ -a,b +c,d @@"
// hunk headers and ' ', '-', '+' prefixed lines. Returns no lines when a == b.
[[nodiscard]] std::vector<std::string> unified_diff_lines(const std::vector<std::string>& a,
                                                          const std::vector<std::string>& b,
                                                          std::string_view from_label, std::string_view to_label,
                                                          int context = kDefaultContextLines);

// When there are more than max_lines lines, keeps the first max_lines/2 and the
// last max_lines - max_lines/2 lines with a marker line in between.
// max_lines <= 0 leaves the input untouched.
[[nodiscard]] std::vector<std::string> truncate_middle(std::vector<std::string> lines, int max_lines);

// Bounded diff of two normalized snapshots, joined with \n
[[nodiscard]] std::string make_diff(const std::string& previous, const std::string& current,
                                    int max_lines = kDefaultMaxDiffLines);

} // namespace processing
