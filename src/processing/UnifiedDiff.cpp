#include "UnifiedDiff.hpp"
#include "TextNormalizer.hpp"

#include <algorithm>

namespace processing
{

namespace
{

enum class EditOp : char
{
    Equal,
    Delete,
    Insert
};

enum class OpTag
{
    Equal,
    Delete,
    Insert,
    Replace
};

struct Opcode
{
    OpTag tag;
    size_t i1, i2; // range in a
    size_t j1, j2; // range in b
};

// Above this edit distance the remaining middle section is emitted as one
// delete block plus one insert block; the trace would otherwise grow quadratically.
constexpr int kMaxEditDistance = 2000;

using Lines = std::vector<std::string>;

// Myers O(ND) shortest edit script over a[a_off, a_off+n) and b[b_off, b_off+m).
void myers_middle(const Lines& a, size_t a_off, int n, const Lines& b, size_t b_off, int m,
                  std::vector<EditOp>& ops)
{
    const int max = n + m;
    const int offset = max;
    std::vector<int> v(2 * static_cast<size_t>(max) + 2, 0);
    // trace[d] holds v[-(d-1) .. d-1] as it was before exploring layer d
    std::vector<std::vector<int>> trace;

    int final_d = -1;
    for (int d = 0; d <= max && d <= kMaxEditDistance; ++d)
    {
        if (d == 0)
            trace.emplace_back();
        else
            trace.emplace_back(v.begin() + (offset - (d - 1)), v.begin() + (offset + d));

        for (int k = -d; k <= d; k += 2)
        {
            int x;
            if (k == -d || (k != d && v[offset + k - 1] < v[offset + k + 1]))
                x = v[offset + k + 1]; // down (insertion)
            else
                x = v[offset + k - 1] + 1; // right (deletion)
            int y = x - k;
            while (x < n && y < m && a[a_off + x] == b[b_off + y])
            {
                ++x;
                ++y;
            }
            v[offset + k] = x;
            if (x >= n && y >= m)
            {
                final_d = d;
                break;
            }
        }
        if (final_d >= 0)
            break;
    }

    if (final_d < 0)
    {
        ops.insert(ops.end(), static_cast<size_t>(n), EditOp::Delete);
        ops.insert(ops.end(), static_cast<size_t>(m), EditOp::Insert);
        return;
    }

    std::vector<EditOp> rev;
    int x = n;
    int y = m;
    for (int d = final_d; d > 0; --d)
    {
        const auto& vv = trace[static_cast<size_t>(d)];
        auto at = [&](int k) { return vv[static_cast<size_t>(k + d - 1)]; };
        int k = x - y;
        bool down = k == -d || (k != d && at(k - 1) < at(k + 1));
        int prev_k = down ? k + 1 : k - 1;
        int prev_x = at(prev_k);
        int prev_y = prev_x - prev_k;
        int snake_start = down ? prev_x : prev_x + 1;
        while (x > snake_start)
        {
            rev.push_back(EditOp::Equal);
            --x;
            --y;
        }
        rev.push_back(down ? EditOp::Insert : EditOp::Delete);
        x = prev_x;
        y = prev_y;
    }
    while (x > 0)
    {
        rev.push_back(EditOp::Equal);
        --x;
    }
    ops.insert(ops.end(), rev.rbegin(), rev.rend());
}

std::vector<EditOp> edit_script(const Lines& a, const Lines& b)
{
    size_t prefix = 0;
    while (prefix < a.size() && prefix < b.size() && a[prefix] == b[prefix])
        ++prefix;
    size_t suffix = 0;
    while (suffix < a.size() - prefix && suffix < b.size() - prefix &&
           a[a.size() - 1 - suffix] == b[b.size() - 1 - suffix])
        ++suffix;

    std::vector<EditOp> ops;
    ops.reserve(a.size() + b.size());
    ops.insert(ops.end(), prefix, EditOp::Equal);
    int n = static_cast<int>(a.size() - prefix - suffix);
    int m = static_cast<int>(b.size() - prefix - suffix);
    if (n > 0 || m > 0)
        myers_middle(a, prefix, n, b, prefix, m, ops);
    ops.insert(ops.end(), suffix, EditOp::Equal);
    return ops;
}

// Runs of edits between equal lines collapse into delete/insert/replace opcodes.
std::vector<Opcode> to_opcodes(const std::vector<EditOp>& ops)
{
    std::vector<Opcode> codes;
    size_t i = 0;
    size_t j = 0;
    size_t p = 0;
    while (p < ops.size())
    {
        if (ops[p] == EditOp::Equal)
        {
            size_t i1 = i, j1 = j;
            while (p < ops.size() && ops[p] == EditOp::Equal)
            {
                ++i;
                ++j;
                ++p;
            }
            codes.push_back({ OpTag::Equal, i1, i, j1, j });
            continue;
        }

        size_t i1 = i, j1 = j;
        while (p < ops.size() && ops[p] != EditOp::Equal)
        {
            if (ops[p] == EditOp::Delete)
                ++i;
            else
                ++j;
            ++p;
        }
        OpTag tag = (i > i1 && j > j1) ? OpTag::Replace : (i > i1 ? OpTag::Delete : OpTag::Insert);
        codes.push_back({ tag, i1, i, j1, j });
    }
    return codes;
}

// Splits opcodes into hunks separated by more than 2*context unchanged lines.
std::vector<std::vector<Opcode>> group_opcodes(std::vector<Opcode> codes, size_t context)
{
    std::vector<std::vector<Opcode>> groups;
    if (codes.empty())
        return groups;

    if (codes.front().tag == OpTag::Equal)
    {
        auto& c = codes.front();
        c.i1 = std::max(c.i1, c.i2 > context ? c.i2 - context : 0);
        c.j1 = std::max(c.j1, c.j2 > context ? c.j2 - context : 0);
    }
    if (codes.back().tag == OpTag::Equal)
    {
        auto& c = codes.back();
        c.i2 = std::min(c.i2, c.i1 + context);
        c.j2 = std::min(c.j2, c.j1 + context);
    }

    std::vector<Opcode> group;
    for (auto c : codes)
    {
        if (c.tag == OpTag::Equal && c.i2 - c.i1 > 2 * context)
        {
            group.push_back({ OpTag::Equal, c.i1, std::min(c.i2, c.i1 + context), c.j1,
                              std::min(c.j2, c.j1 + context) });
            groups.push_back(std::move(group));
            group.clear();
            c.i1 = std::max(c.i1, c.i2 - context);
            c.j1 = std::max(c.j1, c.j2 - context);
        }
        group.push_back(c);
    }
    if (!group.empty())
        groups.push_back(std::move(group));

    // Hunks made only of context carry no change
    groups.erase(std::remove_if(groups.begin(), groups.end(),
                                [](const std::vector<Opcode>& g)
                                {
                                    return std::all_of(g.begin(), g.end(),
                                                       [](const Opcode& c) { return c.tag == OpTag::Equal; });
                                }),
                 groups.end());
    return groups;
}

std::string format_range(size_t start, size_t stop)
{
    size_t beginning = start + 1;
    size_t length = stop - start;
    if (length == 1)
        return std::to_string(beginning);
    if (length == 0)
        --beginning;
    return std::to_string(beginning) + "," + std::to_string(length);
}

} // namespace

std::vector<std::string> unified_diff_lines(const std::vector<std::string>& a, const std::vector<std::string>& b,
                                            std::string_view from_label, std::string_view to_label, int context)
{
    std::vector<std::string> out;
    auto groups = group_opcodes(to_opcodes(edit_script(a, b)), static_cast<size_t>(std::max(0, context)));
    if (groups.empty())
        return out;

    out.push_back("--- " + std::string(from_label));
    out.push_back("+++ " + std::string(to_label));
    for (const auto& group : groups)
    {
        const auto& first = group.front();
        const auto& last = group.back();
        out.push_back("@@ -" + format_range(first.i1, last.i2) + " +" + format_range(first.j1, last.j2) + " @@");
        for (const auto& c : group)
        {
            if (c.tag == OpTag::Equal)
            {
                for (size_t i = c.i1; i < c.i2; ++i)
                    out.push_back(" " + a[i]);
                continue;
            }
            if (c.tag == OpTag::Delete || c.tag == OpTag::Replace)
            {
                for (size_t i = c.i1; i < c.i2; ++i)
                    out.push_back("-" + a[i]);
            }
            if (c.tag == OpTag::Insert || c.tag == OpTag::Replace)
            {
                for (size_t j = c.j1; j < c.j2; ++j)
                    out.push_back("+" + b[j]);
            }
        }
    }
    return out;
}

std::vector<std::string> truncate_middle(std::vector<std::string> lines, int max_lines)
{
    if (max_lines <= 0 || lines.size() <= static_cast<size_t>(max_lines))
        return lines;

    // The tail takes the larger half for odd limits, so the output is always max_lines + 1 lines
    const size_t head = static_cast<size_t>(max_lines / 2);
    const size_t tail = static_cast<size_t>(max_lines) - head;
    std::vector<std::string> out;
    out.reserve(head + tail + 1);
    out.insert(out.end(), std::make_move_iterator(lines.begin()), std::make_move_iterator(lines.begin() + head));
    out.emplace_back(kTruncationMarker);
    out.insert(out.end(), std::make_move_iterator(lines.end() - tail), std::make_move_iterator(lines.end()));
    return out;
}

std::string make_diff(const std::string& previous, const std::string& current, int max_lines)
{
    auto lines = truncate_middle(unified_diff_lines(split_lines(previous), split_lines(current), "previous", "current"),
                                 max_lines);
    std::string out;
    for (size_t i = 0; i < lines.size(); ++i)
    {
        if (i)
            out.push_back('\n');
        out += lines[i];
    }
    return out;
}

} // namespace processing
