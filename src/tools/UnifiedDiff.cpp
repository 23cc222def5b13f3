// SPDX-License-Identifier: Apache-2.0
#include "UnifiedDiff.hpp"

#include <algorithm>
#include <charconv>
#include <cstdlib>
#include <format>
#include <optional>

namespace agentshell::diff
{

namespace
{

    struct SplitText
    {
        std::vector<std::string> lines;
        bool trailingNewline = false;
    };

    auto splitLines(std::string_view text) -> SplitText
    {
        auto split = SplitText {};
        if (text.empty())
            return split;

        auto start = std::size_t { 0 };
        while (start < text.size())
        {
            auto const end = text.find('\n', start);
            if (end == std::string_view::npos)
            {
                split.lines.emplace_back(text.substr(start));
                return split;
            }
            auto line = text.substr(start, end - start);
            if (!line.empty() && line.back() == '\r')
                line.remove_suffix(1);
            split.lines.emplace_back(line);
            start = end + 1;
        }
        split.trailingNewline = true;
        return split;
    }

    /// @brief Parses "a" or "a,b" into start and count (count defaults to 1).
    auto parseRange(std::string_view range) -> std::optional<std::pair<int, int>>
    {
        auto start = 0;
        auto count = 1;
        auto const comma = range.find(',');
        auto const first = range.substr(0, comma);
        if (std::from_chars(first.data(), first.data() + first.size(), start).ec != std::errc {})
            return std::nullopt;
        if (comma != std::string_view::npos)
        {
            auto const second = range.substr(comma + 1);
            if (std::from_chars(second.data(), second.data() + second.size(), count).ec != std::errc {})
                return std::nullopt;
        }
        return std::pair { start, count };
    }

    auto parseHeader(std::string_view line) -> std::optional<Hunk>
    {
        // @@ -oldStart,oldCount +newStart,newCount @@ optional section
        if (!line.starts_with("@@ -"))
            return std::nullopt;
        auto const close = line.find(" @@", 4);
        if (close == std::string_view::npos)
            return std::nullopt;

        auto const ranges = line.substr(4, close - 4);
        auto const plus = ranges.find(" +");
        if (plus == std::string_view::npos)
            return std::nullopt;

        auto const oldRange = parseRange(ranges.substr(0, plus));
        auto const newRange = parseRange(ranges.substr(plus + 2));
        if (!oldRange || !newRange)
            return std::nullopt;

        return Hunk {
            .oldStart = oldRange->first,
            .oldCount = oldRange->second,
            .newStart = newRange->first,
            .newCount = newRange->second,
            .lines = {},
        };
    }

    auto matchesAt(const std::vector<std::string>& lines, std::size_t position, const std::vector<std::string>& expected)
        -> bool
    {
        if (position + expected.size() > lines.size())
            return false;
        for (auto i = std::size_t { 0 }; i < expected.size(); ++i)
        {
            if (lines[position + i] != expected[i])
                return false;
        }
        return true;
    }

} // namespace

auto parse(std::string_view diffText) -> Result<std::vector<Hunk>>
{
    auto hunks = std::vector<Hunk> {};
    auto const split = splitLines(diffText);

    for (auto const& line: split.lines)
    {
        if (line.starts_with("@@"))
        {
            auto hunk = parseHeader(line);
            if (!hunk)
                return makeError(ErrorCode::ValidationError, std::format("Malformed hunk header: {}", line));
            hunks.push_back(std::move(*hunk));
            continue;
        }

        if (hunks.empty())
            continue; // preamble: "diff --git", "---", "+++", index lines

        if (line.starts_with("\\"))
            continue; // "\ No newline at end of file"

        auto& body = hunks.back().lines;
        if (line.empty())
            body.push_back(HunkLine { .op = ' ', .text = {} });
        else if (line[0] == ' ' || line[0] == '-' || line[0] == '+')
            body.push_back(HunkLine { .op = line[0], .text = line.substr(1) });
        else if (line.starts_with("diff ") || line.starts_with("--- ") || line.starts_with("+++ "))
            return makeError(ErrorCode::ValidationError, "Patch must modify a single file");
        else
            return makeError(ErrorCode::ValidationError, std::format("Unexpected line in hunk: {}", line));
    }

    if (hunks.empty())
        return makeError(ErrorCode::ValidationError, "Patch contains no hunks");

    return hunks;
}

auto apply(std::string_view original, std::span<const Hunk> hunks) -> Result<std::string>
{
    auto const source = splitLines(original);
    auto output = std::vector<std::string> {};
    auto cursor = std::size_t { 0 };

    for (auto hunkIndex = std::size_t { 0 }; hunkIndex < hunks.size(); ++hunkIndex)
    {
        auto const& hunk = hunks[hunkIndex];

        auto expected = std::vector<std::string> {};
        for (auto const& line: hunk.lines)
        {
            if (line.op != '+')
                expected.push_back(line.text);
        }

        // Declared position first, then the nearest matching position not before the cursor.
        auto const declared = static_cast<std::size_t>(std::max(hunk.oldStart - 1, 0));
        auto position = std::optional<std::size_t> {};
        if (declared >= cursor && matchesAt(source.lines, declared, expected))
            position = declared;

        for (auto distance = std::size_t { 1 }; !position && distance <= source.lines.size(); ++distance)
        {
            if (declared + distance >= cursor && matchesAt(source.lines, declared + distance, expected))
                position = declared + distance;
            else if (declared >= distance && declared - distance >= cursor
                     && matchesAt(source.lines, declared - distance, expected))
                position = declared - distance;
        }

        if (!position)
            return makeError(ErrorCode::ValidationError,
                             std::format("Hunk #{} (at line {}) does not apply", hunkIndex + 1, hunk.oldStart));

        output.insert(output.end(), source.lines.begin() + static_cast<std::ptrdiff_t>(cursor),
                      source.lines.begin() + static_cast<std::ptrdiff_t>(*position));
        for (auto const& line: hunk.lines)
        {
            if (line.op != '-')
                output.push_back(line.text);
        }
        cursor = *position + expected.size();
    }

    output.insert(output.end(), source.lines.begin() + static_cast<std::ptrdiff_t>(cursor), source.lines.end());

    auto text = std::string {};
    for (auto i = std::size_t { 0 }; i < output.size(); ++i)
    {
        if (i > 0)
            text += '\n';
        text += output[i];
    }
    if (!output.empty() && (source.trailingNewline || source.lines.empty()))
        text += '\n';
    return text;
}

} // namespace agentshell::diff
