// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace agentshell::diff
{

/// @brief One line of a hunk body: ' ' context, '-' removed, '+' added.
struct HunkLine
{
    char op = ' ';
    std::string text;
};

/// @brief One "@@ -a,b +c,d @@" section of a unified diff.
struct Hunk
{
    int oldStart = 0;
    int oldCount = 0;
    int newStart = 0;
    int newCount = 0;
    std::vector<HunkLine> lines;
};

/// @brief Parses the hunks of a single-file unified diff. File headers are ignored.
/// @return The hunks, or ValidationError for malformed input or a diff without hunks.
[[nodiscard]] auto parse(std::string_view diffText) -> Result<std::vector<Hunk>>;

/// @brief Applies hunks to `original`.
///
/// Each hunk is matched at its declared position first, then at the nearest position where
/// its context and removed lines match exactly. Either all hunks apply or none does.
/// @return The patched text, or ValidationError naming the first hunk that does not apply.
[[nodiscard]] auto apply(std::string_view original, std::span<const Hunk> hunks) -> Result<std::string>;

} // namespace agentshell::diff
