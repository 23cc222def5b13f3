// SPDX-License-Identifier: Apache-2.0
#include "FileTools.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <tools/UnifiedDiff.hpp>

#include <format>
#include <string>
#include <vector>

namespace agentshell
{

namespace
{
    auto splitLines(std::string_view text) -> std::vector<std::string_view>
    {
        auto lines = std::vector<std::string_view> {};
        auto start = std::size_t { 0 };
        while (start < text.size())
        {
            auto const end = text.find('\n', start);
            if (end == std::string_view::npos)
            {
                lines.push_back(text.substr(start));
                break;
            }
            lines.push_back(text.substr(start, end - start));
            start = end + 1;
        }
        return lines;
    }

    /// @brief Resolves the `path` argument, which every file tool requires.
    auto resolvePathArgument(const Workspace& workspace, const nlohmann::json& arguments)
        -> Result<std::filesystem::path>
    {
        return json::getString(arguments, "path").and_then(
            [&](const std::string& path) { return workspace.resolve(path); });
    }
} // namespace

ReadFileTool::ReadFileTool(std::shared_ptr<const Workspace> workspace, FileToolsConfig config):
    _workspace(std::move(workspace)), _config(config)
{
}

auto ReadFileTool::invoke(const nlohmann::json& arguments, std::stop_token /*stopToken*/) -> Result<ToolOutput>
{
    auto path = resolvePathArgument(*_workspace, arguments);
    if (!path)
        return std::unexpected(path.error());

    auto content = _workspace->readFile(*path);
    if (!content)
        return std::unexpected(content.error());

    auto const lines = splitLines(*content);
    auto const total = static_cast<int>(lines.size());

    auto const first = json::getIntOr(arguments, "start_line", 1);
    auto last = json::getIntOr(arguments, "end_line", -1);
    if (first < 1)
        return makeError(ErrorCode::ValidationError, std::format("start_line {} must be at least 1", first));
    if (last < -1)
        return makeError(ErrorCode::ValidationError, std::format("end_line {} must be -1 or a line number", last));

    if (total == 0)
        return ToolOutput {
            .text = std::format("{} (lines 0-0 of 0):\n", _workspace->relative(*path)),
            .failed = false,
            .failureDetail = {},
        };

    if (first > total)
        return makeError(ErrorCode::ValidationError,
                         std::format("start_line {} is outside the file's range [1, {}]", first, total));
    if (last == -1 || last > total)
        last = total;
    if (last < first)
        return makeError(ErrorCode::ValidationError,
                         std::format("end_line {} must be -1 or not less than start_line {}", last, first));

    auto text = std::format("{} (lines {}-{} of {}):\n", _workspace->relative(*path), first, last, total);
    auto truncated = false;
    for (auto lineNo = first; lineNo <= last; ++lineNo)
    {
        if (text.size() >= _config.maxReadBytes)
        {
            truncated = true;
            text += std::format("[truncated at line {}; request a line range to see more]\n", lineNo);
            break;
        }
        text += std::format("{:6}\t{}\n", lineNo, lines[static_cast<std::size_t>(lineNo - 1)]);
    }

    if (truncated)
        log::debug("read_file output of {} truncated", _workspace->relative(*path));

    return ToolOutput { .text = std::move(text), .failed = false, .failureDetail = {} };
}

WriteFileTool::WriteFileTool(std::shared_ptr<const Workspace> workspace): _workspace(std::move(workspace))
{
}

auto WriteFileTool::invoke(const nlohmann::json& arguments, std::stop_token /*stopToken*/) -> Result<ToolOutput>
{
    auto path = resolvePathArgument(*_workspace, arguments);
    if (!path)
        return std::unexpected(path.error());

    auto content = json::getString(arguments, "content");
    if (!content)
        return std::unexpected(content.error());

    auto lock = _workspace->lockFile(*path);
    if (auto written = _workspace->writeFileAtomic(*path, *content); !written)
        return std::unexpected(written.error());

    log::info("Wrote {} bytes to {}", content->size(), _workspace->relative(*path));
    return ToolOutput {
        .text = std::format("Wrote {} bytes to {}", content->size(), _workspace->relative(*path)),
        .failed = false,
        .failureDetail = {},
    };
}

PatchFileTool::PatchFileTool(std::shared_ptr<const Workspace> workspace): _workspace(std::move(workspace))
{
}

auto PatchFileTool::invoke(const nlohmann::json& arguments, std::stop_token /*stopToken*/) -> Result<ToolOutput>
{
    auto path = resolvePathArgument(*_workspace, arguments);
    if (!path)
        return std::unexpected(path.error());

    auto diffText = json::getString(arguments, "diff");
    if (!diffText)
        return std::unexpected(diffText.error());

    auto hunks = diff::parse(*diffText);
    if (!hunks)
        return std::unexpected(hunks.error());

    auto lock = _workspace->lockFile(*path);

    auto original = std::string {};
    auto ec = std::error_code {};
    if (std::filesystem::exists(*path, ec))
    {
        auto content = _workspace->readFile(*path);
        if (!content)
            return std::unexpected(content.error());
        original = std::move(*content);
    }

    auto patched = diff::apply(original, *hunks);
    if (!patched)
        return std::unexpected(patched.error());

    if (auto written = _workspace->writeFileAtomic(*path, *patched); !written)
        return std::unexpected(written.error());

    log::info("Applied {} hunk(s) to {}", hunks->size(), _workspace->relative(*path));
    return ToolOutput {
        .text = std::format("Applied {} hunk(s) to {}", hunks->size(), _workspace->relative(*path)),
        .failed = false,
        .failureDetail = {},
    };
}

ReplaceInFileTool::ReplaceInFileTool(std::shared_ptr<const Workspace> workspace): _workspace(std::move(workspace))
{
}

auto ReplaceInFileTool::invoke(const nlohmann::json& arguments, std::stop_token /*stopToken*/) -> Result<ToolOutput>
{
    auto path = resolvePathArgument(*_workspace, arguments);
    if (!path)
        return std::unexpected(path.error());

    auto oldText = json::getString(arguments, "old_text");
    if (!oldText)
        return std::unexpected(oldText.error());
    if (oldText->empty())
        return makeError(ErrorCode::ValidationError, "old_text must not be empty");
    auto const newText = json::getStringOr(arguments, "new_text", "");

    auto lock = _workspace->lockFile(*path);

    auto content = _workspace->readFile(*path);
    if (!content)
        return std::unexpected(content.error());

    auto occurrences = 0;
    auto pos = content->find(*oldText);
    while (pos != std::string::npos)
    {
        content->replace(pos, oldText->size(), newText);
        ++occurrences;
        pos = content->find(*oldText, pos + newText.size());
    }

    if (occurrences == 0)
        return makeError(ErrorCode::ValidationError,
                         std::format("old_text not found in {}; read the file again and match it exactly",
                                     _workspace->relative(*path)));

    if (auto written = _workspace->writeFileAtomic(*path, *content); !written)
        return std::unexpected(written.error());

    return ToolOutput {
        .text = std::format("Replaced {} occurrence(s) in {}", occurrences, _workspace->relative(*path)),
        .failed = false,
        .failureDetail = {},
    };
}

InsertInFileTool::InsertInFileTool(std::shared_ptr<const Workspace> workspace): _workspace(std::move(workspace))
{
}

auto InsertInFileTool::invoke(const nlohmann::json& arguments, std::stop_token /*stopToken*/) -> Result<ToolOutput>
{
    auto path = resolvePathArgument(*_workspace, arguments);
    if (!path)
        return std::unexpected(path.error());

    auto newText = json::getString(arguments, "new_text");
    if (!newText)
        return std::unexpected(newText.error());
    auto const insertLine = json::getIntOr(arguments, "insert_line", -1);

    auto lock = _workspace->lockFile(*path);

    auto content = _workspace->readFile(*path);
    if (!content)
        return std::unexpected(content.error());

    auto const total = static_cast<int>(splitLines(*content).size());
    if (insertLine < 0 || insertLine > total)
        return makeError(ErrorCode::ValidationError,
                         std::format("insert_line {} is outside the file's range [0, {}]", insertLine, total));

    auto offset = std::size_t { 0 };
    for (auto line = 0; line < insertLine; ++line)
    {
        auto const newline = content->find('\n', offset);
        offset = newline == std::string::npos ? content->size() : newline + 1;
    }

    auto block = *newText;
    if (block.empty() || block.back() != '\n')
        block += '\n';
    if (offset == content->size() && !content->empty() && content->back() != '\n')
        block.insert(0, 1, '\n');
    content->insert(offset, block);

    if (auto written = _workspace->writeFileAtomic(*path, *content); !written)
        return std::unexpected(written.error());

    log::info("Inserted {} bytes after line {} of {}", newText->size(), insertLine, _workspace->relative(*path));
    return ToolOutput {
        .text = std::format("Inserted text after line {} of {}", insertLine, _workspace->relative(*path)),
        .failed = false,
        .failureDetail = {},
    };
}

auto fileToolDefinitions(std::shared_ptr<const Workspace> workspace, FileToolsConfig config)
    -> std::vector<ToolDefinition>
{
    auto const pathParam = ToolParameter {
        .name = "path",
        .type = "string",
        .description = "File path, relative to the workspace root.",
        .required = true,
    };

    auto definitions = std::vector<ToolDefinition> {};

    definitions.push_back(ToolDefinition {
        .name = "read_file",
        .description = "Read a file and return its lines numbered like `cat -n`. "
                       "Optionally restrict to a 1-based line range; end_line -1 reads to the end.",
        .parameters = {
            pathParam,
            { .name = "start_line", .type = "integer", .description = "First line to show (1-based).", .required = false },
            { .name = "end_line", .type = "integer", .description = "Last line to show, -1 for end of file.", .required = false },
        },
        .handler = std::make_shared<ReadFileTool>(workspace, config),
        .owner = {},
        .allowAdditionalArguments = false,
    });

    definitions.push_back(ToolDefinition {
        .name = "write_file",
        .description = "Create a file or overwrite it with the given content. Parent directories are created.",
        .parameters = {
            pathParam,
            { .name = "content", .type = "string", .description = "The complete new file content.", .required = true },
        },
        .handler = std::make_shared<WriteFileTool>(workspace),
        .owner = {},
        .allowAdditionalArguments = false,
    });

    definitions.push_back(ToolDefinition {
        .name = "patch_file",
        .description = "Apply a unified diff (one file, @@ hunks) to a file. Fails without changes if any hunk "
                       "does not match.",
        .parameters = {
            pathParam,
            { .name = "diff", .type = "string", .description = "Unified diff text.", .required = true },
        },
        .handler = std::make_shared<PatchFileTool>(workspace),
        .owner = {},
        .allowAdditionalArguments = false,
    });

    definitions.push_back(ToolDefinition {
        .name = "replace_in_file",
        .description = "Replace every exact occurrence of old_text with new_text in a file. "
                       "Use an empty new_text to delete text.",
        .parameters = {
            pathParam,
            { .name = "old_text", .type = "string", .description = "Text to replace, matched exactly.", .required = true },
            { .name = "new_text", .type = "string", .description = "Replacement text.", .required = false },
        },
        .handler = std::make_shared<ReplaceInFileTool>(workspace),
        .owner = {},
        .allowAdditionalArguments = false,
    });

    definitions.push_back(ToolDefinition {
        .name = "insert_in_file",
        .description = "Insert text after the given line of a file; insert_line 0 inserts at the beginning.",
        .parameters = {
            pathParam,
            { .name = "insert_line", .type = "integer", .description = "Line after which to insert (0-based count).", .required = true },
            { .name = "new_text", .type = "string", .description = "Text to insert.", .required = true },
        },
        .handler = std::make_shared<InsertInFileTool>(std::move(workspace)),
        .owner = {},
        .allowAdditionalArguments = false,
    });

    return definitions;
}

} // namespace agentshell
