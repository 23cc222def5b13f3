// SPDX-License-Identifier: Apache-2.0
#include "SearchTools.hpp"

#include <core/JsonUtils.hpp>

#include <algorithm>
#include <cctype>
#include <format>
#include <fstream>

#include <fnmatch.h>

namespace agentshell
{

namespace
{
    /// @brief Stop reporting matches after this many lines.
    constexpr auto MaxGrepMatches = std::size_t { 500 };

    struct Entry
    {
        std::filesystem::path path;
        std::string name;
        bool isDirectory = false;
    };

    auto matchesAny(std::string_view name, const std::vector<std::string>& patterns) -> bool
    {
        auto const nameStr = std::string(name);
        return std::ranges::any_of(patterns, [&](const std::string& pattern) {
            // "docs/" style patterns name directories; compare without the slash.
            auto glob = pattern;
            if (!glob.empty() && glob.back() == '/')
                glob.pop_back();
            return ::fnmatch(glob.c_str(), nameStr.c_str(), 0) == 0;
        });
    }

    /// @brief Lists a directory, filtered and sorted with directories first, then by lowercase name.
    auto listEntries(const std::filesystem::path& directory,
                     const std::vector<std::string>& match,
                     const std::vector<std::string>& ignore) -> Result<std::vector<Entry>>
    {
        auto entries = std::vector<Entry> {};
        auto ec = std::error_code {};
        auto it = std::filesystem::directory_iterator(directory, ec);
        if (ec)
            return makeError(ErrorCode::AccessDenied,
                             std::format("Cannot list {}: {}", directory.filename().string(), ec.message()));

        for (const auto& dirEntry: it)
        {
            auto name = dirEntry.path().filename().string();
            if (matchesAny(name, ignore) || matchesAny(name, defaultIgnorePatterns()))
                continue;

            auto entryEc = std::error_code {};
            auto const isDirectory = dirEntry.is_directory(entryEc);
            if (!match.empty() && !matchesAny(name, match))
                continue;

            entries.push_back(Entry { .path = dirEntry.path(), .name = std::move(name), .isDirectory = isDirectory });
        }

        auto const lowered = [](std::string s) {
            std::ranges::transform(s, s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return s;
        };
        std::ranges::sort(entries, [&](const Entry& a, const Entry& b) {
            if (a.isDirectory != b.isDirectory)
                return a.isDirectory;
            return lowered(a.name) < lowered(b.name);
        });
        return entries;
    }

    auto resolveDirectory(const Workspace& workspace, std::string_view path) -> Result<std::filesystem::path>
    {
        auto resolved = workspace.resolve(path);
        if (!resolved)
            return resolved;

        auto ec = std::error_code {};
        if (!std::filesystem::exists(*resolved, ec))
            return makeError(ErrorCode::NotFound, std::format("{} does not exist", path));
        if (!std::filesystem::is_directory(*resolved, ec))
            return makeError(ErrorCode::ValidationError, std::format("{} is not a directory", path));
        return resolved;
    }

    void renderTree(const std::filesystem::path& directory,
                    const std::string& prefix,
                    int depth,
                    int maxDepth,
                    const std::vector<std::string>& match,
                    const std::vector<std::string>& ignore,
                    std::string& out,
                    const std::stop_token& stopToken)
    {
        if ((maxDepth > 0 && depth > maxDepth) || stopToken.stop_requested())
            return;

        auto entries = listEntries(directory, {}, ignore);
        if (!entries)
        {
            out += prefix + "└── [permission denied]\n";
            return;
        }

        // Directories are kept regardless of `match` so matching files below them stay reachable.
        std::erase_if(*entries, [&](const Entry& e) { return !e.isDirectory && !match.empty() && !matchesAny(e.name, match); });

        for (auto i = std::size_t { 0 }; i < entries->size(); ++i)
        {
            auto const& entry = (*entries)[i];
            auto const last = i + 1 == entries->size();
            out += std::format("{}{} {}{}\n", prefix, last ? "└──" : "├──", entry.name, entry.isDirectory ? "/" : "");
            if (entry.isDirectory)
                renderTree(entry.path, prefix + (last ? "    " : "│   "), depth + 1, maxDepth, match, ignore, out, stopToken);
        }
    }
} // namespace

auto defaultIgnorePatterns() -> const std::vector<std::string>&
{
    static auto const patterns = std::vector<std::string> {
        ".git", ".svn", ".hg", "node_modules", "__pycache__", ".venv", ".idea", ".vscode", "*.pyc", "*.o", ".DS_Store",
    };
    return patterns;
}

ListDirectoryTool::ListDirectoryTool(std::shared_ptr<const Workspace> workspace): _workspace(std::move(workspace))
{
}

auto ListDirectoryTool::invoke(const nlohmann::json& arguments, std::stop_token /*stopToken*/) -> Result<ToolOutput>
{
    auto const requested = json::getStringOr(arguments, "path", ".");
    auto directory = resolveDirectory(*_workspace, requested);
    if (!directory)
        return std::unexpected(directory.error());

    auto entries =
        listEntries(*directory, json::getStringArray(arguments, "match"), json::getStringArray(arguments, "ignore"));
    if (!entries)
        return std::unexpected(entries.error());

    if (entries->empty())
        return ToolOutput { .text = std::format("No items found in {}.", requested), .failed = false, .failureDetail = {} };

    auto text = std::format("Contents of {}:\n", _workspace->relative(*directory));
    for (const auto& entry: *entries)
        text += std::format("{}{}\n", entry.name, entry.isDirectory ? "/" : "");
    return ToolOutput { .text = std::move(text), .failed = false, .failureDetail = {} };
}

DirectoryTreeTool::DirectoryTreeTool(std::shared_ptr<const Workspace> workspace): _workspace(std::move(workspace))
{
}

auto DirectoryTreeTool::invoke(const nlohmann::json& arguments, std::stop_token stopToken) -> Result<ToolOutput>
{
    auto directory = resolveDirectory(*_workspace, json::getStringOr(arguments, "root", "."));
    if (!directory)
        return std::unexpected(directory.error());

    auto const maxDepth = json::getIntOr(arguments, "max_depth", 0);
    auto const rootName = *directory == _workspace->root() ? std::string(".") : directory->filename().string();

    auto text = std::format("{}/\n", rootName);
    renderTree(*directory, "", 1, maxDepth, json::getStringArray(arguments, "match"),
               json::getStringArray(arguments, "ignore"), text, stopToken);

    if (stopToken.stop_requested())
        return makeError(ErrorCode::Cancelled, "directory_tree cancelled");
    return ToolOutput { .text = std::move(text), .failed = false, .failureDetail = {} };
}

GrepTool::GrepTool(std::shared_ptr<const Workspace> workspace): _workspace(std::move(workspace))
{
}

auto GrepTool::invoke(const nlohmann::json& arguments, std::stop_token stopToken) -> Result<ToolOutput>
{
    auto pattern = json::getString(arguments, "pattern");
    if (!pattern)
        return std::unexpected(pattern.error());
    if (pattern->empty())
        return makeError(ErrorCode::ValidationError, "pattern must not be empty");

    auto const caseSensitive = json::getBoolOr(arguments, "case_sensitive", true);
    auto const recursive = json::getBoolOr(arguments, "recursive", false);
    auto const invert = json::getBoolOr(arguments, "invert", false);

    auto paths = json::getStringArray(arguments, "paths");
    if (paths.empty())
        paths.emplace_back(".");

    auto const fold = [caseSensitive](std::string s) {
        if (!caseSensitive)
            std::ranges::transform(s, s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return s;
    };
    auto const needle = fold(*pattern);

    // Collect files
    auto files = std::vector<std::filesystem::path> {};
    for (const auto& requested: paths)
    {
        auto path = _workspace->resolve(requested);
        if (!path)
            return std::unexpected(path.error());

        auto ec = std::error_code {};
        if (!std::filesystem::exists(*path, ec))
            return makeError(ErrorCode::NotFound, std::format("{} does not exist", requested));

        if (std::filesystem::is_regular_file(*path, ec))
        {
            files.push_back(*path);
            continue;
        }

        if (recursive)
        {
            auto it = std::filesystem::recursive_directory_iterator(
                *path, std::filesystem::directory_options::skip_permission_denied, ec);
            for (; !ec && it != std::filesystem::recursive_directory_iterator(); it.increment(ec))
            {
                if (matchesAny(it->path().filename().string(), defaultIgnorePatterns()))
                {
                    if (it->is_directory(ec))
                        it.disable_recursion_pending();
                    continue;
                }
                if (it->is_regular_file(ec))
                    files.push_back(it->path());
            }
        }
        else
        {
            auto entries = listEntries(*path, {}, {});
            if (!entries)
                return std::unexpected(entries.error());
            for (const auto& entry: *entries)
            {
                if (!entry.isDirectory)
                    files.push_back(entry.path);
            }
        }
    }

    // Search
    auto matches = std::vector<std::string> {};
    for (const auto& file: files)
    {
        if (stopToken.stop_requested())
            return makeError(ErrorCode::Cancelled, "grep cancelled");

        auto input = std::ifstream(file);
        if (!input.is_open())
            continue;

        auto line = std::string {};
        auto lineNo = 0;
        while (std::getline(input, line) && matches.size() < MaxGrepMatches)
        {
            ++lineNo;
            auto const found = fold(line).find(needle) != std::string::npos;
            if (found != invert)
                matches.push_back(std::format("{}:{}: {}", _workspace->relative(file), lineNo, line));
        }
    }

    if (matches.empty())
        return ToolOutput { .text = std::format("No matches found for '{}'.", *pattern), .failed = false, .failureDetail = {} };

    auto text = std::format("Matches for '{}' ({}{} total):\n", *pattern, matches.size(),
                            matches.size() >= MaxGrepMatches ? "+" : "");
    for (const auto& match: matches)
        text += match + "\n";
    return ToolOutput { .text = std::move(text), .failed = false, .failureDetail = {} };
}

auto searchToolDefinitions(std::shared_ptr<const Workspace> workspace) -> std::vector<ToolDefinition>
{
    auto definitions = std::vector<ToolDefinition> {};

    definitions.push_back(ToolDefinition {
        .name = "list_directory",
        .description = "List files and directories in a directory (directories first). "
                       "Optionally filter names with glob patterns.",
        .parameters = {
            { .name = "path", .type = "string", .description = "Directory, relative to the workspace root.", .required = true },
            { .name = "match", .type = "array", .description = "Glob patterns to include, e.g. [\"*.cpp\"].", .required = false },
            { .name = "ignore", .type = "array", .description = "Glob patterns to exclude.", .required = false },
        },
        .handler = std::make_shared<ListDirectoryTool>(workspace),
        .owner = {},
        .allowAdditionalArguments = false,
    });

    definitions.push_back(ToolDefinition {
        .name = "directory_tree",
        .description = "Show the directory structure below a directory as a tree.",
        .parameters = {
            { .name = "root", .type = "string", .description = "Directory, relative to the workspace root.", .required = true },
            { .name = "max_depth", .type = "integer", .description = "Maximum depth, 0 for unlimited.", .required = false },
            { .name = "match", .type = "array", .description = "Glob patterns of files to include.", .required = false },
            { .name = "ignore", .type = "array", .description = "Glob patterns to exclude.", .required = false },
        },
        .handler = std::make_shared<DirectoryTreeTool>(workspace),
        .owner = {},
        .allowAdditionalArguments = false,
    });

    definitions.push_back(ToolDefinition {
        .name = "grep",
        .description = "Search files for a plain text pattern and return matching lines as path:line: text.",
        .parameters = {
            { .name = "pattern", .type = "string", .description = "Text to search for (not a regex).", .required = true },
            { .name = "paths", .type = "array", .description = "Files or directories to search.", .required = false },
            { .name = "case_sensitive", .type = "boolean", .description = "Default true.", .required = false },
            { .name = "recursive", .type = "boolean", .description = "Descend into subdirectories.", .required = false },
            { .name = "invert", .type = "boolean", .description = "Return lines that do not match.", .required = false },
        },
        .handler = std::make_shared<GrepTool>(std::move(workspace)),
        .owner = {},
        .allowAdditionalArguments = false,
    });

    return definitions;
}

} // namespace agentshell
