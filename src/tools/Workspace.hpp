// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

namespace agentshell
{

/// @brief The working root all file and process tools are confined to.
///
/// Paths are resolved relative to the root and normalized (symlinks of existing prefixes
/// included); anything that ends up outside the root is rejected with AccessDenied before
/// the filesystem is touched.
class Workspace
{
  public:
    /// @brief Creates a workspace rooted at `root`, which must be an existing directory.
    [[nodiscard]] static auto open(const std::filesystem::path& root) -> Result<Workspace>;

    [[nodiscard]] auto root() const -> const std::filesystem::path& { return _root; }

    /// @brief Resolves a user-supplied path against the root.
    /// @return The normalized absolute path, or AccessDenied if it escapes the root.
    [[nodiscard]] auto resolve(std::string_view path) const -> Result<std::filesystem::path>;

    /// @brief Returns the path relative to the root, for display.
    [[nodiscard]] auto relative(const std::filesystem::path& path) const -> std::string;

    /// @brief Reads a whole file.
    [[nodiscard]] auto readFile(const std::filesystem::path& path) const -> Result<std::string>;

    /// @brief Replaces a file's content atomically.
    ///
    /// The content is written to a temporary sibling and renamed over the target, so a
    /// concurrent reader sees either the old or the new content. Parent directories are created.
    [[nodiscard]] auto writeFileAtomic(const std::filesystem::path& path, std::string_view content) const
        -> VoidResult;

    /// @brief Serializes read-modify-write sequences on one file across concurrent tool calls.
    [[nodiscard]] auto lockFile(const std::filesystem::path& path) const -> std::unique_lock<std::mutex>;

  private:
    struct FileLocks
    {
        std::mutex mutex;
        std::map<std::filesystem::path, std::unique_ptr<std::mutex>> locks;
    };

    explicit Workspace(std::filesystem::path root);

    std::filesystem::path _root;
    std::shared_ptr<FileLocks> _fileLocks;

    [[nodiscard]] auto isWithinRoot(const std::filesystem::path& path) const -> bool;
};

} // namespace agentshell
