// SPDX-License-Identifier: Apache-2.0
#include "Workspace.hpp"

#include <atomic>
#include <format>
#include <fstream>
#include <sstream>

#include <unistd.h>

namespace agentshell
{

namespace
{
    auto tempCounter = std::atomic<unsigned> { 0 };
} // namespace

Workspace::Workspace(std::filesystem::path root):
    _root(std::move(root)), _fileLocks(std::make_shared<FileLocks>())
{
}

auto Workspace::open(const std::filesystem::path& root) -> Result<Workspace>
{
    auto ec = std::error_code {};
    if (!std::filesystem::is_directory(root, ec) || ec)
        return makeError(ErrorCode::ConfigError, std::format("Workspace root is not a directory: {}", root.string()));

    auto canonical = std::filesystem::canonical(root, ec);
    if (ec)
        return makeError(ErrorCode::ConfigError,
                         std::format("Cannot resolve workspace root '{}': {}", root.string(), ec.message()));

    return Workspace(std::move(canonical));
}

auto Workspace::resolve(std::string_view path) const -> Result<std::filesystem::path>
{
    if (path.empty())
        return makeError(ErrorCode::ValidationError, "Path must not be empty");

    auto candidate = std::filesystem::path(path);
    if (candidate.is_relative())
        candidate = _root / candidate;

    auto ec = std::error_code {};
    auto resolved = std::filesystem::weakly_canonical(candidate, ec);
    if (ec)
        return makeError(ErrorCode::AccessDenied, std::format("Cannot resolve path '{}': {}", path, ec.message()));

    if (!isWithinRoot(resolved))
        return makeError(ErrorCode::AccessDenied,
                         std::format("Path '{}' is outside the working root {}", path, _root.string()));

    return resolved;
}

auto Workspace::relative(const std::filesystem::path& path) const -> std::string
{
    auto rel = path.lexically_relative(_root);
    if (rel.empty() || rel == ".")
        return ".";
    return rel.string();
}

auto Workspace::readFile(const std::filesystem::path& path) const -> Result<std::string>
{
    auto ec = std::error_code {};
    if (!std::filesystem::exists(path, ec))
        return makeError(ErrorCode::NotFound, std::format("File does not exist: {}", relative(path)));
    if (!std::filesystem::is_regular_file(path, ec))
        return makeError(ErrorCode::ValidationError, std::format("Path is not a file: {}", relative(path)));

    auto file = std::ifstream(path, std::ios::binary);
    if (!file.is_open())
        return makeError(ErrorCode::IoError, std::format("Cannot open file: {}", relative(path)));

    auto ss = std::stringstream {};
    ss << file.rdbuf();
    return ss.str();
}

auto Workspace::writeFileAtomic(const std::filesystem::path& path, std::string_view content) const -> VoidResult
{
    auto ec = std::error_code {};
    if (std::filesystem::is_directory(path, ec))
        return makeError(ErrorCode::ValidationError, std::format("Path is a directory: {}", relative(path)));

    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec)
        return makeError(ErrorCode::IoError,
                         std::format("Cannot create directory '{}': {}", relative(path.parent_path()), ec.message()));

    auto tempPath = path;
    tempPath += std::format(".agentshell-{}-{}.tmp", ::getpid(), tempCounter.fetch_add(1));

    {
        auto file = std::ofstream(tempPath, std::ios::binary | std::ios::trunc);
        if (!file.is_open())
            return makeError(ErrorCode::IoError, std::format("Cannot write file: {}", relative(path)));
        file.write(content.data(), static_cast<std::streamsize>(content.size()));
        file.flush();
        if (!file)
        {
            file.close();
            std::filesystem::remove(tempPath, ec);
            return makeError(ErrorCode::IoError, std::format("Failed writing file: {}", relative(path)));
        }
    }

    std::filesystem::rename(tempPath, path, ec);
    if (ec)
    {
        auto const message = ec.message();
        std::filesystem::remove(tempPath, ec);
        return makeError(ErrorCode::IoError, std::format("Cannot replace '{}': {}", relative(path), message));
    }

    return {};
}

auto Workspace::lockFile(const std::filesystem::path& path) const -> std::unique_lock<std::mutex>
{
    auto* mutex = static_cast<std::mutex*>(nullptr);
    {
        auto lock = std::lock_guard(_fileLocks->mutex);
        auto& entry = _fileLocks->locks[path];
        if (!entry)
            entry = std::make_unique<std::mutex>();
        mutex = entry.get();
    }
    return std::unique_lock(*mutex);
}

auto Workspace::isWithinRoot(const std::filesystem::path& path) const -> bool
{
    auto rootIt = _root.begin();
    auto pathIt = path.begin();
    for (; rootIt != _root.end() && pathIt != path.end(); ++rootIt, ++pathIt)
    {
        if (*rootIt != *pathIt)
            return false;
    }
    return rootIt == _root.end();
}

} // namespace agentshell
