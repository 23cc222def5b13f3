// SPDX-License-Identifier: Apache-2.0
#include "Log.hpp"

#include <atomic>
#include <chrono>
#include <cstdio>
#include <mutex>
#include <print>
#include <string>

namespace agentshell::log
{

namespace
{
    auto globalLevel = std::atomic<Level> { Level::Info };

    // Guards the sinks below and serializes output lines.
    auto sinkMutex = std::mutex {};
    auto globalCallback = LogCallback {};
    auto globalFile = static_cast<std::FILE*>(nullptr);

    constexpr auto levelPrefix(Level level) -> std::string_view
    {
        switch (level)
        {
            case Level::Error: return "ERROR";
            case Level::Warning: return "WARN ";
            case Level::Info: return "INFO ";
            case Level::Debug: return "DEBUG";
            case Level::Trace: return "TRACE";
        }
        return "?????";
    }
} // namespace

void setCallback(LogCallback callback)
{
    auto lock = std::lock_guard(sinkMutex);
    globalCallback = std::move(callback);
}

auto setFile(std::string_view path) -> VoidResult
{
    auto lock = std::lock_guard(sinkMutex);

    if (globalFile)
    {
        std::fclose(globalFile);
        globalFile = nullptr;
    }

    if (path.empty())
        return {};

    globalFile = std::fopen(std::string(path).c_str(), "a");
    if (!globalFile)
        return makeError(ErrorCode::IoError, std::format("Cannot open log file: {}", path));
    return {};
}

void setLevel(Level level)
{
    globalLevel.store(level, std::memory_order_relaxed);
}

auto getLevel() -> Level
{
    return globalLevel.load(std::memory_order_relaxed);
}

auto levelFromString(std::string_view name) -> std::optional<Level>
{
    if (name == "error")
        return Level::Error;
    if (name == "warning" || name == "warn")
        return Level::Warning;
    if (name == "info")
        return Level::Info;
    if (name == "debug")
        return Level::Debug;
    if (name == "trace")
        return Level::Trace;
    return std::nullopt;
}

void write(Level level, std::string_view message)
{
    if (level > getLevel())
        return;

    auto lock = std::lock_guard(sinkMutex);

    if (globalCallback)
    {
        globalCallback(level, message);
        return;
    }

    if (globalFile)
    {
        auto const now = std::chrono::floor<std::chrono::milliseconds>(std::chrono::system_clock::now());
        std::println(globalFile, "{:%F %T} [{}] {}", now, levelPrefix(level), message);
        std::fflush(globalFile);
        return;
    }

    std::println(stderr, "[{}] {}", levelPrefix(level), message);
}

} // namespace agentshell::log
