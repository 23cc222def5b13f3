// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <format>
#include <mutex>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>

namespace agentshell
{

/// @brief Serialized text output shared by all panes and the log sink.
///
/// Each write is emitted as a whole under one lock, so lines of concurrently rendering
/// panes never interleave mid-line.
class Console
{
  public:
    explicit Console(std::ostream& out);

    Console(const Console&) = delete;
    Console& operator=(const Console&) = delete;

    /// @brief Writes text as-is and flushes.
    void write(std::string_view text);

    /// @brief Writes each line of `text` with `prefix` prepended.
    void writeLines(std::string_view prefix, std::string_view text);

    template <typename... Args>
    void println(std::format_string<Args...> fmt, Args&&... args)
    {
        write(std::format(fmt, std::forward<Args>(args)...) + "\n");
    }

  private:
    std::mutex _mutex;
    std::ostream& _out;
};

} // namespace agentshell
