// SPDX-License-Identifier: Apache-2.0
#include "Console.hpp"

namespace agentshell
{

Console::Console(std::ostream& out): _out(out)
{
}

void Console::write(std::string_view text)
{
    auto lock = std::lock_guard(_mutex);
    _out << text;
    _out.flush();
}

void Console::writeLines(std::string_view prefix, std::string_view text)
{
    auto block = std::string {};
    auto start = std::size_t { 0 };
    while (start < text.size())
    {
        auto end = text.find('\n', start);
        if (end == std::string_view::npos)
            end = text.size();
        block += prefix;
        block += text.substr(start, end - start);
        block += '\n';
        start = end + 1;
    }
    write(block);
}

} // namespace agentshell
