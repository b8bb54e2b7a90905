#include <version>
#include <stdexcept>
#include <string_view>
#ifndef __cpp_lib_format
// std::format polyfill using fmtlib
#include <fmt/core.h>
namespace std
{
    using fmt::format;
}
#else
#include <format>
#endif
#include "line_reader.h"
#include "ics.h"

namespace ics
{
    line_reader::line_reader(std::istream &input, size_t buffer_size)
        : input_(input),
          buffer_size_(buffer_size),
          buffer_(buffer_size)
    {
    }

    std::string line_reader::read_physical_line()
    {
        // Reads at most buffer_size_ - 1 bytes before the '\n'
        input_.getline(buffer_.data(), static_cast<std::streamsize>(buffer_.size()));
        auto count = static_cast<size_t>(input_.gcount());
        if (input_.bad())
            throw std::runtime_error("I/O error while reading calendar");
        if (input_.fail())
        {
            if (count == 0 && input_.eof())
                throw structural_error("unexpected end of input");
            throw line_format_error(
                std::format("unexpected long line (limit is {} bytes)", buffer_size_));
        }

        // A line only counts as terminated when getline consumed a '\n'
        bool terminated = !input_.eof();
        std::string raw{buffer_.data(), terminated ? count - 1 : count};
        if (terminated && raw.ends_with('\r'))
            raw.pop_back();
        if (raw.empty())
            throw line_format_error("unexpected blank line");
        return raw;
    }

    line_reader::line line_reader::next()
    {
        std::string buffer;
        while (true)
        {
            auto raw = read_physical_line();
            std::string_view physical{raw};
            if (physical.starts_with(' '))
                physical.remove_prefix(1);
            buffer += physical;

            if (input_.peek() != ' ')
                break;
        }

        auto colon = buffer.find(':');
        if (colon == std::string::npos)
            throw line_format_error(
                std::format("bad line, couldn't find key:value in \"{}\"", buffer));
        return {buffer.substr(0, colon), buffer.substr(colon + 1)};
    }
}
