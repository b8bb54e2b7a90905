#pragma once
#include <cstddef>
#include <istream>
#include <string>
#include <vector>

namespace ics
{
    // Pulls unfolded KEY:VALUE lines out of an iCalendar stream.
    // A physical line starting with a space continues the previous one.
    class line_reader
    {
    public:
        static constexpr size_t default_buffer_size = 4096;

        struct line
        {
            std::string key;
            std::string value;
        };

        explicit line_reader(std::istream &input, size_t buffer_size = default_buffer_size);

        // Throws structural_error at end of input, line_format_error on
        // blank, overlong or colon-less lines.
        line next();

    protected:
        std::string read_physical_line();

        std::istream &input_;
        size_t buffer_size_;
        std::vector<char> buffer_;
    };
}
