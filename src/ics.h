#pragma once

#include <istream>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>
#include "line_reader.h"
#include "utils.h"
namespace ics
{
    struct vevent
    {
        std::string uid;
        std::optional<timepoint> start;
        std::optional<timepoint> end;
        std::string summary;
        std::string location;
        std::string description;
    };

    struct calendar
    {
        std::vector<vevent> events;
    };

    class decode_error : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    // Missing or mismatched BEGIN/END envelope, input ending inside a block
    class structural_error : public decode_error
    {
    public:
        using decode_error::decode_error;
    };

    // Blank, overlong or colon-less line
    class line_format_error : public decode_error
    {
    public:
        using decode_error::decode_error;
    };

    // DTSTART/DTEND not in YYYYMMDDThhmmssZ form
    class value_format_error : public decode_error
    {
    public:
        using decode_error::decode_error;
    };

    // Events without a start come first, the rest in chronological order.
    bool starts_before(const vevent &lhs, const vevent &rhs);

    timepoint parse_timestamp(std::string_view value);

    calendar decode(std::istream &input,
                    size_t line_buffer_size = line_reader::default_buffer_size);
    calendar decode(std::string_view text,
                    size_t line_buffer_size = line_reader::default_buffer_size);

    // "-" is standard input, "file://PATH" a local file, anything else is downloaded.
    calendar fetch_from_uri(std::string_view uri,
                            size_t line_buffer_size = line_reader::default_buffer_size);
}
