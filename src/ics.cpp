#include <algorithm>
#include <iostream>
#include <map>
#include <sstream>
#include <version>
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
#include <date/date.h>
#include "ics.h"
#include "line_reader.h"
#include "utils.h"
#include "log.h"

namespace ics
{
    enum class state
    {
        start,
        in_calendar,
        done
    };

    enum class property
    {
        other,
        begin,
        end,
        uid,
        dtstart,
        dtend,
        summary,
        location,
        description
    };

    static property classify(std::string_view key)
    {
        static const std::map<std::string_view, property, std::less<>> properties{
            {"BEGIN", property::begin},
            {"END", property::end},
            {"UID", property::uid},
            {"DTSTART", property::dtstart},
            {"DTEND", property::dtend},
            {"SUMMARY", property::summary},
            {"LOCATION", property::location},
            {"DESCRIPTION", property::description}};

        auto it = properties.find(key);
        return it == properties.end() ? property::other : it->second;
    }

    timepoint parse_timestamp(std::string_view value)
    {
        const std::string layout{"%Y%m%dT%H%M%SZ"};

        timepoint tp{};
        std::istringstream sstr{std::string{value}};
        sstr >> date::parse(layout, tp);
        // date::parse accepts single digit fields, the layout does not
        if (sstr.fail() || date::format(layout, tp) != value)
            throw value_format_error(
                std::format("bad timestamp \"{}\", expected YYYYMMDDThhmmssZ", value));
        return tp;
    }

    bool starts_before(const vevent &lhs, const vevent &rhs)
    {
        if (!rhs.start)
            return false;
        if (!lhs.start)
            return true;
        return *lhs.start < *rhs.start;
    }

    static vevent decode_event(line_reader &reader)
    {
        vevent retval;
        while (true)
        {
            auto [key, value] = reader.next();
            switch (classify(key))
            {
            case property::end:
                if (value != "VEVENT")
                    throw structural_error(
                        std::format("unexpected END value \"{}\" inside VEVENT", value));
                return retval;
            case property::uid:
                retval.uid = std::move(value);
                break;
            case property::dtstart:
                retval.start = parse_timestamp(value);
                break;
            case property::dtend:
                retval.end = parse_timestamp(value);
                break;
            case property::summary:
                retval.summary = std::move(value);
                break;
            case property::location:
                retval.location = std::move(value);
                break;
            case property::description:
                retval.description = std::move(value);
                break;
            case property::begin:
            case property::other:
                break;
            }
        }
    }

    calendar decode(std::istream &input, size_t line_buffer_size)
    {
        TRACE_CALL();
        line_reader reader{input, line_buffer_size};
        calendar retval;
        auto current = state::start;

        while (current != state::done)
        {
            auto [key, value] = reader.next();
            auto prop = classify(key);
            switch (current)
            {
            case state::start:
                if (prop == property::begin && value == "VCALENDAR")
                    current = state::in_calendar;
                else if (prop == property::begin ||
                         (prop == property::end && value == "VCALENDAR"))
                    throw structural_error(
                        std::format("didn't find BEGIN:VCALENDAR, got {}:{}", key, value));
                break;
            case state::in_calendar:
                if (prop == property::begin && value == "VEVENT")
                    retval.events.emplace_back(decode_event(reader));
                else if (prop == property::end && value == "VCALENDAR")
                    current = state::done;
                break;
            case state::done:
                break;
            }
        }

        std::stable_sort(retval.events.begin(), retval.events.end(), starts_before);
        DEBUG << "decoded " << retval.events.size() << " events" << std::endl;
        return retval;
    }

    calendar decode(std::string_view text, size_t line_buffer_size)
    {
        std::istringstream sstr{std::string{text}};
        return decode(sstr, line_buffer_size);
    }

    calendar fetch_from_uri(std::string_view uri, size_t line_buffer_size)
    {
        DEBUG << "reading calendar from " << uri << std::endl;
        if (uri == "-")
            return decode(std::cin, line_buffer_size);

        auto text = uri.starts_with("file://")
                        ? cat(std::string{uri.substr(7)})
                        : download(uri);
        return decode(text, line_buffer_size);
    }
}
