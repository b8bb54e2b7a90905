#include <date/date.h>
#include "json_export.h"

using json = nlohmann::json;

namespace ics
{
    static json optional_time(const std::optional<timepoint> &tp)
    {
        if (!tp)
            return nullptr;
        return to_iso(*tp);
    }

    std::string to_iso(timepoint tp)
    {
        return date::format("%FT%TZ", tp);
    }

    void to_json(json &j, const vevent &e)
    {
        j = json{
            {"UID", e.uid},
            {"Start", optional_time(e.start)},
            {"End", optional_time(e.end)},
            {"Summary", e.summary},
            {"Location", e.location},
            {"Description", e.description}};
    }

    void to_json(json &j, const calendar &c)
    {
        j = json::object();
        if (c.events.empty())
            j["Event"] = nullptr;
        else
            j["Event"] = c.events;
    }

    std::string dump(const calendar &c)
    {
        json j = c;
        return j.dump(1, '\t', false, json::error_handler_t::replace);
    }
}
