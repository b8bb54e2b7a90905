#pragma once
#include <string>
#include <nlohmann/json.hpp>
#include "ics.h"

namespace ics
{
    void to_json(nlohmann::json &j, const vevent &e);
    void to_json(nlohmann::json &j, const calendar &c);

    // ISO 8601 UTC, "2011-06-01T10:00:00Z"
    std::string to_iso(timepoint tp);

    // Tab indented document, as printed by ics-demo
    std::string dump(const calendar &c);
}
