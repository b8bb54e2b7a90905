#include "log.h"
#include "env.h"
#include <iostream>
#include <stdexcept>

namespace Log
{
    static std::string get_label(int requested)
    {
        switch (requested)
        {
        case LEVEL_ERROR:
            return "ERROR";
        case LEVEL_WARNING:
            return "WARNING";
        case LEVEL_INFO:
            return "INFO";
        case LEVEL_DEBUG:
            return "DEBUG";
        default:
            return std::to_string(requested);
        }
    }

    std::string category(std::string_view file_name)
    {
        auto start = file_name.find_last_of("/\\");
        if (start == std::string_view::npos)
            start = 0;
        else
            start++;
        auto end = file_name.find('.', start);
        return std::string{file_name.substr(start, end - start)};
    }

    int level(std::string_view category)
    {
        auto key = "LOGLEVEL_" + std::string{category};
        std::string current_str{env::get(key, std::to_string(LEVEL_INFO))};
        try
        {
            return std::stoi(current_str);
        }
        catch (const std::logic_error &)
        {
            std::cerr << "WARNING[log]:" << key << " expects a level number, got '"
                      << current_str << "', using " << get_label(LEVEL_INFO) << std::endl;
            return LEVEL_INFO;
        }
    }

    std::ostream log(int requested, const std::source_location loc)
    {
        auto cat = category(loc.file_name());
        auto *retval = level(cat) >= requested ? std::cerr.rdbuf() : nullptr;
        std::ostream stream{retval};
        stream << get_label(requested) << "[" << cat << "]:";
        return std::ostream{retval};
    }
}
