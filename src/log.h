#pragma once
#include <source_location>
#include <string>
#include <string_view>
#include <ostream>
#include <iostream>

#define TRACE_CALL() Log::TraceFunction TRACE##__COUNTER__
#define ERROR Log::log(Log::LEVEL_ERROR)
#define WARNING Log::log(Log::LEVEL_WARNING)
#define INFO Log::log(Log::LEVEL_INFO)
#define DEBUG Log::log(Log::LEVEL_DEBUG)
// Program output; log records go to std::cerr
#define RAW std::cout

namespace Log
{
    enum
    {
        LEVEL_ERROR = 0,
        LEVEL_WARNING,
        LEVEL_INFO,
        LEVEL_DEBUG
    };

    // "src/line_reader.cpp" -> "line_reader"
    std::string category(std::string_view file_name);
    // Reads LOGLEVEL_<category>, LEVEL_INFO when unset
    int level(std::string_view category);

    std::ostream log(int requested, const std::source_location loc = std::source_location::current());

    class TraceFunction
    {
    public:
        TraceFunction(const std::source_location location =
                          std::source_location::current())
            : function_name_(location.function_name()),
              location_(location)
        {
            Log::log(LEVEL_DEBUG, location_) << "Entering " << function_name_ << std::endl;
        }
        ~TraceFunction()
        {
            Log::log(LEVEL_DEBUG, location_) << "Leaving " << function_name_ << std::endl;
        }

    protected:
        std::string function_name_;
        std::source_location location_;
    };

}
