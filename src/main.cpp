#include "env.h"
#include <iostream>
#include <string_view>
#include <string>
#include "ics.h"
#include "json_export.h"
#include "log.h"

#define ICS_URI "ICS_URI"
#define ICS_LINE_BUFFER "ICS_LINE_BUFFER"

static int help(std::string_view name)
{
    std::cerr << "Usage : "
              << name
              << " (--env CONFIG_FILE) [--uri URI|--help]"
              << std::endl
              << "  Decodes an iCalendar document (standard input by default,"
                 " file://PATH or http(s)://URL) and prints it as JSON."
              << std::endl;
    return 1;
}

static int print_calendar(std::string_view uri)
{
    auto buffer_size = env::get_size(ICS_LINE_BUFFER, ics::line_reader::default_buffer_size);
    auto calendar = ics::fetch_from_uri(uri, buffer_size);
    DEBUG << "printing " << calendar.events.size() << " events" << std::endl;
    RAW << ics::dump(calendar) << std::endl;
    return 0;
}

int main(int argc, char **argv, char **envp)
{
    using namespace std::string_literals;
    env::read_envp(envp);

    auto tool_name = argc ? argv[0] : "ics-demo";
    if (argc)
    {
        argc--;
        argv++;
    }

    try
    {
        if (argc >= 2 && argv[0] == "--env"s)
        {
            env::read_envp(argv[1]);
            argc -= 2;
            argv += 2;
        }

        if (argc == 0)
            return print_calendar(env::get(ICS_URI, "-"));
        else if (argv[0] == "--uri"s && argc == 2)
            return print_calendar(argv[1]);
        else
            return help(tool_name);
    }
    catch (std::exception &e)
    {
        ERROR
            << e.what()
            << std::endl;
        return 1;
    }
}
