#include "env.h"
#include <charconv>
#include <map>
#include <string>
#include <fstream>
#include <stdexcept>

static std::map<std::string, std::string, std::less<>> global_env;

namespace env
{
    static void read_line(std::map<std::string, std::string, std::less<>> &out, std::string_view line)
    {
        if (line.starts_with('#'))
            return;
        if (line.ends_with('\r'))
            line.remove_suffix(1);
        auto col1_end = line.find('=');
        if (col1_end == line.npos)
            return;
        out[std::string{line.substr(0, col1_end)}] = line.substr(col1_end + 1);
    }

    void read_envp(char **envp)
    {
        while (*envp)
        {
            std::string line{*envp};
            envp++;
            read_line(global_env, line);
        }
    }

    void read_envp(std::string_view path)
    {
        for (const auto &[key, value] : read_file(path))
            global_env[key] = value;
    }

    void set(std::string_view key, std::string_view value)
    {
        global_env[std::string{key}] = value;
    }

    std::string_view get(std::string_view key, std::string_view def)
    {
        auto it = global_env.find(key);
        if (it == global_env.end())
            return def;
        else
            return it->second;
    }

    size_t get_size(std::string_view key, size_t def)
    {
        auto it = global_env.find(key);
        if (it == global_env.end() || it->second.empty())
            return def;

        const auto &value = it->second;
        size_t retval = 0;
        auto [end, ec] = std::from_chars(value.data(), value.data() + value.size(), retval);
        if (ec != std::errc{} || end != value.data() + value.size() || retval == 0)
            throw std::runtime_error("Setting " + std::string{key} +
                                     " expects a positive integer, got '" + value + "'");
        return retval;
    }

    std::map<std::string, std::string, std::less<>> read_file(std::string_view path)
    {
        std::map<std::string, std::string, std::less<>> retval;
        auto file = std::ifstream(std::string{path});
        if (!file)
            throw std::runtime_error("File " + std::string{path} + " was not found");
        std::string line;
        while (std::getline(file, line))
            read_line(retval, line);

        return retval;
    }
}
