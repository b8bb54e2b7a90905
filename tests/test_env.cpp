#include <cstdio>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include "env.h"
#include "log.h"

int main(int, char **, char **envp) {
    std::cout << "=== Configuration Test ===" << std::endl;
    env::read_envp(envp);

    const std::string path = "test_env.cfg";
    {
        std::ofstream cfg{path};
        cfg << "# calendar source\n"
            << "ICS_URI=file:///tmp/calendar.ics\r\n"
            << "ICS_LINE_BUFFER=8192\n"
            << "not a setting\n"
            << "LOGLEVEL_test_env=3\n";
    }

    // Test 1: file overlay
    std::cout << "\n[Test 1] Read config file..." << std::endl;
    env::read_envp(path);
    if (env::get("ICS_URI") == "file:///tmp/calendar.ics" &&
        env::get("MISSING_KEY", "fallback") == "fallback") {
        std::cout << "  ✓ Values loaded, comments skipped" << std::endl;
    } else {
        std::cout << "  ✗ Got '" << env::get("ICS_URI") << "'" << std::endl;
        return 1;
    }

    // Test 2: integer settings
    std::cout << "\n[Test 2] Integer settings..." << std::endl;
    {
        bool rejected = false;
        env::set("ICS_LINE_BUFFER_BAD", "4k");
        try {
            env::get_size("ICS_LINE_BUFFER_BAD", 1);
        } catch (const std::runtime_error &e) {
            std::cout << "  got: " << e.what() << std::endl;
            rejected = true;
        }
        if (env::get_size("ICS_LINE_BUFFER", 4096) == 8192 &&
            env::get_size("ICS_LINE_BUFFER_UNSET", 4096) == 4096 &&
            rejected) {
            std::cout << "  ✓ Parsed, defaulted and rejected as expected" << std::endl;
        } else {
            std::cout << "  ✗ Integer setting handling failed" << std::endl;
            return 1;
        }
    }

    // Test 3: log levels by category
    std::cout << "\n[Test 3] Log levels..." << std::endl;
    if (Log::category("/src/dir.with.dots/line_reader.cpp") == "line_reader" &&
        Log::level("test_env") == Log::LEVEL_DEBUG &&
        Log::level("unconfigured") == Log::LEVEL_INFO) {
        DEBUG << "debug records are enabled for this file" << std::endl;
        std::cout << "  ✓ Category and level resolved" << std::endl;
    } else {
        std::cout << "  ✗ Log configuration not applied" << std::endl;
        return 1;
    }

    // Test 4: a malformed level falls back to INFO instead of throwing
    std::cout << "\n[Test 4] Malformed log level..." << std::endl;
    env::set("LOGLEVEL_test_env", "verbose");
    try {
        ERROR << "still logged with a malformed level" << std::endl;
        if (Log::level("test_env") != Log::LEVEL_INFO) {
            std::cout << "  ✗ Unexpected level" << std::endl;
            return 1;
        }
        std::cout << "  ✓ Fell back to INFO" << std::endl;
    } catch (const std::exception &e) {
        std::cout << "  ✗ Logging threw: " << e.what() << std::endl;
        return 1;
    }

    // Test 5: missing file
    std::cout << "\n[Test 5] Missing config file..." << std::endl;
    std::remove(path.c_str());
    try {
        env::read_envp(path);
        std::cout << "  ✗ Missing file accepted" << std::endl;
        return 1;
    } catch (const std::runtime_error &e) {
        std::cout << "  ✓ " << e.what() << std::endl;
    }

    std::cout << "\n=== All configuration tests passed ===" << std::endl;
    return 0;
}
