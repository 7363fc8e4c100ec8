/**
 * @file simple.cpp
 * @brief Two loggers sharing the default file target
 * @author nexuslog contributors
 * @copyright Copyright (c) 2026 nexuslog contributors. Licensed under MIT License, see LICENSE for details.
 */
#include <cstring>
#include <iostream>
#include <string>

#include "nexuslog/log.hpp"

using namespace nexuslog;

void print_usage(const char *prog_name)
{
    std::cerr << "Usage: " << prog_name << " [options]\n"
              << "Options:\n"
              << "  -f <file>         Output file (default: tmp/app.log), '-' for stdout\n"
              << "  -n <count>        Iterations (default: 1000)\n"
              << "  -c                Calendar timestamps instead of unix epoch\n"
              << "  -h                Show this help\n";
}

int main(int argc, char *argv[])
{
    std::string output_file = "tmp/app.log";
    int iterations          = 1000;
    auto timestamps         = timestamp_mode::unix_epoch;

    for (int i = 1; i < argc; i++)
    {
        if (strcmp(argv[i], "-f") == 0 && i + 1 < argc) { output_file = argv[++i]; }
        else if (strcmp(argv[i], "-n") == 0 && i + 1 < argc) { iterations = std::stoi(argv[++i]); }
        else if (strcmp(argv[i], "-c") == 0) { timestamps = timestamp_mode::calendar; }
        else if (strcmp(argv[i], "-h") == 0)
        {
            print_usage(argv[0]);
            return 0;
        }
        else
        {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    if (output_file == "-") { basic_config(std::nullopt, timestamps); }
    else { basic_config(output_file, timestamps); }

    auto a = get_logger("A");
    auto b = get_logger("B", log_level::debug);

    for (int i = 0; i < iterations; ++i)
    {
        a.info("Message {} from A", i);
        b.debug("Message {} from B", i);
    }

    // b shares the sink, so only the last shutdown stops the worker
    a.shutdown();
    b.shutdown();
    return 0;
}
