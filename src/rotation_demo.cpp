/**
 * @file rotation_demo.cpp
 * @brief Several threads logging to one daily-rotated file
 * @author nexuslog contributors
 * @copyright Copyright (c) 2026 nexuslog contributors. Licensed under MIT License, see LICENSE for details.
 */
#include <atomic>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <thread>
#include <vector>

#include "nexuslog/log.hpp"

using namespace nexuslog;
using namespace std::chrono_literals;
namespace fs = std::filesystem;

int main(int argc, char *argv[])
{
    std::string base_path = argc > 1 ? argv[1] : "/tmp/nexuslog_demo/app.log";
    int thread_count      = argc > 2 ? std::stoi(argv[2]) : 4;
    auto duration         = 3s;

    logger log({.name = "demo", .path = base_path, .level = log_level::debug});
    std::atomic<bool> stop{false};
    std::atomic<uint64_t> total{0};

    std::vector<std::thread> workers;
    for (int t = 0; t < thread_count; ++t)
    {
        workers.emplace_back(
            [&, t]
            {
                uint64_t n = 0;
                while (!stop.load(std::memory_order_relaxed))
                {
                    log.debug("thread {} message {}", t, n++);
                    if (n % 10000 == 0) std::this_thread::sleep_for(1ms);
                }
                total.fetch_add(n);
            });
    }

    std::this_thread::sleep_for(duration);
    stop = true;
    for (auto &w : workers) w.join();

    log.info("done after {} messages", total.load());
    log.shutdown();

    // Rotated files live next to the base path with the date between stem and extension
    fs::path dir = fs::path(base_path).parent_path();
    if (dir.empty()) dir = ".";
    std::cout << "Wrote " << total.load() << " messages; files in " << dir << ":\n";
    for (const auto &entry : fs::directory_iterator(dir))
    {
        if (entry.is_regular_file()) { std::cout << "  " << entry.path().filename().string() << " (" << entry.file_size() << " bytes)\n"; }
    }
    return 0;
}
