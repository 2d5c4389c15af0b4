/**
 * @file rotation_demo.cpp
 * @brief Demonstration of file rotation and load shedding
 * @author dorgby.net
 *
 * This demo showcases:
 * - Size-based rotation
 * - Calendar-based rotation settings
 * - Collision-safe names for rotations within the same second
 * - Discard queue under multi-threaded load
 */

#include <iostream>
#include <thread>
#include <chrono>
#include <vector>
#include <filesystem>
#include <algorithm>
#include <atomic>

#include "rotolog/log.hpp"

using namespace rotolog;
using namespace std::chrono_literals;
namespace fs = std::filesystem;

void print_header(const std::string &title)
{
    std::cout << "\n" << std::string(60, '=') << "\n";
    std::cout << " " << title << "\n";
    std::cout << std::string(60, '=') << "\n\n";
}

void print_stats(const file_sink &sink)
{
    auto stats = sink.get_stats();
    std::cout << "\nSink statistics:\n";
    std::cout << "  Written: " << stats.written << "\n";
    std::cout << "  Dropped: " << stats.dropped << "\n";
    std::cout << "  Rotations: " << stats.rotations << "\n";
    std::cout << "  Write errors: " << stats.write_errors << "\n" << std::flush;
}

void list_files(const std::string &base_path)
{
    fs::path base(base_path);
    fs::path dir = base.parent_path();
    if (dir.empty()) dir = ".";
    std::string name = base.filename().string();

    std::vector<std::pair<std::string, uintmax_t>> files;
    for (const auto &entry : fs::directory_iterator(dir))
    {
        auto filename = entry.path().filename().string();
        if (filename.rfind(name, 0) == 0) { files.emplace_back(filename, entry.file_size()); }
    }
    std::sort(files.begin(), files.end());

    std::cout << "\nFiles in " << dir.string() << ":\n";
    for (const auto &[filename, size] : files) { std::cout << "  " << filename << " (" << size << " bytes)\n"; }
}

void demo_size_rotation(const std::string &dir)
{
    print_header("Size-based rotation (4 KB)");

    sink_config cfg;
    cfg.file         = dir + "/size.log";
    cfg.rotate_bytes = 4 * 1024;

    file_sink sink(cfg);
    for (int i = 0; i < 200; ++i) { sink.info("size rotation message {} {}", i, std::string(32, '.')); }
    sink.close();

    print_stats(sink);
    list_files(cfg.file);
}

void demo_cycle_rotation(const std::string &dir)
{
    print_header("Calendar rotation (hourly) combined with size");

    sink_config cfg;
    cfg.file         = dir + "/hourly.log";
    cfg.rotate_cycle = rotate_cycle::hourly;
    cfg.rotate_bytes = 16 * 1024;

    file_sink sink(cfg);
    std::cout << "Rotates when the hour changes or after 16 KB, whichever comes first\n";
    for (int i = 0; i < 100; ++i) { sink.info("hourly message {}", i); }
    sink.close();

    print_stats(sink);
    list_files(cfg.file);
}

void demo_discard(const std::string &dir)
{
    print_header("Discard queue under load");

    sink_config cfg;
    cfg.file              = dir + "/discard.log";
    cfg.rotate_bytes      = 256 * 1024;
    cfg.discard_threshold = 256;
    cfg.buffer_period     = 100ms;

    auto sink = file_sink::create(cfg);
    std::atomic<uint64_t> attempted{0};

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t)
    {
        threads.emplace_back(
            [&sink, &attempted, t]()
            {
                for (int i = 0; i < 20000; ++i)
                {
                    sink->info("thread {} message {}", t, i);
                    attempted.fetch_add(1, std::memory_order_relaxed);
                }
            });
    }
    for (auto &th : threads) { th.join(); }
    sink->close();

    std::cout << "Attempted: " << attempted.load() << "\n";
    print_stats(*sink);
    list_files(cfg.file);
}

int main()
{
    std::string dir = "/tmp/rotolog_rotation_demo";
    fs::remove_all(dir);
    fs::create_directories(dir);

    try
    {
        demo_size_rotation(dir);
        demo_cycle_rotation(dir);
        demo_discard(dir);
    }
    catch (const std::exception &e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    std::cout << "\nDemo files left in " << dir << "\n";
    return 0;
}
