#include <iostream>
#include <cstring>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include "rotolog/log.hpp"

using namespace rotolog;
using namespace std::chrono_literals;

void print_usage(const char *prog_name)
{
    std::cerr << "Usage: " << prog_name << " [options]\n"
              << "Options:\n"
              << "  -f <file>         Output file, stdout or stderr (default: /tmp/log.txt)\n"
              << "  -c <config>       Read the sink configuration from a JSON file, -f/-l/-q override it\n"
              << "  -l <level>        Minimum level: debug, info, warn, error, fatal, off\n"
              << "  -n <count>        Messages per thread (default: 100000)\n"
              << "  -t <threads>      Producer threads (default: 4)\n"
              << "  -q <threshold>    Discard queue capacity, 0 writes synchronously (default: 0)\n"
              << "  -h                Show this help\n";
}

int main(int argc, char *argv[])
{
    // Default parameters
    sink_config config;
    config.file  = "/tmp/log.txt";
    int messages = 100000;
    int threads  = 4;
    std::string config_file;

    // Command line values win over the configuration file
    std::optional<std::string> file;
    std::optional<log_level> level;
    std::optional<int> discard_threshold;

    // Parse command line arguments
    try
    {
        for (int i = 1; i < argc; i++)
        {
            if (strcmp(argv[i], "-f") == 0 && i + 1 < argc) { file = argv[++i]; }
            else if (strcmp(argv[i], "-c") == 0 && i + 1 < argc) { config_file = argv[++i]; }
            else if (strcmp(argv[i], "-l") == 0 && i + 1 < argc) { level = log_level_from_string(argv[++i]); }
            else if (strcmp(argv[i], "-n") == 0 && i + 1 < argc) { messages = std::stoi(argv[++i]); }
            else if (strcmp(argv[i], "-t") == 0 && i + 1 < argc) { threads = std::stoi(argv[++i]); }
            else if (strcmp(argv[i], "-q") == 0 && i + 1 < argc) { discard_threshold = std::stoi(argv[++i]); }
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

        if (!config_file.empty()) { config = load_sink_config(config_file); }
        if (file) { config.file = *file; }
        if (level) { config.level = *level; }
        if (discard_threshold) { config.discard_threshold = *discard_threshold; }
    }
    catch (const std::exception &e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        print_usage(argv[0]);
        return 1;
    }

    std::shared_ptr<file_sink> sink;
    try
    {
        sink = file_sink::create(config);
    }
    catch (const std::runtime_error &e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
    install_default_sink(sink);

    rotolog::info("Starting log blast test: {} threads x {} messages to {}", threads, messages, sink->config().file);
    rotolog::debug("Buffer {} bytes, flushed every {} ms, discard threshold {}",
                   sink->config().buffer_length,
                   sink->config().buffer_period.count(),
                   sink->config().discard_threshold);
    rotolog::warn("Level is {}", string_from_log_level(sink->level()));
    rotolog::error_stack("This is what a stack trace looks like");

    auto start = std::chrono::steady_clock::now();

    std::vector<std::thread> workers;
    for (int t = 0; t < threads; ++t)
    {
        workers.emplace_back(
            [t, messages]()
            {
                for (int i = 0; i < messages; ++i) { rotolog::info("thread {} iteration {} hello {}", t, i, "world"); }
            });
    }
    for (auto &w : workers) { w.join(); }

    sink->close();
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);

    auto stats      = sink->get_stats();
    auto pool_stats = sink->records().get_stats();

    std::cerr << "========== SINK METRICS ==========\n";
    std::cerr << "  Elapsed: " << elapsed.count() << " ms\n";
    std::cerr << "  Written: " << stats.written << "\n";
    std::cerr << "  Dropped: " << stats.dropped << "\n";
    std::cerr << "  Rotations: " << stats.rotations << "\n";
    std::cerr << "  Write errors: " << stats.write_errors << "\n";
    std::cerr << "  Daemon faults: " << stats.daemon_faults << "\n";
    std::cerr << "========== RECORD POOL METRICS ==========\n";
    std::cerr << "  Acquires: " << pool_stats.total_acquires << "\n";
    std::cerr << "  Allocations: " << pool_stats.allocations << "\n";
    std::cerr << "  Retained: " << pool_stats.retained << "\n";
    std::cerr << "  Oversized discards: " << pool_stats.oversized_discards << "\n";
    std::cerr << "  Available: " << pool_stats.available << "\n";

    install_default_sink(nullptr);
    return 0;
}
