/**
 * @file test_file_sink.cpp
 * @brief Tests for the file sink write paths, flushing and shutdown
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */

#include <catch2/catch_test_macros.hpp>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <regex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include "rotolog/log.hpp"

using namespace rotolog;
using namespace std::chrono_literals;
namespace fs = std::filesystem;

class sink_test_fixture
{
  protected:
    std::string test_dir;
    std::string log_file;

    sink_test_fixture()
    {
        auto pid = getpid();
        auto tid = std::hash<std::thread::id>{}(std::this_thread::get_id());
        test_dir = "/tmp/test_sink_" + std::to_string(pid) + "_" + std::to_string(tid);
        fs::create_directories(test_dir);
        log_file = test_dir + "/sink.log";
    }

    ~sink_test_fixture()
    {
        std::error_code ec;
        fs::remove_all(test_dir, ec);
    }

    sink_config file_config() const
    {
        sink_config cfg;
        cfg.file = log_file;
        return cfg;
    }

    std::string read_file(const std::string &path)
    {
        std::ifstream in(path, std::ios::binary);
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

    std::vector<std::string> read_lines(const std::string &path)
    {
        std::vector<std::string> lines;
        std::ifstream in(path);
        std::string line;
        while (std::getline(in, line)) { lines.push_back(line); }
        return lines;
    }

    size_t file_size(const std::string &path)
    {
        std::error_code ec;
        auto size = fs::file_size(path, ec);
        return ec ? 0 : static_cast<size_t>(size);
    }
};

// Sink that refuses records mentioning "poison", to fault the daemon
class faulty_sink : public file_sink
{
  public:
    using file_sink::file_sink;

    ~faulty_sink() override { close(); }

    void write_direct(log_record *r) override
    {
        if (r->get_text().find("poison") != std::string_view::npos)
        {
            records().release(r);
            throw std::runtime_error("cannot write poisoned record");
        }
        file_sink::write_direct(r);
    }
};

// Sends everything written to stderr into a file until restored
class stderr_capture
{
    int saved_;

  public:
    explicit stderr_capture(const std::string &path)
    {
        fflush(stderr);
        saved_ = ::dup(STDERR_FILENO);
        int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
        ::dup2(fd, STDERR_FILENO);
        ::close(fd);
    }

    ~stderr_capture() { restore(); }

    void restore()
    {
        if (saved_ < 0) return;
        fflush(stderr);
        ::dup2(saved_, STDERR_FILENO);
        ::close(saved_);
        saved_ = -1;
    }
};

TEST_CASE_METHOD(sink_test_fixture, "Sink construction", "[sink]")
{
    SECTION("unopenable destination throws")
    {
        sink_config cfg;
        cfg.file = test_dir + "/missing/dir/app.log";
        REQUIRE_THROWS_AS(file_sink(cfg), std::runtime_error);
        REQUIRE_THROWS_AS(file_sink::create(cfg), std::runtime_error);
    }

    SECTION("file is created and defaults applied")
    {
        auto sink = file_sink::create(file_config());
        REQUIRE(fs::exists(log_file));

        const auto &cfg = sink->config();
        REQUIRE(cfg.buffer_length == DEFAULT_BUFFER_LENGTH);
        REQUIRE(cfg.buffer_period == DEFAULT_BUFFER_PERIOD);
        REQUIRE(cfg.record_length == DEFAULT_RECORD_LENGTH);
        REQUIRE(cfg.record_factor == DEFAULT_RECORD_FACTOR);
        REQUIRE(sink->records().threshold() == static_cast<size_t>(DEFAULT_RECORD_LENGTH * DEFAULT_RECORD_FACTOR));
    }

    SECTION("existing content is appended to")
    {
        std::ofstream(log_file) << "previous run\n";

        {
            file_sink sink(file_config());
            sink.info("next run");
        }

        auto lines = read_lines(log_file);
        REQUIRE(lines.size() == 2);
        REQUIRE(lines[0] == "previous run");
        REQUIRE(lines[1].find("next run") != std::string::npos);
    }
}

TEST_CASE_METHOD(sink_test_fixture, "Level suppression", "[sink][level]")
{
    SECTION("records below the minimum level are not written")
    {
        auto cfg  = file_config();
        cfg.level = log_level::warn;
        {
            file_sink sink(cfg);
            sink.debug("debug {}", 1);
            sink.info("info {}", 2);
            sink.warn("warn {}", 3);
            sink.error("error {}", 4);
            REQUIRE(sink.get_stats().written == 2);
        }

        auto lines = read_lines(log_file);
        REQUIRE(lines.size() == 2);
        REQUIRE(lines[0].substr(LEVEL_FIELD_OFFSET, HEADER_LENGTH - LEVEL_FIELD_OFFSET) == "WARN  ");
        REQUIRE(lines[0].find("warn 3") != std::string::npos);
        REQUIRE(lines[1].substr(LEVEL_FIELD_OFFSET, HEADER_LENGTH - LEVEL_FIELD_OFFSET) == "ERROR ");
    }

    SECTION("off suppresses everything")
    {
        auto cfg  = file_config();
        cfg.level = log_level::off;
        {
            file_sink sink(cfg);
            sink.error("nope");
            sink.error_stack("nope");
            sink.fatal("nope");
            REQUIRE(sink.get_stats().written == 0);
            REQUIRE(sink.records().get_stats().total_acquires == 0);
        }
        REQUIRE(file_size(log_file) == 0);
    }

    SECTION("level can be changed at runtime")
    {
        file_sink sink(file_config());
        REQUIRE(sink.would_log(log_level::debug));

        sink.set_level(log_level::error);
        REQUIRE(sink.level() == log_level::error);
        REQUIRE_FALSE(sink.would_log(log_level::warn));
        REQUIRE(sink.would_log(log_level::fatal));
        REQUIRE_FALSE(sink.would_log(log_level::off));

        sink.warn("dropped");
        sink.error("kept");
        sink.close();

        auto lines = read_lines(log_file);
        REQUIRE(lines.size() == 1);
        REQUIRE(lines[0].find("kept") != std::string::npos);
    }
}

TEST_CASE_METHOD(sink_test_fixture, "Record content", "[sink][format]")
{
    SECTION("bytes reach the file unchanged and in order")
    {
        std::string expected;
        {
            file_sink sink(file_config());
            for (int i = 0; i < 100; ++i)
            {
                auto *r = sink.records().acquire();
                r->write_header(static_cast<log_level>(i % 5));
                r->write_location("round_trip.cpp", static_cast<uint32_t>(i));
                r->format("payload {} {}", i, std::string(static_cast<size_t>(i), 'p'));
                expected += r->get_text();
                sink.write(r);
            }
        }
        REQUIRE(read_file(log_file) == expected);
    }

    SECTION("caller location is recorded")
    {
        file_sink sink(file_config());
        uint32_t line = __LINE__ + 1;
        sink.info("located {}", "here");
        sink.close();

        auto lines = read_lines(log_file);
        REQUIRE(lines.size() == 1);
        REQUIRE(lines[0].find(fmt::format("test_file_sink.cpp:{} - located here", line)) != std::string::npos);

        std::regex pattern(R"(^\d{4}-\d{2}-\d{2} \d{2}:\d{2}:\d{2} INFO  .*test_file_sink\.cpp:\d+ - located here$)");
        REQUIRE(std::regex_match(lines[0], pattern));
    }

    SECTION("error_stack adds a stack line")
    {
        file_sink sink(file_config());
        sink.error_stack("with stack {}", 7);
        sink.close();

        auto lines = read_lines(log_file);
        REQUIRE(lines.size() == 2);
        REQUIRE(lines[0].find("ERROR") != std::string::npos);
        REQUIRE(lines[0].find("with stack 7") != std::string::npos);
        REQUIRE(lines[1].find("test_file_sink.cpp:") != std::string::npos);
        REQUIRE(lines[1].find("/rotolog/log_") == std::string::npos);
    }

    SECTION("fatal logs with a stack and flushes")
    {
        file_sink sink(file_config());
        sink.fatal("unrecoverable {}", "state");

        auto lines = read_lines(log_file);
        REQUIRE(lines.size() == 2);
        REQUIRE(lines[0].substr(LEVEL_FIELD_OFFSET, LEVEL_FIELD_WIDTH) == "FATAL");
        REQUIRE(lines[0].find("unrecoverable state") != std::string::npos);
        REQUIRE(lines[1].find("test_file_sink.cpp:") != std::string::npos);
    }
}

TEST_CASE_METHOD(sink_test_fixture, "Flush", "[sink][flush]")
{
    file_sink sink(file_config());

    SECTION("records stay buffered until flushed")
    {
        sink.info("buffered");
        REQUIRE(file_size(log_file) == 0);

        sink.flush();
        REQUIRE(file_size(log_file) > 0);
    }

    SECTION("flush is idempotent")
    {
        sink.flush();
        REQUIRE(file_size(log_file) == 0);

        sink.info("once");
        sink.flush();
        auto size = file_size(log_file);
        REQUIRE(size > 0);

        sink.flush();
        sink.flush();
        REQUIRE(file_size(log_file) == size);
        REQUIRE(sink.get_stats().write_errors == 0);
    }

    SECTION("records larger than the buffer are written through")
    {
        auto cfg          = file_config();
        cfg.buffer_length = 64;
        file_sink small(cfg);

        small.info("{}", std::string(200, 'w'));
        REQUIRE(file_size(log_file) > 200);
    }
}

TEST_CASE_METHOD(sink_test_fixture, "Close", "[sink][close]")
{
    SECTION("close is idempotent")
    {
        file_sink sink(file_config());
        sink.info("before close");
        sink.close();
        sink.close();

        REQUIRE(read_lines(log_file).size() == 1);
    }

    SECTION("close drains the discard queue")
    {
        auto cfg              = file_config();
        cfg.discard_threshold = 1000;
        cfg.buffer_period     = 1h;

        file_sink sink(cfg);
        for (int i = 0; i < 100; ++i) { sink.info("queued {}", i); }
        sink.close();

        auto stats = sink.get_stats();
        REQUIRE(stats.dropped == 0);
        REQUIRE(stats.written == 100);
        REQUIRE(stats.pending == 0);

        auto lines = read_lines(log_file);
        REQUIRE(lines.size() == 100);
        REQUIRE(lines[0].find("queued 0") != std::string::npos);
        REQUIRE(lines[99].find("queued 99") != std::string::npos);
    }

    SECTION("records written after close are counted as errors")
    {
        file_sink sink(file_config());
        sink.info("kept");
        sink.close();

        {
            stderr_capture capture(test_dir + "/stderr.txt");
            sink.info("lost");
        }

        auto stats = sink.get_stats();
        REQUIRE(stats.written == 1);
        REQUIRE(stats.write_errors == 1);
        REQUIRE(read_lines(log_file).size() == 1);
    }

    SECTION("standard streams stay open")
    {
        sink_config cfg;
        cfg.file = "STDOUT";
        {
            file_sink sink(cfg);
            REQUIRE(sink.config().is_standard_stream());
            sink.close();
        }
        REQUIRE(fcntl(STDOUT_FILENO, F_GETFD) != -1);
    }
}

TEST_CASE_METHOD(sink_test_fixture, "Discard path", "[sink][discard]")
{
    SECTION("daemon flushes periodically")
    {
        auto cfg              = file_config();
        cfg.discard_threshold = 16;
        cfg.buffer_period     = 20ms;

        file_sink sink(cfg);
        sink.info("eventually on disk");

        auto deadline = std::chrono::steady_clock::now() + 5s;
        while (file_size(log_file) == 0 && std::chrono::steady_clock::now() < deadline)
        {
            std::this_thread::sleep_for(5ms);
        }
        REQUIRE(file_size(log_file) > 0);
    }

    SECTION("record past the threshold is dropped without blocking")
    {
        // A FIFO nobody reads from lets the test stall the daemon in write()
        std::string fifo = test_dir + "/pipe";
        REQUIRE(mkfifo(fifo.c_str(), 0600) == 0);
        int reader = ::open(fifo.c_str(), O_RDONLY | O_NONBLOCK);
        REQUIRE(reader >= 0);

        constexpr int threshold = 4;

        sink_config cfg;
        cfg.file              = fifo;
        cfg.buffer_length     = 1024;
        cfg.buffer_period     = 1h;
        cfg.discard_threshold = threshold;

        auto sink = file_sink::create(cfg);

        // Larger than the pipe capacity, the daemon blocks on it
        const size_t big_size = 1 << 20;
        auto *big             = sink->records().acquire();
        big->write_raw(std::string(big_size, 'b'));
        sink->write(big);

        auto deadline = std::chrono::steady_clock::now() + 5s;
        while (sink->get_stats().pending != 0 && std::chrono::steady_clock::now() < deadline)
        {
            std::this_thread::sleep_for(1ms);
        }
        REQUIRE(sink->get_stats().pending == 0);

        size_t queued_bytes = 0;
        for (int i = 0; i < threshold; ++i)
        {
            auto *r = sink->records().acquire();
            r->write_header(log_level::info);
            r->format("queued {}", i);
            queued_bytes += r->len();
            sink->write(r);
        }
        REQUIRE(sink->get_stats().pending == threshold);
        REQUIRE(sink->get_stats().dropped == 0);

        auto releases_before = sink->records().get_stats().total_releases;
        sink->info("one too many");

        auto stats = sink->get_stats();
        REQUIRE(stats.dropped == 1);
        REQUIRE(stats.pending == threshold);
        REQUIRE(sink->records().get_stats().total_releases == releases_before + 1);

        // Unblock the daemon and collect everything it writes
        REQUIRE(fcntl(reader, F_SETFL, 0) == 0);
        std::atomic<size_t> received{0};
        std::thread drain(
            [reader, &received]()
            {
                char buf[65536];
                for (;;)
                {
                    ssize_t n = ::read(reader, buf, sizeof(buf));
                    if (n < 0 && errno == EINTR) continue;
                    if (n <= 0) break;
                    received.fetch_add(static_cast<size_t>(n));
                }
            });

        sink->close();
        drain.join();
        ::close(reader);

        stats = sink->get_stats();
        REQUIRE(stats.written == threshold + 1);
        REQUIRE(stats.dropped == 1);
        REQUIRE(received.load() == big_size + queued_bytes);
    }
}

TEST_CASE_METHOD(sink_test_fixture, "Daemon fault recovery", "[sink][discard][daemon]")
{
    auto cfg              = file_config();
    cfg.discard_threshold = 64;
    cfg.buffer_period     = 1h;

    std::string err_path = test_dir + "/stderr.txt";
    {
        stderr_capture capture(err_path);
        faulty_sink sink(cfg);

        sink.info("before {}", 1);
        sink.info("poison {}", 2);
        sink.info("after {}", 3);

        auto deadline = std::chrono::steady_clock::now() + 5s;
        while ((sink.get_stats().daemon_faults < 1 || sink.get_stats().written < 2) &&
               std::chrono::steady_clock::now() < deadline)
        {
            std::this_thread::sleep_for(1ms);
        }
        REQUIRE(sink.get_stats().daemon_faults == 1);
        REQUIRE(sink.get_stats().written == 2);

        // A fault right before shutdown must not keep close() from returning
        sink.info("poison {}", 4);
        sink.info("last {}", 5);
        sink.close();
        capture.restore();

        auto stats = sink.get_stats();
        REQUIRE(stats.daemon_faults == 2);
        REQUIRE(stats.written == 3);
        REQUIRE(stats.pending == 0);
        REQUIRE(stats.dropped == 0);
    }

    auto lines = read_lines(log_file);
    REQUIRE(lines.size() == 3);
    REQUIRE(lines[0].find("before 1") != std::string::npos);
    REQUIRE(lines[1].find("after 3") != std::string::npos);
    REQUIRE(lines[2].find("last 5") != std::string::npos);

    auto diagnostics = read_file(err_path);
    REQUIRE(diagnostics.find("[rotolog] daemon error: cannot write poisoned record") != std::string::npos);
}

TEST_CASE_METHOD(sink_test_fixture, "Concurrent producers", "[sink][threading]")
{
    constexpr int num_threads     = 4;
    constexpr int msgs_per_thread = 250;

    SECTION("direct path")
    {
        {
            file_sink sink(file_config());
            std::vector<std::thread> threads;
            for (int t = 0; t < num_threads; ++t)
            {
                threads.emplace_back(
                    [&sink, t]()
                    {
                        for (int i = 0; i < msgs_per_thread; ++i) { sink.info("thread {} message {}", t, i); }
                    });
            }
            for (auto &th : threads) { th.join(); }
        }

        auto lines = read_lines(log_file);
        REQUIRE(lines.size() == num_threads * msgs_per_thread);

        std::regex pattern(R"(^\d{4}-\d{2}-\d{2} \d{2}:\d{2}:\d{2} INFO  .*:\d+ - thread \d message \d+$)");
        for (const auto &line : lines) { REQUIRE(std::regex_match(line, pattern)); }
    }

    SECTION("discard path with room for everything")
    {
        auto cfg              = file_config();
        cfg.discard_threshold = num_threads * msgs_per_thread;
        {
            file_sink sink(cfg);
            std::vector<std::thread> threads;
            for (int t = 0; t < num_threads; ++t)
            {
                threads.emplace_back(
                    [&sink, t]()
                    {
                        for (int i = 0; i < msgs_per_thread; ++i) { sink.info("thread {} message {}", t, i); }
                    });
            }
            for (auto &th : threads) { th.join(); }
            REQUIRE(sink.get_stats().dropped == 0);
        }

        REQUIRE(read_lines(log_file).size() == num_threads * msgs_per_thread);
    }
}
