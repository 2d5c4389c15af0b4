#include <rotolog/log.hpp>

using namespace rotolog;

int main()
{
    // Default sink writes to stdout
    rotolog::info("Integration test successful!");
    rotolog::debug("Debug message");
    rotolog::warn("Warning message {}", 42);

    // Dedicated sink on stderr
    sink_config cfg;
    cfg.file  = "stderr";
    cfg.level = log_level::info;
    auto sink = file_sink::create(cfg);
    sink->debug("Not shown");
    sink->info("Version {}", VERSION);
    sink->close();

    // Ensure logs are flushed
    rotolog::flush();

    return 0;
}
