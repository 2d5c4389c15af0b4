/**
 * @file log_default.hpp
 * @brief Process-wide default sink and the free logging functions
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 *
 * Code that does not carry a sink around logs through rotolog::info() and
 * friends, which forward to the default sink. Until something else is
 * installed the default sink writes to stdout without rotation or discard.
 *
 * @code
 * rotolog::sink_config cfg;
 * cfg.file         = "/var/log/app.log";
 * cfg.rotate_cycle = rotolog::rotate_cycle::daily;
 * rotolog::install_default_sink(rotolog::file_sink::create(cfg));
 *
 * rotolog::info("started, pid {}", getpid());
 * @endcode
 */
#pragma once

#include <memory>
#include <mutex>
#include <type_traits>
#include <utility>

#include "log_sink.hpp"

namespace rotolog
{

class default_sink_registry
{
    std::mutex mutex_;
    std::shared_ptr<file_sink> sink_;

    default_sink_registry() = default;

  public:
    static default_sink_registry &instance()
    {
        static default_sink_registry instance;
        return instance;
    }

    // Current sink, a stdout sink is created on first use
    std::shared_ptr<file_sink> get()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!sink_) { sink_ = file_sink::create(sink_config{}); }
        return sink_;
    }

    /**
     * @brief Replace the default sink
     *
     * The previous sink is flushed before the swap and handed back to the
     * caller, who decides when to close it. Installing nullptr brings back
     * the lazily created stdout sink.
     *
     * @return The previous sink, may be nullptr
     */
    std::shared_ptr<file_sink> install(std::shared_ptr<file_sink> sink)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (sink_) { sink_->flush(); }
        return std::exchange(sink_, std::move(sink));
    }
};

inline std::shared_ptr<file_sink> default_sink() { return default_sink_registry::instance().get(); }

inline std::shared_ptr<file_sink> install_default_sink(std::shared_ptr<file_sink> sink)
{
    return default_sink_registry::instance().install(std::move(sink));
}

template <typename... Args> void debug(located_format<std::type_identity_t<Args>...> fmt, Args &&...args)
{
    default_sink()->debug<Args...>(fmt, std::forward<Args>(args)...);
}

template <typename... Args> void info(located_format<std::type_identity_t<Args>...> fmt, Args &&...args)
{
    default_sink()->info<Args...>(fmt, std::forward<Args>(args)...);
}

template <typename... Args> void warn(located_format<std::type_identity_t<Args>...> fmt, Args &&...args)
{
    default_sink()->warn<Args...>(fmt, std::forward<Args>(args)...);
}

template <typename... Args> void error(located_format<std::type_identity_t<Args>...> fmt, Args &&...args)
{
    default_sink()->error<Args...>(fmt, std::forward<Args>(args)...);
}

template <typename... Args> void error_stack(located_format<std::type_identity_t<Args>...> fmt, Args &&...args)
{
    default_sink()->error_stack<Args...>(fmt, std::forward<Args>(args)...);
}

template <typename... Args> void fatal(located_format<std::type_identity_t<Args>...> fmt, Args &&...args)
{
    default_sink()->fatal<Args...>(fmt, std::forward<Args>(args)...);
}

inline void flush() { default_sink()->flush(); }

} // namespace rotolog
