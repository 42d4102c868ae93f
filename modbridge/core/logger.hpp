#pragma once

#include "config.hpp"
#include "types.hpp"

#include <cstdio>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>

namespace modbridge::core {

class Logger {
public:
    using Sink = std::function<void(LogLevel, std::string_view)>;

    static Logger& instance();

    // Applies logging settings (level, optional file sink).
    void init(const LoggingConfig& cfg);
    void shutdown();

    // Extra receiver for every emitted line (tests, editor consoles).
    // Called without the logger lock held, so a sink may call back into the host.
    void set_sink(Sink sink);

    void log(LogLevel level, std::string_view msg);

    bool enabled(LogLevel level) const;

private:
    Logger() = default;

    mutable std::mutex mutex_;
    LoggingConfig cfg_{};
    std::FILE* file_{nullptr};
    Sink sink_;
};

inline void log_debug(std::string_view msg) { Logger::instance().log(LogLevel::Debug, msg); }
inline void log_info(std::string_view msg) { Logger::instance().log(LogLevel::Info, msg); }
inline void log_warning(std::string_view msg) { Logger::instance().log(LogLevel::Warning, msg); }
inline void log_error(std::string_view msg) { Logger::instance().log(LogLevel::Error, msg); }

const char* log_level_prefix(LogLevel level);

} // namespace modbridge::core
