#include "logger.hpp"

#include <chrono>

namespace modbridge::core {

namespace {

const auto g_startTime = std::chrono::steady_clock::now();

double seconds_since_start() {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - g_startTime).count();
}

} // namespace

const char* log_level_prefix(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:   return "[DEBUG] ";
        case LogLevel::Info:    return "[INFO]  ";
        case LogLevel::Warning: return "[WARN]  ";
        case LogLevel::Error:   return "[ERROR] ";
    }
    return "[INFO]  ";
}

Logger& Logger::instance() {
    static Logger inst;
    return inst;
}

void Logger::init(const LoggingConfig& cfg) {
    shutdown();

    std::lock_guard<std::mutex> lock(mutex_);
    cfg_ = cfg;

    if (cfg_.enabled && !cfg_.file.empty()) {
        file_ = std::fopen(cfg_.file.c_str(), "a");
        if (!file_) {
            std::fprintf(stderr, "%sfailed to open log file %s\n",
                         log_level_prefix(LogLevel::Warning), cfg_.file.c_str());
        }
    }
}

void Logger::shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_) {
        std::fclose(file_);
        file_ = nullptr;
    }
}

void Logger::set_sink(Sink sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sink_ = std::move(sink);
}

bool Logger::enabled(LogLevel level) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_.enabled && level >= cfg_.level;
}

void Logger::log(LogLevel level, std::string_view msg) {
    Sink sink;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sink = sink_;

        if (cfg_.enabled && level >= cfg_.level) {
            const char* prefix = log_level_prefix(level);
            const double t = seconds_since_start();

            std::fprintf(stderr, "[%.3f]%s%.*s\n", t, prefix, static_cast<int>(msg.size()), msg.data());

            if (file_) {
                std::fprintf(file_, "[%.3f]%s%.*s\n", t, prefix, static_cast<int>(msg.size()), msg.data());
                std::fflush(file_);
            }
        }
    }

    // Sinks see every line regardless of the console level.
    if (sink) {
        sink(level, msg);
    }
}

} // namespace modbridge::core
