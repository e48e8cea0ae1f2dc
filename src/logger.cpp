#include "logger.h"
#include "utils.h"
#include <atomic>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace viva {

namespace {

// Guards console writes before initialize() and after shutdown()
std::mutex g_console_mutex;

// Mirrors the configured level so enabled() never takes the lock
std::atomic<int> g_min_level{static_cast<int>(LogLevel::INFO)};

std::string timestamp_now() {
    auto now = std::chrono::system_clock::now();
    std::time_t secs = std::chrono::system_clock::to_time_t(now);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count() % 1000;
    std::tm local{};
    localtime_r(&secs, &local);

    std::ostringstream out;
    out << std::put_time(&local, "%Y-%m-%d %H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << millis;
    return out.str();
}

} // namespace

const char* log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERROR: return "ERROR";
    }
    return "UNKNOWN";
}

LogLevel parse_log_level(const std::string& name, LogLevel fallback) {
    const std::string key = utils::normalize_copy(utils::trim_copy(name));
    if (key == "debug") return LogLevel::DEBUG;
    if (key == "info") return LogLevel::INFO;
    if (key == "warn" || key == "warning") return LogLevel::WARN;
    if (key == "error") return LogLevel::ERROR;
    return fallback;
}

class Logger::Impl {
public:
    explicit Impl(const std::string& output_file) {
        if (output_file.empty()) return;
        file_.open(output_file, std::ios::app);
        if (!file_.is_open()) {
            std::cerr << "Warning: cannot open log file " << output_file
                      << ", logging to console only" << std::endl;
        }
    }

    void write(LogLevel level, const std::string& message) {
        std::string line = "[" + std::string(log_level_name(level)) + "] " +
                           timestamp_now() + ": " + message;

        std::lock_guard<std::mutex> lock(mutex_);
        std::ostream& console = (level == LogLevel::ERROR) ? std::cerr : std::cout;
        console << line << '\n';
        console.flush();
        if (file_.is_open()) {
            file_ << line << '\n';
            file_.flush();
        }
    }

private:
    std::mutex mutex_;
    std::ofstream file_;
};

std::unique_ptr<Logger::Impl> Logger::impl_ = nullptr;

void Logger::initialize(LogLevel min_level, const std::string& output_file) {
    g_min_level.store(static_cast<int>(min_level));
    if (!impl_) {
        impl_ = std::make_unique<Impl>(output_file);
    }
}

void Logger::shutdown() {
    impl_.reset();
    g_min_level.store(static_cast<int>(LogLevel::INFO));
}

bool Logger::enabled(LogLevel level) {
    return static_cast<int>(level) >= g_min_level.load();
}

void Logger::log(LogLevel level, const std::string& message) {
    if (!enabled(level)) return;
    if (impl_) {
        impl_->write(level, message);
        return;
    }
    std::lock_guard<std::mutex> lock(g_console_mutex);
    (level == LogLevel::ERROR ? std::cerr : std::cout) << message << std::endl;
}

void Logger::tagged(LogLevel level, const char* component, const std::string& message) {
    log(level, "[" + std::string(component) + "] " + message);
}

void Logger::debug(const std::string& message) { log(LogLevel::DEBUG, message); }
void Logger::info(const std::string& message) { log(LogLevel::INFO, message); }
void Logger::warn(const std::string& message) { log(LogLevel::WARN, message); }
void Logger::error(const std::string& message) { log(LogLevel::ERROR, message); }

void Logger::set_level(LogLevel level) {
    g_min_level.store(static_cast<int>(level));
}

LogLevel Logger::get_level() {
    return static_cast<LogLevel>(g_min_level.load());
}

} // namespace viva
