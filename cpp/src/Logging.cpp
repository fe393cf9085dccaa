#include "Logging.h"
#include "Error.h"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

using namespace ensemble;

namespace {
    std::atomic<int> gLevel{static_cast<int>(LogLevel::INFO)};
    std::mutex gLogMutex;
    LogSink gSink;

    std::string utcTimestamp() {
        using clock = std::chrono::system_clock;
        const auto now = clock::now();
        const std::time_t tt = clock::to_time_t(now);
        const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
        std::tm tm{};
        gmtime_r(&tt, &tm);
        std::ostringstream oss;
        oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << ms << 'Z';
        return oss.str();
    }
}

void ensemble::setLogLevel(const LogLevel level) noexcept {
    gLevel.store(static_cast<int>(level), std::memory_order_relaxed);
}

LogLevel ensemble::getLogLevel() noexcept {
    return static_cast<LogLevel>(gLevel.load(std::memory_order_relaxed));
}

const char* ensemble::toString(const LogLevel level) noexcept {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARN: return "WARN";
        case LogLevel::ERROR: return "ERROR";
    }
    return "INFO";
}

LogLevel ensemble::parseLogLevel(const std::string& name) {
    std::string n = name;
    std::transform(n.begin(), n.end(), n.begin(), [](const unsigned char c) { return std::toupper(c); });
    if (n == "DEBUG") return LogLevel::DEBUG;
    if (n == "INFO") return LogLevel::INFO;
    if (n == "WARN" || n == "WARNING") return LogLevel::WARN;
    if (n == "ERROR") return LogLevel::ERROR;
    throw ConfigurationError("Unknown log level '" + name + "'");
}

void ensemble::setLogSink(LogSink sink) {
    std::lock_guard<std::mutex> lock(gLogMutex);
    gSink = std::move(sink);
}

void ensemble::log(const LogLevel level, const std::string& msg) noexcept {
    if (static_cast<int>(level) < gLevel.load(std::memory_order_relaxed)) return;

    std::lock_guard<std::mutex> lock(gLogMutex);
    try {
        if (gSink) {
            gSink(level, msg);
            return;
        }
        std::ostream& out = level >= LogLevel::WARN ? std::cerr : std::cout;
        out << '[' << utcTimestamp() << "][" << toString(level) << "] " << msg << '\n';
        out.flush();
    }
    catch (const std::exception& e) {
        // last resort: the sink or stream itself failed
        std::fprintf(stderr, "[%s] %s (logging failed: %s)\n", toString(level), msg.c_str(), e.what());
    }
}
