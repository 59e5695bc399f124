#include "wirecast/log/Log.hpp"

#include <array>
#include <iostream>
#include <mutex>

namespace wirecast::log {

namespace {

LogHandler defaultSink(Level level) {
    std::ostream& out = level == Level::Error ? std::cerr : std::cout;
    return [&out](std::string_view message) {
        out << message;
        out.flush();
    };
}

struct Sinks {
    std::mutex mutex;
    std::array<LogHandler, 2> handlers{defaultSink(Level::Info), defaultSink(Level::Error)};
};

Sinks& sinks() {
    static Sinks instance;
    return instance;
}

std::size_t slot(Level level) {
    return level == Level::Error ? 1 : 0;
}

} // namespace

void setLogHandler(Level level, LogHandler handler) {
    auto& s = sinks();
    std::lock_guard lock(s.mutex);
    s.handlers[slot(level)] = handler ? std::move(handler) : defaultSink(level);
}

void setInfoLogHandler(LogHandler handler) {
    setLogHandler(Level::Info, std::move(handler));
}

void setErrorLogHandler(LogHandler handler) {
    setLogHandler(Level::Error, std::move(handler));
}

void setLogHandlers(LogHandler infoHandler, LogHandler errorHandler) {
    setLogHandler(Level::Info, std::move(infoHandler));
    setLogHandler(Level::Error, std::move(errorHandler));
}

void resetLogHandlers() {
    setLogHandlers(nullptr, nullptr);
}

void write(Level level, std::string_view message) {
    LogHandler handler;
    {
        auto& s = sinks();
        std::lock_guard lock(s.mutex);
        handler = s.handlers[slot(level)];
    }
    // Called outside the lock so a handler may log or swap sinks itself.
    if (handler) {
        handler(message);
    }
}

} // namespace wirecast::log
