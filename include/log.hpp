#pragma once

#include <functional>
#include <sstream>
#include <string_view>
#include <utility>

using LogSink = std::function<void(std::string_view)>;

/// Replace the info / error sinks. An empty sink restores the console default.
void set_log_sinks(LogSink info_sink, LogSink error_sink);
void reset_log_sinks();

void log_info(std::string_view message);
void log_error(std::string_view message);

template<typename... Args>
void log_infof(Args&&... args) {
    std::ostringstream oss;
    (oss << ... << std::forward<Args>(args));
    log_info(oss.str());
}

template<typename... Args>
void log_errorf(Args&&... args) {
    std::ostringstream oss;
    (oss << ... << std::forward<Args>(args));
    log_error(oss.str());
}
