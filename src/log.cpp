#include "log.hpp"

#include <iostream>
#include <mutex>

static LogSink make_default_info_sink() {
    return [](std::string_view message) {
        std::cout << message << std::flush;
    };
}

static LogSink make_default_error_sink() {
    return [](std::string_view message) {
        std::cerr << message << std::flush;
    };
}

static std::mutex sink_mutex;
static LogSink info_sink = make_default_info_sink();
static LogSink error_sink = make_default_error_sink();

void set_log_sinks(LogSink new_info, LogSink new_error) {
    std::lock_guard<std::mutex> lock(sink_mutex);
    info_sink = new_info ? std::move(new_info) : make_default_info_sink();
    error_sink = new_error ? std::move(new_error) : make_default_error_sink();
}

void reset_log_sinks() {
    std::lock_guard<std::mutex> lock(sink_mutex);
    info_sink = make_default_info_sink();
    error_sink = make_default_error_sink();
}

void log_info(std::string_view message) {
    LogSink sink;
    {
        std::lock_guard<std::mutex> lock(sink_mutex);
        sink = info_sink;
    }
    sink(message);
}

void log_error(std::string_view message) {
    LogSink sink;
    {
        std::lock_guard<std::mutex> lock(sink_mutex);
        sink = error_sink;
    }
    sink(message);
}
