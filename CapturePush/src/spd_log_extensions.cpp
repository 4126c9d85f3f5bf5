#include "capturepush/spd_log_extensions.hpp"
#include "capturepush/thread_utils.hpp"

#include <vector>

#include "spdlog/sinks/ansicolor_sink.h"
#include "spdlog/sinks/null_sink.h"
#include "spdlog/sinks/rotating_file_sink.h"
#include "spdlog/sinks/stdout_sinks.h"

void ThreadNameFormatterFlag::format(const spdlog::details::log_msg & msg, const std::tm & tm_time, spdlog::memory_buf_t & dest) {
    std::string name = GetThreadName(msg.thread_id);
    dest.append(name.data(), name.data() + name.size());
}

std::unique_ptr<spdlog::custom_flag_formatter> ThreadNameFormatterFlag::clone() const {
    return spdlog::details::make_unique<ThreadNameFormatterFlag>();
}

static std::unique_ptr<spdlog::formatter> formatterWithPattern(std::string pattern) {
    auto formatter = spdlog::details::make_unique<spdlog::pattern_formatter>();
    formatter->add_flag<ThreadNameFormatterFlag>('N').set_pattern(pattern);
    return std::move(formatter);
}

std::shared_ptr<spdlog::logger> CreateCaptureLogger(std::string name, std::string logPath, bool console, bool verbose) {
    std::vector<spdlog::sink_ptr> sinks;

    if (!console) {
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(logPath, 1048576 * 5, 3);
        file_sink->set_formatter(formatterWithPattern("%P [%N] %+"));
        sinks.push_back(file_sink);
    } else {
        auto stdout_sink = std::make_shared<spdlog::sinks::ansicolor_stdout_sink_mt>();
        stdout_sink->set_formatter(formatterWithPattern("[%N] %l: %v"));
        sinks.push_back(stdout_sink);
    }

    // Always log critical errors to stderr as well as the log file / stdout.
    auto stderr_sink = std::make_shared<spdlog::sinks::stderr_sink_mt>();
    stderr_sink->set_level(spdlog::level::critical);
    stderr_sink->set_formatter(formatterWithPattern("%l: %v"));
    sinks.push_back(stderr_sink);

    auto logger = std::make_shared<spdlog::logger>(name, std::begin(sinks), std::end(sinks));
    logger->set_level(verbose ? spdlog::level::debug : spdlog::level::info);
    logger->flush_on(spdlog::level::err);
    spdlog::register_logger(logger);
    spdlog::flush_every(std::chrono::seconds(30));
    return logger;
}

std::shared_ptr<spdlog::logger> CreateNullLogger(std::string name) {
    return std::make_shared<spdlog::logger>(name, std::make_shared<spdlog::sinks::null_sink_mt>());
}
