#pragma once

#include <cstdlib>
#include <memory>
#include <string>
#include <vector>
#include "spdlog/spdlog.h"
#include "spdlog/fmt/fmt.h"
#include "spdlog/sinks/stdout_color_sinks.h"

using std::string;

// Type for logger pointers
using logger_t = std::shared_ptr<spdlog::logger>;

// Global variables to simplify formatting
const string dim_code{"\e[0m\e[2m"}, bold_code{"\e[0m\e[1m"}, normal_code{"\e[0m"};
const string colored_pattern_prefix{"[" + dim_code + "%Y-%m-%d %H:%M:%S.%e" + normal_code + "] [" +
                                    dim_code + "%n" + normal_code + "] [" + dim_code + "%^%l%$" +
                                    normal_code + "] "};

// Factory functions to create loggers
// Loggers write to stderr so that stdout only carries the results of the tools.
inline logger_t stdout_logger(const string& name) {
    auto result = spdlog::get(name);
    if (result == nullptr) {
        result = spdlog::stderr_color_mt(name);
        result->set_pattern(colored_pattern_prefix + "%v");
    }
    return result;
}

inline logger_t global_logger() {
    auto result = spdlog::get("global");
    if (result == nullptr) {
        result = spdlog::stderr_color_mt("global");
        result->set_pattern(colored_pattern_prefix + "[" + dim_code + "%@" + normal_code + "] " +
                            normal_code + "%v");
    }
    return result;
}

// Library-side logger (format detection, reconstruction)
inline logger_t tree_logger() { return stdout_logger("tree"); }

// Sets the level of every logger used by the project
inline void set_log_level(spdlog::level::level_enum level) {
    global_logger()->set_level(level);
    tree_logger()->set_level(level);
}

// Macros for global logging
#define INFO(...) SPDLOG_LOGGER_INFO(global_logger(), __VA_ARGS__)
#define WARNING(...) SPDLOG_LOGGER_WARN(global_logger(), __VA_ARGS__)
#define ERROR(...) SPDLOG_LOGGER_ERROR(global_logger(), __VA_ARGS__)
#define DEBUG(...) SPDLOG_LOGGER_DEBUG(global_logger(), __VA_ARGS__)
#define TRACE(...) SPDLOG_LOGGER_TRACE(global_logger(), __VA_ARGS__)
#define FAIL(...)                                             \
    {                                                         \
        SPDLOG_LOGGER_CRITICAL(global_logger(), __VA_ARGS__); \
        exit(1);                                              \
    }
