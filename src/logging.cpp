#include "voice_bridge/logging.hpp"

#include <algorithm>
#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

#include "spdlog/sinks/basic_file_sink.h"
#include "spdlog/sinks/stdout_color_sinks.h"
#include "spdlog/spdlog.h"

namespace voice_bridge::logging {

namespace {

std::mutex logger_mutex;
std::string logger_name = "voice_bridge";

spdlog::level::level_enum parse_level(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::toupper(ch)); });
    if (value == "TRACE") return spdlog::level::trace;
    if (value == "DEBUG") return spdlog::level::debug;
    if (value == "WARN" || value == "WARNING") return spdlog::level::warn;
    if (value == "ERROR") return spdlog::level::err;
    if (value == "CRITICAL") return spdlog::level::critical;
    if (value == "OFF") return spdlog::level::off;
    return spdlog::level::info;
}

bool needs_quotes(const std::string& value) {
    return value.empty() || value.find_first_of(" =,\"") != std::string::npos;
}

}

std::string with_kv(const std::string& message, std::initializer_list<KeyValue> items) {
    if (items.size() == 0) {
        return message;
    }
    std::string result = message + " [";
    bool first = true;
    for (const auto& item : items) {
        if (!first) {
            result += ", ";
        }
        first = false;
        result += item.key;
        result += '=';
        if (needs_quotes(item.value)) {
            result += '"';
            result += item.value;
            result += '"';
        } else {
            result += item.value;
        }
    }
    result += ']';
    return result;
}

void init(const Config& config) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

    if (config.log_filename) {
        const std::filesystem::path log_path(*config.log_filename);
        if (!log_path.parent_path().empty()) {
            std::filesystem::create_directories(log_path.parent_path());
        }
        sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_path.string(),
                                                                            true));
    }

    std::lock_guard<std::mutex> lock(logger_mutex);
    spdlog::drop(logger_name);
    logger_name = config.log_name;
    auto logger = std::make_shared<spdlog::logger>(logger_name, sinks.begin(), sinks.end());
    // Bridge threads interleave; the thread id tells their lines apart.
    logger->set_pattern("%Y-%m-%d %H:%M:%S.%e [%n] [%^%l%$] [t%t] %v");
    logger->flush_on(spdlog::level::warn);
    spdlog::register_logger(logger);
    spdlog::set_default_logger(logger);
    spdlog::set_level(parse_level(config.log_level));
}

void shutdown() {
    std::lock_guard<std::mutex> lock(logger_mutex);
    if (auto logger = spdlog::get(logger_name)) {
        logger->flush();
    }
    spdlog::shutdown();
}

std::shared_ptr<spdlog::logger> get_logger() {
    std::lock_guard<std::mutex> lock(logger_mutex);
    if (auto logger = spdlog::get(logger_name)) {
        return logger;
    }
    return spdlog::default_logger();
}

}
