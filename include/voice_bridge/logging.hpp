#pragma once

#include <initializer_list>
#include <memory>
#include <optional>
#include <sstream>
#include <string>

#include "voice_bridge/config.hpp"
#include "spdlog/logger.h"

namespace voice_bridge {
namespace logging {

struct KeyValue {
    std::string key;
    std::string value;
};

template <typename T>
KeyValue kv(const std::string& key, const T& value) {
    std::ostringstream oss;
    oss << value;
    return {key, oss.str()};
}

inline KeyValue kv(const std::string& key, bool value) {
    return {key, value ? "true" : "false"};
}

// Absent values render as "-" so a missing call or user id stays visible.
inline KeyValue kv(const std::string& key, const std::optional<std::string>& value) {
    return {key, value ? *value : "-"};
}

// "msg [k=v, k2=\"v with spaces\"]"
std::string with_kv(const std::string& message, std::initializer_list<KeyValue> items);

void init(const Config& config);
void shutdown();
std::shared_ptr<spdlog::logger> get_logger();

inline void log(spdlog::level::level_enum level,
                const std::string& message,
                std::initializer_list<KeyValue> items = {}) {
    auto logger = get_logger();
    if (logger && logger->should_log(level)) {
        logger->log(level, with_kv(message, items));
    }
}

inline void trace(const std::string& message, std::initializer_list<KeyValue> items = {}) {
    log(spdlog::level::trace, message, items);
}

inline void debug(const std::string& message, std::initializer_list<KeyValue> items = {}) {
    log(spdlog::level::debug, message, items);
}

inline void info(const std::string& message, std::initializer_list<KeyValue> items = {}) {
    log(spdlog::level::info, message, items);
}

inline void warn(const std::string& message, std::initializer_list<KeyValue> items = {}) {
    log(spdlog::level::warn, message, items);
}

inline void error(const std::string& message, std::initializer_list<KeyValue> items = {}) {
    log(spdlog::level::err, message, items);
}

}

using logging::kv;
using logging::debug;
using logging::error;
using logging::info;
using logging::trace;
using logging::warn;

}
