#include "voice_bridge/utils/ids.hpp"

#include <ctime>
#include <iomanip>
#include <random>
#include <sstream>

namespace voice_bridge::utils {

namespace {

char to_hex(int value) {
    if (value >= 0 && value <= 9) return static_cast<char>('0' + value);
    if (value >= 10 && value <= 15) return static_cast<char>('a' + (value - 10));
    return '0';
}

}

std::string generate_uuid_v4() {
    static thread_local std::random_device rd;
    static thread_local std::mt19937 gen(rd());
    static thread_local std::uniform_int_distribution<> dis(0, 15);
    static thread_local std::uniform_int_distribution<> variant(8, 11);

    std::string uuid;
    uuid.reserve(36);
    for (int i = 0; i < 8; ++i) uuid.push_back(to_hex(dis(gen)));
    uuid.push_back('-');
    for (int i = 0; i < 4; ++i) uuid.push_back(to_hex(dis(gen)));
    uuid.push_back('-');
    uuid.push_back('4');
    for (int i = 0; i < 3; ++i) uuid.push_back(to_hex(dis(gen)));
    uuid.push_back('-');
    uuid.push_back(to_hex(variant(gen)));
    for (int i = 0; i < 3; ++i) uuid.push_back(to_hex(dis(gen)));
    uuid.push_back('-');
    for (int i = 0; i < 12; ++i) uuid.push_back(to_hex(dis(gen)));
    return uuid;
}

std::string format_utc(std::chrono::system_clock::time_point time) {
    const auto time_t = std::chrono::system_clock::to_time_t(time);
    std::tm tm_value{};
    gmtime_r(&time_t, &tm_value);
    const auto since_epoch = time.time_since_epoch();
    const auto micros = std::chrono::duration_cast<std::chrono::microseconds>(
        since_epoch - std::chrono::duration_cast<std::chrono::seconds>(since_epoch));
    std::ostringstream out;
    out << std::put_time(&tm_value, "%Y-%m-%dT%H:%M:%S") << '.'
        << std::setw(6) << std::setfill('0') << micros.count() << 'Z';
    return out.str();
}

}
