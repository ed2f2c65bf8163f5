#pragma once

#include <chrono>
#include <string>

namespace voice_bridge::utils {

std::string generate_uuid_v4();

// ISO-8601 UTC with microseconds, e.g. 2024-05-01T12:00:00.123456Z.
std::string format_utc(std::chrono::system_clock::time_point time);

}
