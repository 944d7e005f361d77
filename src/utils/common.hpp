#pragma once

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

namespace minigpt::utils {

inline std::chrono::system_clock::time_point Now() {
    return std::chrono::system_clock::now();
}

// Local wall-clock time as "YYYY-MM-DD HH:MM:SS".
inline std::string FormatLocalTime(std::chrono::system_clock::time_point time_point) {
    const auto time = std::chrono::system_clock::to_time_t(time_point);
    std::tm local_time{};
#if defined(_WIN32)
    localtime_s(&local_time, &time);
#else
    localtime_r(&time, &local_time);
#endif
    std::ostringstream oss;
    oss << std::put_time(&local_time, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

}  // namespace minigpt::utils
