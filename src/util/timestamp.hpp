#pragma once
#include <ctime>
#include <string>

namespace qstats {

// Local wall-clock time, "YYYY-MM-DD HH:MM:SS".
inline std::string now_local_timestamp() {
    std::time_t t = std::time(nullptr);
    std::tm tm{};
#if defined(_WIN32)
    localtime_s(&tm, &t);
#else
    localtime_r(&t, &tm);
#endif
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
    return std::string(buf);
}

}
