#pragma once
#include <chrono>
#include <cmath>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>

namespace tourplan {

// Returns current time in milliseconds since epoch
static inline long long NowMillis() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(
               steady_clock::now().time_since_epoch()
           ).count();
}

// ---------- small date helpers ----------
static inline std::tm parse_ymd(const std::string& ymd) {
    std::tm tm{}; tm.tm_isdst = -1;
    std::istringstream ss(ymd);
    ss >> std::get_time(&tm, "%Y-%m-%d");
    if (ss.fail()) throw std::runtime_error("Bad date: " + ymd);
    return tm;
}
static inline std::string ymd_add_days(const std::string& ymd, int d) {
    std::tm tm = parse_ymd(ymd);
    tm.tm_hour = 12; // stay clear of DST edges
    tm.tm_mday += d;
    std::mktime(&tm);
    std::ostringstream out; out << std::put_time(&tm, "%Y-%m-%d");
    return out.str();
}
static inline std::string today_ymd() {
    auto t = std::time(nullptr); std::tm tm{};
#if defined(_WIN32)
    localtime_s(&tm, &t);
#else
    localtime_r(&t, &tm);
#endif
    std::ostringstream oss; oss << std::put_time(&tm, "%Y-%m-%d"); return oss.str();
}

// "HH:MM" of the clock time, whole minutes truncated; day is dropped.
static inline std::string format_clock(double seconds_since_ref_midnight) {
    long long s = static_cast<long long>(std::floor(seconds_since_ref_midnight));
    s %= 86400; if (s < 0) s += 86400;
    std::ostringstream oss;
    oss << std::setw(2) << std::setfill('0') << s / 3600 << ":"
        << std::setw(2) << std::setfill('0') << (s % 3600) / 60;
    return oss.str();
}

// "YYYY-MM-DDTHH:MM:SS" local time on the reference date (or a later one).
static inline std::string iso_timestamp(const std::string& ref_ymd, double seconds_since_ref_midnight) {
    long long s = static_cast<long long>(std::floor(seconds_since_ref_midnight));
    long long day = s >= 0 ? s / 86400 : -((-s + 86399) / 86400);
    long long rem = s - day * 86400;
    std::ostringstream oss;
    oss << ymd_add_days(ref_ymd, static_cast<int>(day)) << "T"
        << std::setw(2) << std::setfill('0') << rem / 3600 << ":"
        << std::setw(2) << std::setfill('0') << (rem % 3600) / 60 << ":"
        << std::setw(2) << std::setfill('0') << rem % 60;
    return oss.str();
}

} // namespace tourplan
