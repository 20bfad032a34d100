#include "fleetinv/collector/clock.hpp"
#include <cstdio>
#include <cstring>
#include <ctime>
#include <thread>

namespace fleetinv {
namespace collector {

Clock::time_point SystemClock::now() const {
    return std::chrono::system_clock::now();
}

void SystemClock::sleep_for(std::chrono::milliseconds duration) {
    std::this_thread::sleep_for(duration);
}

std::shared_ptr<Clock> SystemClock::instance() {
    static std::shared_ptr<Clock> clock = std::make_shared<SystemClock>();
    return clock;
}

std::string format_iso8601(Clock::time_point tp) {
    auto time_t = std::chrono::system_clock::to_time_t(tp);
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(tp.time_since_epoch()) % 1000000;
    if (micros.count() < 0) {
        micros += std::chrono::microseconds(1000000);
        time_t -= 1;
    }

    std::tm tm_buf;
#ifdef _WIN32
    gmtime_s(&tm_buf, &time_t);
#else
    gmtime_r(&time_t, &tm_buf);
#endif

    char buf[40];
    snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%06ldZ",
             tm_buf.tm_year + 1900, tm_buf.tm_mon + 1, tm_buf.tm_mday,
             tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
             static_cast<long>(micros.count()));
    return std::string(buf);
}

bool parse_iso8601(const std::string& text, Clock::time_point& out) {
    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    int consumed = 0;
    if (std::sscanf(text.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n",
                    &year, &month, &day, &hour, &minute, &second, &consumed) != 6) {
        return false;
    }
    if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || minute > 59 || second > 60) {
        return false;
    }

    // Optional fraction, scaled to microseconds
    int64_t micros = 0;
    size_t pos = static_cast<size_t>(consumed);
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        int digits = 0;
        while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
            if (digits < 6) {
                micros = micros * 10 + (text[pos] - '0');
                ++digits;
            }
            ++pos;
        }
        if (digits == 0) {
            return false;
        }
        for (; digits < 6; ++digits) {
            micros *= 10;
        }
    }
    if (pos < text.size() && (text[pos] == 'Z' || text[pos] == 'z')) {
        ++pos;
    } else if (pos + 6 == text.size() && text.compare(pos, 6, "+00:00") == 0) {
        pos += 6;
    }
    if (pos != text.size()) {
        return false;
    }

    std::tm tm_buf;
    std::memset(&tm_buf, 0, sizeof(tm_buf));
    tm_buf.tm_year = year - 1900;
    tm_buf.tm_mon = month - 1;
    tm_buf.tm_mday = day;
    tm_buf.tm_hour = hour;
    tm_buf.tm_min = minute;
    tm_buf.tm_sec = second;
#ifdef _WIN32
    std::time_t seconds = _mkgmtime(&tm_buf);
#else
    std::time_t seconds = timegm(&tm_buf);
#endif
    if (seconds == static_cast<std::time_t>(-1)) {
        return false;
    }

    out = std::chrono::system_clock::from_time_t(seconds) + std::chrono::microseconds(micros);
    return true;
}

} // namespace collector
} // namespace fleetinv
