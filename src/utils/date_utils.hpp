#pragma once

#include <ctime>
#include <string>

inline std::string formatLocalNow(const char* format) {
    std::time_t now = std::time(nullptr);
    std::tm local_tm{};
    localtime_r(&now, &local_tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), format, &local_tm);
    return buf;
}

// "YYYY-MM-DD HH:MM:SS"
inline std::string currentTimestamp() {
    return formatLocalNow("%Y-%m-%d %H:%M:%S");
}

// "YYYY-MM-DD"
inline std::string currentDate() {
    return formatLocalNow("%Y-%m-%d");
}

inline int daysInMonth(int year, int month) {
    static const int days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
    return month == 2 && leap ? 29 : days[month - 1];
}

// Accepts only YYYY-MM-DD naming a real calendar day.
inline bool isValidDate(const std::string& date) {
    if (date.size() != 10 || date[4] != '-' || date[7] != '-') {
        return false;
    }
    for (size_t i = 0; i < date.size(); ++i) {
        if (i == 4 || i == 7) continue;
        if (date[i] < '0' || date[i] > '9') return false;
    }
    int year = std::stoi(date.substr(0, 4));
    int month = std::stoi(date.substr(5, 2));
    int day = std::stoi(date.substr(8, 2));
    if (year < 1 || month < 1 || month > 12) {
        return false;
    }
    return day >= 1 && day <= daysInMonth(year, month);
}
