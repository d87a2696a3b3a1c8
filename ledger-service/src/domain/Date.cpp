#include "domain/Date.hpp"

#include <chrono>
#include <ctime>
#include <cstdio>
#include <stdexcept>

namespace ledger::domain {

Date::Date(int y, int m, int d) : year(y), month(m), day(d) {
    if (m < 1 || m > 12 || d < 1 || d > daysInMonth(y, m)) {
        throw std::invalid_argument("Invalid calendar date: " + std::to_string(y) + "-" +
                                    std::to_string(m) + "-" + std::to_string(d));
    }
}

Date Date::parse(const std::string& str) {
    int y = 0, m = 0, d = 0;
    char tail = 0;
    if (str.size() != 10 || str[4] != '-' || str[7] != '-' ||
        std::sscanf(str.c_str(), "%4d-%2d-%2d%c", &y, &m, &d, &tail) != 3) {
        throw std::invalid_argument("Invalid date (expected YYYY-MM-DD): " + str);
    }
    return Date(y, m, d);
}

Date Date::today() {
    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm = *std::gmtime(&now);
    return Date(tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday);
}

bool Date::isLeapYear(int y) {
    return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

int Date::daysInMonth(int y, int m) {
    static const int days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (m == 2 && isLeapYear(y)) {
        return 29;
    }
    return days[m - 1];
}

// Алгоритм days_from_civil (H. Hinnant)
long Date::toDays() const {
    const int y = month <= 2 ? year - 1 : year;
    const long era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned mp = static_cast<unsigned>(month > 2 ? month - 3 : month + 9);
    const unsigned doy = (153 * mp + 2) / 5 + static_cast<unsigned>(day) - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<long>(doe) - 719468;
}

Date Date::fromDays(long days) {
    days += 719468;
    const long era = (days >= 0 ? days : days - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(days - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    const int d = static_cast<int>(doy - (153 * mp + 2) / 5 + 1);
    const int m = static_cast<int>(mp < 10 ? mp + 3 : mp - 9);
    const int y = static_cast<int>(yoe) + static_cast<int>(era * 400) + (m <= 2 ? 1 : 0);
    return Date(y, m, d);
}

Date Date::addDays(long days) const {
    return fromDays(toDays() + days);
}

Date Date::firstOfNextMonths(int months) const {
    int total = (year * 12 + (month - 1)) + months;
    return Date(total / 12, total % 12 + 1, 1);
}

std::string Date::toString() const {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", year, month, day);
    return buf;
}

} // namespace ledger::domain
