#pragma once

#include <string>
#include <compare>

namespace ledger::domain {

/**
 * @brief Календарная дата без времени (пролептический григорианский календарь)
 *
 * Используется для дат проводок и границ периодов.
 * Строковый формат: ISO 8601: "2026-01-31".
 */
class Date {
public:
    int year = 1970;
    int month = 1;
    int day = 1;

    Date() = default;

    /**
     * @throws std::invalid_argument если такой даты нет в календаре
     */
    Date(int y, int m, int d);

    /**
     * @brief Разобрать "YYYY-MM-DD"
     * @throws std::invalid_argument при неверном формате или несуществующей дате
     */
    static Date parse(const std::string& str);

    /// Текущая дата (UTC)
    static Date today();

    static Date fromDays(long days);

    /// Количество дней от 1970-01-01
    long toDays() const;

    Date addDays(long days) const;

    /// Первое число месяца, отстоящего на months от текущего
    Date firstOfNextMonths(int months) const;

    std::string toString() const;

    static bool isLeapYear(int y);
    static int daysInMonth(int y, int m);

    bool operator==(const Date& other) const = default;
    auto operator<=>(const Date& other) const = default;
};

/**
 * @brief Полуинтервал дат [start, end)
 */
struct DateRange {
    Date start;
    Date end;

    bool contains(const Date& date) const {
        return start <= date && date < end;
    }

    bool overlaps(const DateRange& other) const {
        return start < other.end && other.start < end;
    }

    /// Последний день диапазона (end не включается)
    Date lastDay() const { return end.addDays(-1); }
};

} // namespace ledger::domain
