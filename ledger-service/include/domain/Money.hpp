#pragma once

#include <string>
#include <cstdint>
#include <compare>

namespace ledger::domain {

/**
 * @brief Денежная сумма в минорных единицах валюты
 *
 * Вся арифметика дебета/кредита целочисленная: никаких double,
 * иначе равенство Σдебет == Σкредит ломается на округлении.
 * Валюта ledger-а одна и задаётся в LedgerSettings.
 */
class Money {
public:
    int64_t minor = 0;

    Money() = default;

    explicit Money(int64_t minorUnits) : minor(minorUnits) {}

    static Money zero() { return Money(); }

    bool isZero() const { return minor == 0; }
    bool isNegative() const { return minor < 0; }
    bool isPositive() const { return minor > 0; }

    /**
     * @brief Арифметика с проверкой переполнения int64
     * @throws LedgerException(INVALID_AMOUNT) при выходе за диапазон
     */
    Money abs() const;
    Money operator+(const Money& other) const;
    Money operator-(const Money& other) const;
    Money operator-() const;

    Money& operator+=(const Money& other);
    Money& operator-=(const Money& other);

    bool operator==(const Money& other) const = default;
    auto operator<=>(const Money& other) const = default;

    /**
     * @brief Форматирование с десятичной точкой: 123456 при scale=2 → "1234.56"
     */
    std::string toString(int scale = 0) const;
};

} // namespace ledger::domain
