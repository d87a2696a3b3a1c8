#include "domain/Money.hpp"
#include "domain/LedgerException.hpp"

#include <string>

namespace ledger::domain {

namespace {

[[noreturn]] void throwOverflow(const char* op, int64_t lhs, int64_t rhs) {
    throw LedgerException(LedgerErrorCode::INVALID_AMOUNT,
        "Amount out of range: " + std::to_string(lhs) + " " + op + " " + std::to_string(rhs));
}

} // namespace

Money Money::abs() const {
    return minor < 0 ? -*this : *this;
}

Money Money::operator+(const Money& other) const {
    int64_t result = 0;
    if (__builtin_add_overflow(minor, other.minor, &result)) {
        throwOverflow("+", minor, other.minor);
    }
    return Money(result);
}

Money Money::operator-(const Money& other) const {
    int64_t result = 0;
    if (__builtin_sub_overflow(minor, other.minor, &result)) {
        throwOverflow("-", minor, other.minor);
    }
    return Money(result);
}

Money Money::operator-() const {
    return Money() - *this;
}

Money& Money::operator+=(const Money& other) {
    *this = *this + other;
    return *this;
}

Money& Money::operator-=(const Money& other) {
    *this = *this - other;
    return *this;
}

std::string Money::toString(int scale) const {
    // Без std::abs: -INT64_MIN не помещается в int64_t
    const bool negative = minor < 0;
    uint64_t magnitude = negative ? 0 - static_cast<uint64_t>(minor) : static_cast<uint64_t>(minor);

    std::string digits = std::to_string(magnitude);
    if (scale > 0) {
        if (digits.size() <= static_cast<size_t>(scale)) {
            digits.insert(0, static_cast<size_t>(scale) - digits.size() + 1, '0');
        }
        digits.insert(digits.size() - static_cast<size_t>(scale), ".");
    }
    return negative ? "-" + digits : digits;
}

} // namespace ledger::domain
