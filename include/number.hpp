#pragma once

#include <cstddef>
#include <string>

#include <boost/multiprecision/cpp_int.hpp>
#include <boost/rational.hpp>

namespace ratcalc {

// Без шаблонов выражений: boost::rational работает только со значениями
using BigInt = boost::multiprecision::number<boost::multiprecision::cpp_int_backend<>,
                                             boost::multiprecision::et_off>;
using Rational = boost::rational<BigInt>;

// Число знаков после запятой, до которых усекается приближённый корень.
// Корень, точно представимый дробью, вычисляется без потери точности.
constexpr std::size_t kRootPrecisionDigits = 50;

// Предельный модуль целого показателя степени
constexpr unsigned kMaxExponent = 10000;

// Предельная степень корня (и знаменатель дробного показателя)
constexpr unsigned kMaxRootDegree = 1000;

// Предельный размер числителя и знаменателя результата степени в битах
// (около 30000 десятичных цифр)
constexpr std::size_t kMaxResultBits = 100000;

// Точное рациональное число в несократимом виде.
// Знак хранится в числителе, знаменатель всегда положителен и не равен нулю.
// Флаг inexact означает, что значение получено усечением (например, корень из 2)
// и переходит на все числа, вычисленные из него.
class Number {
public:
    Number() = default;
    Number(long long integer);

    // Выбрасывает EvalError(DivisionByZero) при нулевом знаменателе
    Number(BigInt numerator, BigInt denominator, bool inexact = false);

    // Разбор десятичного литерала: "12", "12.5", ".5", "5."
    static Number fromLiteral(const std::string& text);

    const BigInt& numerator() const { return value.numerator(); }
    const BigInt& denominator() const { return value.denominator(); }

    bool inexact() const { return lossy; }
    bool isZero() const;
    bool isNegative() const;
    bool isInteger() const;

    Number operator-() const;
    Number operator+(const Number& other) const;
    Number operator-(const Number& other) const;
    Number operator*(const Number& other) const;
    Number operator/(const Number& other) const;

    // Возведение в степень. Целый показатель вычисляется точно,
    // дробный p/q допускается, только если корень степени q точен.
    Number pow(const Number& exponent) const;

    // Корень степени degree из this
    Number root(const Number& degree) const;

    // Равенство значения и флага точности
    bool operator==(const Number& other) const;
    bool operator!=(const Number& other) const { return !(*this == other); }

    // Порядок только по значению
    bool operator<(const Number& other) const { return value < other.value; }

    // Десятичная запись, усечённая до places знаков после запятой.
    // Многоточие добавляется, если запись неточна или была усечена.
    std::string toDecimalString(std::size_t places) const;

    // Запись в виде обыкновенной дроби: "-7/2"
    std::string toFractionString() const;

private:
    Rational value;
    bool lossy = false;

    static Number fromRational(const Rational& value, bool inexact);

    Number integerPow(const BigInt& exponent) const;
    Number positiveRoot(unsigned degree) const;
};

} // namespace ratcalc
