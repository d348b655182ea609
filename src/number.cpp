#include "number.hpp"

#include "errors.hpp"

#include <cctype>
#include <cmath>
#include <stdexcept>
#include <utility>

namespace ratcalc {

namespace {

// Число значащих бит модуля, у нуля 0
std::size_t bitLength(const BigInt& x) {
    if (x == 0) {
        return 0;
    }
    return boost::multiprecision::msb(boost::multiprecision::abs(x)) + 1;
}

// Начальное приближение корня степени degree из radicand (radicand >= 2).
// Берётся с избытком, чтобы итерации Ньютона сходились сверху.
BigInt initialRootGuess(const BigInt& radicand, unsigned degree) {
    const unsigned bits = boost::multiprecision::msb(radicand) + 1;
    const unsigned shift = bits > 53 ? bits - 53 : 0;
    const double mantissa = BigInt(radicand >> shift).convert_to<double>();
    const double rootLog = (std::log2(mantissa) + shift) / degree;

    if (rootLog < 60.0) {
        return BigInt(static_cast<unsigned long long>(std::ceil(std::exp2(rootLog)))) + 1;
    }

    const unsigned whole = static_cast<unsigned>(rootLog);
    const double fraction = rootLog - whole;
    BigInt guess = BigInt(static_cast<unsigned long long>(std::exp2(fraction + 52.0))) << (whole - 52);
    // Погрешность double не превышает 2^-34, запас 2^-30 покрывает её
    guess += (guess >> 30) + 1;
    return guess;
}

// Целая часть корня степени degree из неотрицательного radicand
BigInt integerRoot(const BigInt& radicand, unsigned degree) {
    if (radicand < 2 || degree == 1) {
        return radicand;
    }

    BigInt current = initialRootGuess(radicand, degree);
    while (true) {
        BigInt next = (BigInt(degree - 1) * current +
                       radicand / boost::multiprecision::pow(current, degree - 1)) / degree;
        if (next >= current) {
            break;
        }
        current = std::move(next);
    }

    while (boost::multiprecision::pow(current, degree) > radicand) {
        --current;
    }
    while (boost::multiprecision::pow(BigInt(current + 1), degree) <= radicand) {
        ++current;
    }
    return current;
}

bool perfectRoot(const BigInt& radicand, unsigned degree, BigInt& result) {
    result = integerRoot(radicand, degree);
    return boost::multiprecision::pow(result, degree) == radicand;
}

// Точный корень из неотрицательной несократимой дроби существует,
// только если и числитель, и знаменатель являются точными степенями
bool exactRoot(const Rational& magnitude, unsigned degree, Rational& result) {
    BigInt top;
    BigInt bottom;
    if (!perfectRoot(magnitude.numerator(), degree, top) ||
        !perfectRoot(magnitude.denominator(), degree, bottom)) {
        return false;
    }
    result = Rational(top, bottom);
    return true;
}

} // namespace

Number::Number(long long integer) : value(BigInt(integer)) {}

Number::Number(BigInt numerator, BigInt denominator, bool inexact) : lossy(inexact) {
    if (denominator == 0) {
        throw EvalError(EvalError::Kind::DivisionByZero);
    }
    value = Rational(std::move(numerator), std::move(denominator));
}

Number Number::fromRational(const Rational& value, bool inexact) {
    Number number;
    number.value = value;
    number.lossy = inexact;
    return number;
}

// Литерал переводится в дробь без округления: "12.5" -> 125/10 -> 25/2
Number Number::fromLiteral(const std::string& text) {
    BigInt numerator = 0;
    BigInt denominator = 1;
    bool hasDot = false;
    bool hasDigit = false;

    for (char ch : text) {
        if (ch == '.') {
            if (hasDot) {
                throw std::invalid_argument("Некорректный числовой литерал: " + text);
            }
            hasDot = true;
            continue;
        }
        if (!std::isdigit(static_cast<unsigned char>(ch))) {
            throw std::invalid_argument("Некорректный числовой литерал: " + text);
        }
        numerator = numerator * 10 + (ch - '0');
        if (hasDot) {
            denominator *= 10;
        }
        hasDigit = true;
    }

    if (!hasDigit) {
        throw std::invalid_argument("Некорректный числовой литерал: " + text);
    }
    return Number(std::move(numerator), std::move(denominator));
}

bool Number::isZero() const {
    return numerator() == 0;
}

bool Number::isNegative() const {
    return numerator() < 0;
}

bool Number::isInteger() const {
    return denominator() == 1;
}

Number Number::operator-() const {
    return fromRational(-value, lossy);
}

Number Number::operator+(const Number& other) const {
    return fromRational(value + other.value, lossy || other.lossy);
}

Number Number::operator-(const Number& other) const {
    return fromRational(value - other.value, lossy || other.lossy);
}

Number Number::operator*(const Number& other) const {
    return fromRational(value * other.value, lossy || other.lossy);
}

Number Number::operator/(const Number& other) const {
    if (other.isZero()) {
        throw EvalError(EvalError::Kind::DivisionByZero);
    }
    return fromRational(value / other.value, lossy || other.lossy);
}

// Целая степень: отрицательный показатель даёт обратную величину, 0^0 = 1
Number Number::integerPow(const BigInt& exponent) const {
    if (exponent > kMaxExponent || exponent < -static_cast<long long>(kMaxExponent)) {
        throw EvalError(EvalError::Kind::InvalidExponent);
    }

    Rational base = value;
    if (exponent < 0) {
        if (isZero()) {
            throw EvalError(EvalError::Kind::DivisionByZero);
        }
        base = Rational(value.denominator(), value.numerator());
    }

    const unsigned power = BigInt(boost::multiprecision::abs(exponent)).convert_to<unsigned>();
    // Длина x^n не превышает n * bits(x), слишком длинный результат отвергается до вычисления
    if (bitLength(base.numerator()) * power > kMaxResultBits
        || bitLength(base.denominator()) * power > kMaxResultBits) {
        throw EvalError(EvalError::Kind::InvalidExponent);
    }
    return fromRational(Rational(boost::multiprecision::pow(base.numerator(), power),
                                 boost::multiprecision::pow(base.denominator(), power)),
                        lossy);
}

Number Number::pow(const Number& exponent) const {
    const bool carried = lossy || exponent.lossy;

    if (exponent.isInteger()) {
        Number result = integerPow(exponent.numerator());
        result.lossy = carried;
        return result;
    }

    // Дробный показатель p/q: сначала корень степени q, затем степень p
    if (exponent.denominator() > kMaxRootDegree) {
        throw EvalError(EvalError::Kind::InvalidExponent);
    }
    const unsigned degree = exponent.denominator().convert_to<unsigned>();
    if (isNegative() && degree % 2 == 0) {
        throw EvalError(EvalError::Kind::ComplexResult);
    }

    Rational base;
    if (!exactRoot(isNegative() ? -value : value, degree, base)) {
        throw EvalError(EvalError::Kind::InvalidExponent);
    }
    if (isNegative()) {
        base = -base;
    }

    Number result = fromRational(base, carried).integerPow(exponent.numerator());
    result.lossy = carried;
    return result;
}

Number Number::root(const Number& degree) const {
    if (!degree.isInteger() || degree.isZero()) {
        throw EvalError(EvalError::Kind::InvalidExponent);
    }

    BigInt order = degree.numerator();
    const bool reciprocal = order < 0;
    if (reciprocal) {
        order = -order;
    }
    if (order > kMaxRootDegree) {
        throw EvalError(EvalError::Kind::InvalidExponent);
    }

    const unsigned n = order.convert_to<unsigned>();
    if (isNegative() && n % 2 == 0) {
        throw EvalError(EvalError::Kind::ComplexResult);
    }

    Number result = isNegative() ? -(-*this).positiveRoot(n) : positiveRoot(n);
    result.lossy = result.lossy || degree.lossy;
    if (reciprocal) {
        result = Number(1) / result;
    }
    return result;
}

// Корень из неотрицательного числа. Если точного корня нет, результат
// усекается до kRootPrecisionDigits знаков и помечается как неточный.
Number Number::positiveRoot(unsigned degree) const {
    if (degree == 1) {
        return *this;
    }

    Rational exact;
    if (exactRoot(value, degree, exact)) {
        return fromRational(exact, lossy);
    }

    const BigInt scale = boost::multiprecision::pow(BigInt(10), kRootPrecisionDigits);
    const BigInt scaled = numerator() * boost::multiprecision::pow(scale, degree) / denominator();
    return fromRational(Rational(integerRoot(scaled, degree), scale), true);
}

bool Number::operator==(const Number& other) const {
    return value == other.value && lossy == other.lossy;
}

std::string Number::toDecimalString(std::size_t places) const {
    std::string text;
    if (isNegative()) {
        text += '-';
    }

    const BigInt magnitude = boost::multiprecision::abs(numerator());
    const BigInt& divisor = denominator();
    BigInt remainder = magnitude % divisor;
    text += BigInt(magnitude / divisor).str();

    // Деление столбиком, цифры после запятой не округляются
    std::string digits;
    while (digits.size() < places && remainder != 0) {
        remainder *= 10;
        digits += static_cast<char>('0' + BigInt(remainder / divisor).convert_to<int>());
        remainder %= divisor;
    }

    if (!digits.empty()) {
        text += '.';
        text += digits;
    }
    if (remainder != 0 || lossy) {
        text += "...";
    }
    return text;
}

std::string Number::toFractionString() const {
    if (isInteger()) {
        return numerator().str();
    }
    return numerator().str() + "/" + denominator().str();
}

} // namespace ratcalc
