#include <catch2/catch.hpp>

#include "errors.hpp"
#include "number.hpp"
#include "test_helpers.hpp"

using namespace ratcalc;
using ratcalc::test::errorKind;

TEST_CASE("Number keeps lowest terms", "[number]") {
    Number half(BigInt(2), BigInt(4));
    REQUIRE(half.numerator() == 1);
    REQUIRE(half.denominator() == 2);

    Number negative(BigInt(3), BigInt(-6));
    REQUIRE(negative.numerator() == -1);
    REQUIRE(negative.denominator() == 2);
    REQUIRE(negative.isNegative());

    REQUIRE(Number(BigInt(6), BigInt(3)).isInteger());
    REQUIRE(Number(0).isZero());
}

TEST_CASE("Number rejects zero denominator", "[number]") {
    REQUIRE(errorKind<EvalError>([] { Number(BigInt(1), BigInt(0)); }) == EvalError::Kind::DivisionByZero);
}

TEST_CASE("Number literals are exact", "[number]") {
    REQUIRE(Number::fromLiteral("12") == Number(12));
    REQUIRE(Number::fromLiteral("12.5") == Number(BigInt(25), BigInt(2)));
    REQUIRE(Number::fromLiteral(".5") == Number(BigInt(1), BigInt(2)));
    REQUIRE(Number::fromLiteral("5.") == Number(5));
    REQUIRE(Number::fromLiteral("007") == Number(7));
    REQUIRE(Number::fromLiteral("0.1") + Number::fromLiteral("0.2") == Number::fromLiteral("0.3"));

    REQUIRE_THROWS_AS(Number::fromLiteral("."), std::invalid_argument);
    REQUIRE_THROWS_AS(Number::fromLiteral("1.2.3"), std::invalid_argument);
}

TEST_CASE("Number arithmetic", "[number]") {
    Number third(BigInt(1), BigInt(3));

    SECTION("closed form operations") {
        REQUIRE(third + third + third == Number(1));
        REQUIRE(Number(1) - third == Number(BigInt(2), BigInt(3)));
        REQUIRE(third * Number(6) == Number(2));
        REQUIRE(Number(1) / Number(4) == Number(BigInt(1), BigInt(4)));
        REQUIRE(-third == Number(BigInt(-1), BigInt(3)));
    }

    SECTION("division by zero") {
        REQUIRE(errorKind<EvalError>([&] { third / Number(0); }) == EvalError::Kind::DivisionByZero);
    }

    SECTION("integers do not overflow") {
        Number big = Number(2).pow(Number(100));
        REQUIRE(big.toFractionString() == "1267650600228229401496703205376");
        REQUIRE((big * big).pow(Number(BigInt(1), BigInt(2))) == big);
    }
}

TEST_CASE("Number powers", "[number]") {
    SECTION("integer exponents") {
        REQUIRE(Number(2).pow(Number(10)) == Number(1024));
        REQUIRE(Number(2).pow(Number(-2)) == Number(BigInt(1), BigInt(4)));
        REQUIRE(Number(BigInt(-2), BigInt(3)).pow(Number(3)) == Number(BigInt(-8), BigInt(27)));
        REQUIRE(Number(0).pow(Number(0)) == Number(1));
    }

    SECTION("zero to a negative power") {
        REQUIRE(errorKind<EvalError>([] { Number(0).pow(Number(-1)); }) == EvalError::Kind::DivisionByZero);
    }

    SECTION("fractional exponents need an exact root") {
        REQUIRE(Number(4).pow(Number(BigInt(1), BigInt(2))) == Number(2));
        REQUIRE(Number(8).pow(Number(BigInt(2), BigInt(3))) == Number(4));
        REQUIRE(Number(-8).pow(Number(BigInt(1), BigInt(3))) == Number(-2));
        REQUIRE(errorKind<EvalError>([] { Number(2).pow(Number(BigInt(1), BigInt(2))); }) ==
                EvalError::Kind::InvalidExponent);
        REQUIRE(errorKind<EvalError>([] { Number(-4).pow(Number(BigInt(1), BigInt(2))); }) ==
                EvalError::Kind::ComplexResult);
    }

    SECTION("exponent limit") {
        REQUIRE(errorKind<EvalError>([] { Number(2).pow(Number(kMaxExponent + 1)); }) ==
                EvalError::Kind::InvalidExponent);
    }

    SECTION("result size limit") {
        const Number big = Number(10).pow(Number(1000));
        REQUIRE(errorKind<EvalError>([&] { big.pow(Number(kMaxExponent)); }) == EvalError::Kind::InvalidExponent);
        REQUIRE(errorKind<EvalError>([&] { big.pow(Number(-static_cast<long long>(kMaxExponent))); }) ==
                EvalError::Kind::InvalidExponent);

        const Number tiny = Number(1) / big;
        REQUIRE(errorKind<EvalError>([&] { tiny.pow(Number(kMaxExponent)); }) == EvalError::Kind::InvalidExponent);

        const Number largest = Number(2).pow(Number(kMaxExponent));
        REQUIRE(largest.numerator() == boost::multiprecision::pow(BigInt(2), kMaxExponent));
        REQUIRE(Number(-1).pow(Number(kMaxExponent)) == Number(1));
        REQUIRE(Number(0).pow(Number(kMaxExponent)) == Number(0));
    }
}

TEST_CASE("Number roots", "[number]") {
    SECTION("perfect powers are exact") {
        Number three = Number(9).root(Number(2));
        REQUIRE(three == Number(3));
        REQUIRE_FALSE(three.inexact());

        REQUIRE(Number(BigInt(8), BigInt(27)).root(Number(3)) == Number(BigInt(2), BigInt(3)));
        REQUIRE(Number(-27).root(Number(3)) == Number(-3));
        REQUIRE(Number(16).root(Number(-2)) == Number(BigInt(1), BigInt(4)));
        REQUIRE(Number(0).root(Number(5)) == Number(0));
    }

    SECTION("irrational roots are truncated and flagged") {
        Number root2 = Number(2).root(Number(2));
        REQUIRE(root2.inexact());
        REQUIRE(root2 * root2 < Number(2));
        REQUIRE(Number(2) - root2 * root2 < Number(BigInt(1), boost::multiprecision::pow(BigInt(10), 40)));
        REQUIRE(root2.toDecimalString(6) == "1.414213...");
    }

    SECTION("flag propagates") {
        Number root2 = Number(2).root(Number(2));
        REQUIRE((root2 + Number(1)).inexact());
        REQUIRE((Number(0) * root2).inexact());
    }

    SECTION("invalid degrees") {
        REQUIRE(errorKind<EvalError>([] { Number(4).root(Number(0)); }) == EvalError::Kind::InvalidExponent);
        REQUIRE(errorKind<EvalError>([] { Number(4).root(Number(BigInt(1), BigInt(2))); }) ==
                EvalError::Kind::InvalidExponent);
        REQUIRE(errorKind<EvalError>([] { Number(-4).root(Number(2)); }) == EvalError::Kind::ComplexResult);
    }
}

TEST_CASE("Number decimal display", "[number][display]") {
    REQUIRE(Number(42).toDecimalString(6) == "42");
    REQUIRE(Number(BigInt(7), BigInt(2)).toDecimalString(6) == "3.5");
    REQUIRE(Number(BigInt(-7), BigInt(2)).toDecimalString(6) == "-3.5");
    REQUIRE(Number(BigInt(-1), BigInt(4)).toDecimalString(6) == "-0.25");

    // Усечение без округления
    REQUIRE(Number(BigInt(2), BigInt(3)).toDecimalString(3) == "0.666...");
    REQUIRE(Number(BigInt(1), BigInt(3)).toDecimalString(6) == "0.333333...");
    REQUIRE(Number(BigInt(1), BigInt(3)).toDecimalString(0) == "0...");
    REQUIRE(Number(BigInt(1), BigInt(8)).toDecimalString(2) == "0.12...");
    REQUIRE(Number(BigInt(1), BigInt(8)).toDecimalString(3) == "0.125");

    REQUIRE(Number(BigInt(-7), BigInt(2)).toFractionString() == "-7/2");
    REQUIRE(Number(5).toFractionString() == "5");
}

TEST_CASE("Number equality includes the precision flag", "[number]") {
    Number exact(3);
    Number flagged = Number(BigInt(3), BigInt(1), true);
    REQUIRE(exact != flagged);
    REQUIRE_FALSE(exact < flagged);
    REQUIRE_FALSE(flagged < exact);
}
