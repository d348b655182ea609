#include <catch2/catch.hpp>

#include "calculator.hpp"
#include "errors.hpp"
#include "file_utils.hpp"
#include "test_helpers.hpp"

#include <fstream>

using namespace ratcalc;
using ratcalc::test::errorKind;
using ratcalc::test::TempDir;

TEST_CASE("Calculator evaluates and records entries", "[calculator]") {
    Calculator calculator;

    auto result = calculator.evaluate("2+3*4");
    REQUIRE(result.has_value());
    REQUIRE(result->value == Number(14));
    REQUIRE(result->text == "14");
    REQUIRE_FALSE(result->precisionLoss);

    auto entries = calculator.historyEntries();
    REQUIRE(entries.size() == 1);
    REQUIRE(entries[0].id == result->entryId);
    REQUIRE(entries[0].input == "2+3*4");
    REQUIRE(entries[0].result == Number(14));
}

TEST_CASE("Calculator ignores blank input", "[calculator]") {
    Calculator calculator;
    REQUIRE_FALSE(calculator.evaluate("").has_value());
    REQUIRE_FALSE(calculator.evaluate("  \t").has_value());
    REQUIRE(calculator.historyEntries().empty());
    REQUIRE(calculator.sessions().empty());
}

TEST_CASE("Calculator leaves state unchanged on errors", "[calculator]") {
    Calculator calculator;
    calculator.evaluate("x = 5");

    REQUIRE(errorKind<EvalError>([&] { calculator.evaluate("1/0"); }) == EvalError::Kind::DivisionByZero);
    REQUIRE(errorKind<EvalError>([&] { calculator.evaluate("x = 1/0"); }) == EvalError::Kind::DivisionByZero);
    REQUIRE(errorKind<ParseError>([&] { calculator.evaluate("(1"); }) == ParseError::Kind::UnmatchedParen);
    REQUIRE(errorKind<LexError>([&] { calculator.evaluate("1 # 2"); }) == LexError::Kind::UnrecognizedCharacter);
    REQUIRE_THROWS_AS(calculator.evaluate("y"), EngineError);

    REQUIRE(calculator.historyEntries().size() == 1);
    REQUIRE(calculator.variables() == VariableSnapshot{{"x", Number(5)}});
}

TEST_CASE("Calculator rejects oversized input without side effects", "[calculator][limits]") {
    Calculator calculator;
    calculator.evaluate("x = 2");

    std::string nested = std::string(100000, '(') + "x" + std::string(100000, ')');
    REQUIRE(errorKind<ParseError>([&] { calculator.evaluate(nested); }) == ParseError::Kind::NestingTooDeep);
    REQUIRE(errorKind<ParseError>([&] { calculator.evaluate("y = " + std::string(300000, '-') + "1"); })
        == ParseError::Kind::NestingTooDeep);
    REQUIRE(errorKind<EvalError>([&] { calculator.evaluate("(10^1000)^10000"); })
        == EvalError::Kind::InvalidExponent);

    REQUIRE(calculator.historyEntries().size() == 1);
    REQUIRE(calculator.variables() == VariableSnapshot{{"x", Number(2)}});
    REQUIRE(calculator.evaluate("x + 1")->value == Number(3));
}

TEST_CASE("Calculator variables", "[calculator]") {
    Calculator calculator;
    REQUIRE(calculator.evaluate("x = 5")->text == "5");
    REQUIRE(calculator.evaluate("x*2")->value == Number(10));
    REQUIRE(calculator.variables().count("x") == 1);

    REQUIRE(calculator.removeVariable("x"));
    REQUIRE_FALSE(calculator.removeVariable("x"));
    REQUIRE(errorKind<EvalError>([&] { calculator.evaluate("x"); }) == EvalError::Kind::UndefinedVariable);
}

TEST_CASE("Calculator display follows decimal places", "[calculator][display]") {
    SECTION("default six places") {
        Calculator calculator;
        auto result = calculator.evaluate("sqrt(2)");
        REQUIRE(result->text == "1.414213...");
        REQUIRE(result->precisionLoss);
        REQUIRE(calculator.historyEntries().back().precisionLoss);

        REQUIRE(calculator.evaluate("1/3")->text == "0.333333...");
        REQUIRE_FALSE(calculator.evaluate("1/3")->precisionLoss);
        REQUIRE(calculator.evaluate("sqrt(9)")->text == "3");
    }

    SECTION("configured places") {
        Settings settings;
        settings.decimalPlaces = 2;
        Calculator calculator(settings);
        REQUIRE(calculator.evaluate("2/3")->text == "0.66...");
        REQUIRE(calculator.evaluate("1/4")->text == "0.25");
    }
}

TEST_CASE("Calculator reinsert returns the original text", "[calculator]") {
    Calculator calculator;
    std::string id = calculator.evaluate("  total = 2 * (3 + 4)")->entryId;
    calculator.evaluate("total = 0");
    calculator.evaluate("total + 1");

    REQUIRE(calculator.reinsert(id) == std::string("  total = 2 * (3 + 4)"));
    REQUIRE_FALSE(calculator.reinsert("no-such-entry").has_value());
    REQUIRE(calculator.historyEntries().size() == 3);
}

TEST_CASE("Calculator persists history across runs", "[calculator]") {
    TempDir dir;
    auto path = dir / "history.bin";

    std::string firstSession;
    {
        Calculator calculator;
        REQUIRE_FALSE(calculator.open(path).has_value());
        calculator.evaluate("x = 5");
        calculator.evaluate("x * 2");
        calculator.save();
        firstSession = calculator.sessions().back().id;
    }

    Calculator calculator;
    REQUIRE_FALSE(calculator.open(path).has_value());
    REQUIRE(calculator.sessions().size() == 1);
    REQUIRE(calculator.variables() == VariableSnapshot{{"x", Number(5)}});
    REQUIRE(calculator.evaluate("x + 1")->value == Number(6));

    REQUIRE(calculator.sessions().size() == 2);
    REQUIRE(calculator.historyEntries(firstSession).size() == 2);
    REQUIRE(calculator.historyEntries(calculator.sessions().back().id).size() == 1);
    REQUIRE(calculator.historyEntries().size() == 3);
    REQUIRE(calculator.historyEntries(std::string("unknown")).empty());
}

TEST_CASE("Calculator recovers from a damaged history file", "[calculator]") {
    TempDir dir;
    auto path = dir / "history.bin";
    {
        std::ofstream output(path, std::ios::binary);
        output << "definitely not a history file";
    }

    Calculator calculator;
    auto error = calculator.open(path);
    REQUIRE(error.has_value());
    REQUIRE(calculator.sessions().empty());

    REQUIRE(calculator.evaluate("1+1")->value == Number(2));
    calculator.save();

    Calculator reopened;
    REQUIRE_FALSE(reopened.open(path).has_value());
    REQUIRE(reopened.historyEntries().size() == 1);
}

TEST_CASE("Calculator checkpoints after the autosave interval", "[calculator]") {
    TempDir dir;
    auto path = dir / "history.bin";

    Settings settings;
    settings.autosaveInterval = 2;
    Calculator calculator(settings);
    calculator.open(path);

    calculator.evaluate("1");
    REQUIRE_FALSE(calculator.checkpoint());
    REQUIRE_FALSE(std::filesystem::exists(path));

    calculator.evaluate("2");
    REQUIRE(calculator.checkpoint());
    REQUIRE(std::filesystem::exists(path));
    REQUIRE(calculator.unsavedEntries() == 0);
}

TEST_CASE("Calculator save failures keep the state", "[calculator]") {
    TempDir dir;
    // Путь, где вместо директории лежит обычный файл
    auto blocker = dir / "blocker";
    {
        std::ofstream output(blocker);
        output << "x";
    }

    Calculator calculator;
    calculator.open(blocker / "history.bin");
    calculator.evaluate("7");

    REQUIRE(errorKind<SaveError>([&] { calculator.save(); }) == SaveError::Kind::Io);
    REQUIRE(calculator.historyEntries().size() == 1);
    REQUIRE(calculator.unsavedEntries() == 1);
}

TEST_CASE("Calculator without a history file cannot save", "[calculator]") {
    Calculator calculator;
    calculator.evaluate("1");
    REQUIRE_THROWS_AS(calculator.save(), SaveError);
    REQUIRE_FALSE(calculator.checkpoint());
}
