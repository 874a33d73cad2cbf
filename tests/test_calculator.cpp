#include <catch2/catch.hpp>

#include "scicalc/calculator.hpp"
#include "scicalc/commands.hpp"

using namespace scicalc;

TEST_CASE("Successful evaluation envelope", "[calculator]") {
    Calculator calculator;

    CalculationResult plain = calculator.evaluate("2 + 2");
    REQUIRE(plain.ok());
    CHECK(*plain.value == Approx(4.0));
    CHECK(plain.unit.empty());

    SECTION("Scientific functions") {
        CalculationResult result = calculator.evaluate("sin(30) * 2 + 5");
        REQUIRE(result.ok());
        CHECK(*result.value == Approx(6.0));
        CHECK(result.unit.empty());
    }

    SECTION("Unit conversion") {
        CalculationResult result = calculator.evaluate("5 kilometer to mile");
        REQUIRE(result.ok());
        CHECK(*result.value == Approx(3.10685596118667));
        CHECK(result.unit == "mi");
    }

    SECTION("Quantity without conversion reports its unit") {
        CalculationResult result = calculator.evaluate("2 km + 300 m");
        REQUIRE(result.ok());
        CHECK(result.unit == "km");
    }
}

TEST_CASE("Error envelopes carry kind and context", "[calculator][errors]") {
    Calculator calculator;

    SECTION("Domain") {
        CalculationResult result = calculator.evaluate("log(-5)");
        REQUIRE_FALSE(result.ok());
        CHECK_FALSE(result.value.has_value());
        CHECK(result.error->kind == ErrorKind::Domain);
        CHECK(result.error->context.at("value") == "-5");
        CHECK(result.error->context.at("constraint") == "x > 0");
    }

    SECTION("Dimensionality") {
        CalculationResult result = calculator.evaluate("5 * meter + 3 * second");
        REQUIRE_FALSE(result.ok());
        CHECK(result.error->kind == ErrorKind::Dimensionality);
    }

    SECTION("Syntax") {
        CalculationResult result = calculator.evaluate("2 +");
        REQUIRE_FALSE(result.ok());
        CHECK(result.error->kind == ErrorKind::Syntax);
        CHECK(result.error->context.at("position") == "3");
    }

    SECTION("Evaluation") {
        CalculationResult result = calculator.evaluate("x");
        REQUIRE_FALSE(result.ok());
        CHECK(result.error->kind == ErrorKind::Evaluation);
        CHECK(result.error->message == "unknown identifier 'x'");
        CHECK_FALSE(result.error->hint.empty());
    }

    SECTION("Wrong-case prefixed symbols are unknown") {
        for (const char* text : {"1 Mg to g", "1 MM to m", "1 MA to A", "1 mhz to Hz"}) {
            CalculationResult result = calculator.evaluate(text);
            INFO(text);
            REQUIRE_FALSE(result.ok());
            CHECK(result.error->kind == ErrorKind::Evaluation);
            CHECK(result.error->message.rfind("unknown identifier", 0) == 0);
        }
    }

    SECTION("Hostile input is rejected as syntax") {
        for (const char* text : {"__import__('os')", "a; b", "1 $ 2", "`rm`"}) {
            CalculationResult result = calculator.evaluate(text);
            INFO(text);
            REQUIRE_FALSE(result.ok());
            CHECK(result.error->kind == ErrorKind::Syntax);
        }
    }
}

TEST_CASE("Expression length boundary", "[calculator][limits]") {
    Calculator calculator;
    std::string atLimit = "1" + std::string(999, ' ');

    CalculationResult accepted = calculator.evaluate(atLimit);
    REQUIRE(accepted.ok());
    CHECK(*accepted.value == Approx(1.0));

    CalculationResult rejected = calculator.evaluate(atLimit + " ");
    REQUIRE_FALSE(rejected.ok());
    CHECK(rejected.error->kind == ErrorKind::Syntax);
    CHECK(rejected.error->message.find("exceeds maximum length") != std::string::npos);
}

TEST_CASE("Direct conversion", "[calculator][convert]") {
    Calculator calculator;

    CalculationResult miles = calculator.convert(5.0, "km", "mi");
    REQUIRE(miles.ok());
    CHECK(*miles.value == Approx(3.10685596118667));
    CHECK(miles.unit == "mi");

    CalculationResult byName = calculator.convert(5.0, "kilometer", "mile");
    REQUIRE(byName.ok());
    CHECK(*byName.value == Approx(3.10686).margin(1e-5));

    CalculationResult tons = calculator.convert(1000.0, "kilogram", "ton");
    REQUIRE(tons.ok());
    CHECK(*tons.value == Approx(1.0));
    CHECK(tons.unit == "t");

    CalculationResult fahrenheit = calculator.convert(100.0, "celsius", "fahrenheit");
    REQUIRE(fahrenheit.ok());
    CHECK(*fahrenheit.value == Approx(212.0));
    CHECK(fahrenheit.unit == "degF");

    CalculationResult incompatible = calculator.convert(1.0, "km", "kg");
    REQUIRE_FALSE(incompatible.ok());
    CHECK(incompatible.error->kind == ErrorKind::Dimensionality);

    CalculationResult unknown = calculator.convert(1.0, "parsec", "m");
    REQUIRE_FALSE(unknown.ok());
    CHECK(unknown.error->kind == ErrorKind::Evaluation);
    CHECK(unknown.error->context.at("unit") == "parsec");
}

TEST_CASE("Catalog listings are pure", "[calculator][catalog]") {
    Calculator calculator;

    CHECK(calculator.listUnits() == calculator.listUnits());
    CHECK(calculator.listFunctions() == calculator.listFunctions());
    CHECK(calculator.listUnits().count("temperature") == 1);
    CHECK(calculator.listFunctions().count("statistical") == 1);

    // Вычисления не меняют каталоги
    UnitCatalog before = calculator.listUnits();
    calculator.evaluate("5 km to mi");
    calculator.evaluate("log(-5)");
    CHECK(calculator.listUnits() == before);
}

TEST_CASE("Direct function evaluation", "[calculator][functions]") {
    Calculator calculator;

    CalculationResult log = calculator.evaluateFunction("log", {8.0, 2.0});
    REQUIRE(log.ok());
    CHECK(*log.value == Approx(3.0));

    CHECK(*calculator.evaluateFunction("MEAN", {1.0, 2.0, 6.0}).value == Approx(3.0));
    CHECK(*calculator.evaluateFunction("sqrt", {-0.0}).value == Approx(0.0));

    CalculationResult stdev = calculator.evaluateFunction("stdev", {5.0});
    REQUIRE_FALSE(stdev.ok());
    CHECK(stdev.error->kind == ErrorKind::Domain);

    CalculationResult unknown = calculator.evaluateFunction("eval", {1.0});
    REQUIRE_FALSE(unknown.ok());
    CHECK(unknown.error->kind == ErrorKind::Evaluation);

    CalculationResult arity = calculator.evaluateFunction("sqrt", {});
    REQUIRE_FALSE(arity.ok());
    CHECK(arity.error->kind == ErrorKind::Evaluation);
}

TEST_CASE("Results are rendered for the command line", "[calculator][cli]") {
    Calculator calculator;

    CHECK(formatResult(calculator.evaluate("2 + 2")) == "4");
    CHECK(formatResult(calculator.evaluate("3 km * 2")) == "6 km");
    CHECK(formatResult(calculator.evaluate("x")) ==
          "evaluation: unknown identifier 'x' (identifier: x | position: 0)");
}
