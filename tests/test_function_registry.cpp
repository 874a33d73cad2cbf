#include <catch2/catch.hpp>

#include "scicalc/function_registry.hpp"

#include <cmath>

using namespace scicalc;

namespace {
double call(const FunctionRegistry& functions, const std::string& name, const std::vector<double>& arguments) {
    const ScientificFunction* function = functions.get(name);
    REQUIRE(function != nullptr);
    return function->implementation(arguments);
}
}

TEST_CASE("Function lookup ignores case", "[functions]") {
    FunctionRegistry functions;

    REQUIRE(functions.get("SIN") != nullptr);
    CHECK(functions.get("SIN")->name == "sin");
    CHECK(functions.get("Log10") == functions.get("log10"));
    CHECK(functions.contains("stdev"));
    CHECK_FALSE(functions.contains("eval"));
    CHECK_FALSE(functions.contains("__import__"));
    CHECK(functions.get("") == nullptr);
}

TEST_CASE("Trigonometric functions work in degrees", "[functions]") {
    FunctionRegistry functions;

    CHECK(call(functions, "sin", {30.0}) == Approx(0.5));
    CHECK(call(functions, "cos", {60.0}) == Approx(0.5));
    CHECK(call(functions, "tan", {45.0}) == Approx(1.0));
    CHECK(call(functions, "asin", {1.0}) == Approx(90.0));
    CHECK(call(functions, "acos", {0.0}) == Approx(90.0));
    CHECK(call(functions, "atan", {1.0}) == Approx(45.0));

    const ParameterDomain* tanDomain = functions.get("tan")->parameterDomain(0);
    REQUIRE(tanDomain != nullptr);
    CHECK_FALSE(tanDomain->holds(90.0));
    CHECK_FALSE(tanDomain->holds(-270.0));
    CHECK(tanDomain->holds(180.0));

    const ParameterDomain* asinDomain = functions.get("asin")->parameterDomain(0);
    REQUIRE(asinDomain != nullptr);
    CHECK(asinDomain->constraint == "-1 <= x <= 1");
    CHECK_FALSE(asinDomain->holds(1.5));
}

TEST_CASE("Logarithms and exponentials", "[functions]") {
    FunctionRegistry functions;

    CHECK(call(functions, "log", {100.0}) == Approx(2.0));
    CHECK(call(functions, "log", {8.0, 2.0}) == Approx(3.0));
    CHECK(call(functions, "log10", {1000.0}) == Approx(3.0));
    CHECK(call(functions, "log2", {1024.0}) == Approx(10.0));
    CHECK(call(functions, "ln", {std::exp(2.0)}) == Approx(2.0));
    CHECK(call(functions, "exp", {0.0}) == Approx(1.0));
    CHECK(call(functions, "sqrt", {16.0}) == Approx(4.0));
    CHECK(call(functions, "pow", {2.0, 10.0}) == Approx(1024.0));

    const ScientificFunction* log = functions.get("log");
    CHECK(log->arity.min == 1);
    CHECK(log->arity.max == 2);
    CHECK(log->parameterDomain(0)->constraint == "x > 0");
    CHECK_FALSE(log->parameterDomain(0)->holds(-5.0));
    CHECK_FALSE(log->parameterDomain(1)->holds(1.0));
    CHECK(log->parameterDomain(2) == nullptr);

    CHECK_FALSE(functions.get("sqrt")->parameterDomain(0)->holds(-1.0));
    CHECK(functions.get("exp")->parameterDomain(0) == nullptr);
}

TEST_CASE("Power rules cover the whole argument list", "[functions]") {
    FunctionRegistry functions;
    const ScientificFunction* pow = functions.get("pow");
    REQUIRE(pow->argumentRules.size() == 2);

    auto violated = [pow](const std::vector<double>& arguments) {
        std::vector<std::string> constraints;
        for (const auto& rule : pow->argumentRules) {
            if (!rule.holds(arguments)) {
                constraints.push_back(rule.constraint);
            }
        }
        return constraints;
    };

    CHECK(violated({2.0, 3.0}).empty());
    CHECK(violated({-8.0, 3.0}).empty());
    CHECK(violated({0.0, -1.0}) == std::vector<std::string>{"base != 0 when exponent < 0"});
    CHECK(violated({-8.0, 0.5}) == std::vector<std::string>{"integer exponent when base < 0"});
}

TEST_CASE("Statistical functions", "[functions]") {
    FunctionRegistry functions;
    const std::vector<double> samples = {2.0, 4.0, 4.0, 4.0, 5.0, 5.0, 7.0, 9.0};

    CHECK(call(functions, "mean", samples) == Approx(5.0));
    CHECK(call(functions, "median", {3.0, 1.0, 2.0}) == Approx(2.0));
    CHECK(call(functions, "median", {4.0, 1.0, 3.0, 2.0}) == Approx(2.5));
    CHECK(call(functions, "mode", {1.0, 3.0, 3.0, 2.0, 2.0}) == Approx(3.0));
    CHECK(call(functions, "variance", samples) == Approx(32.0 / 7.0));
    CHECK(call(functions, "stdev", samples) == Approx(std::sqrt(32.0 / 7.0)));

    SECTION("Sample statistics need two values") {
        const ScientificFunction* stdev = functions.get("stdev");
        CHECK(stdev->arity.accepts(1));
        REQUIRE(stdev->argumentRules.size() == 1);
        CHECK(stdev->argumentRules[0].constraint == "at least two values");
        CHECK_FALSE(stdev->argumentRules[0].holds({5.0}));
        CHECK(stdev->argumentRules[0].holds({5.0, 6.0}));
    }

    SECTION("Variadic arity") {
        CHECK_FALSE(functions.get("mean")->arity.accepts(0));
        CHECK(functions.get("mean")->arity.accepts(100));
        CHECK(functions.get("mean")->arity.describe() == "at least 1");
    }
}

TEST_CASE("Function catalog is ordered and stable", "[functions][catalog]") {
    FunctionRegistry functions;
    FunctionCatalog catalog = functions.listByCategory();

    CHECK(catalog == functions.listByCategory());
    REQUIRE(catalog.size() == 4);
    CHECK(catalog.at("trigonometric") ==
          std::vector<std::string>{"sin", "cos", "tan", "asin", "acos", "atan"});
    CHECK(catalog.at("statistical") ==
          std::vector<std::string>{"mean", "median", "mode", "stdev", "variance"});
    CHECK(catalog.count("logarithmic") == 1);
    CHECK(catalog.count("exponential") == 1);

    auto descriptions = functions.describeAll();
    CHECK(descriptions.size() == functions.size());
    CHECK(descriptions.at("sqrt").find("Square root") != std::string::npos);
}
