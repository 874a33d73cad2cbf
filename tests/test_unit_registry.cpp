#include <catch2/catch.hpp>

#include "scicalc/errors.hpp"
#include "scicalc/unit_registry.hpp"

using namespace scicalc;

TEST_CASE("Unit lookup by symbol, name and alias", "[units]") {
    UnitRegistry units;

    REQUIRE(units.lookup("km") != nullptr);
    CHECK(units.lookup("km")->name == "kilometer");
    CHECK(units.lookup("kilometer") == units.lookup("km"));
    CHECK(units.lookup("kilometre") == units.lookup("km"));
    CHECK(units.lookup("mile")->symbol == "mi");
    CHECK(units.lookup("nope") == nullptr);
    CHECK(units.lookup("") == nullptr);

    SECTION("Exact match wins over case-insensitive match") {
        CHECK(units.lookup("T")->name == "tesla");
        CHECK(units.lookup("t")->name == "tonne");
        CHECK(units.lookup("Kilometer")->symbol == "km");
        CHECK(units.lookup("CELSIUS")->symbol == "degC");
        CHECK(units.lookup("Bar")->symbol == "bar");
    }

    SECTION("Prefixed symbols are case-sensitive") {
        CHECK(units.lookup("Mg") == nullptr);
        CHECK(units.lookup("MM") == nullptr);
        CHECK(units.lookup("MA") == nullptr);
        CHECK(units.lookup("mhz") == nullptr);
        CHECK(units.lookup("KM") == nullptr);
        CHECK(units.lookup("mg")->name == "milligram");
        CHECK(units.lookup("MHz")->name == "megahertz");
    }

    SECTION("Ton is the metric tonne") {
        CHECK(units.lookup("ton") == units.lookup("tonne"));
        CHECK(units.lookup("tons") == units.lookup("t"));
        CHECK(units.convert(1000.0, "kilogram", "ton") == Approx(1.0));
        CHECK(units.convert(2.5, "ton", "kg") == Approx(2500.0));
        CHECK(units.compatible("ton", "pound"));
    }

    SECTION("Temperature spellings") {
        for (const char* name : {"celsius", "C", "c", "degC"}) {
            CHECK(units.lookup(name)->symbol == "degC");
        }
        for (const char* name : {"fahrenheit", "F", "f", "degF"}) {
            CHECK(units.lookup(name)->symbol == "degF");
        }
        for (const char* name : {"kelvin", "K", "k"}) {
            CHECK(units.lookup(name)->symbol == "K");
        }
        CHECK(units.lookup("rankine")->symbol == "degR");
    }
}

TEST_CASE("Linear conversions", "[units][convert]") {
    UnitRegistry units;

    CHECK(units.convert(5.0, "km", "mi") == Approx(3.10685596118667));
    CHECK(units.convert(1.0, "mi", "ft") == Approx(5280.0));
    CHECK(units.convert(1.0, "lb", "g") == Approx(453.59237));
    CHECK(units.convert(2.0, "h", "s") == Approx(7200.0));
    CHECK(units.convert(1.0, "kWh", "J") == Approx(3.6e6));
    CHECK(units.convert(1.0, "atm", "Pa") == Approx(101325.0));
    CHECK(units.convert(1.0, "T", "G") == Approx(1e4));
}

TEST_CASE("Temperature conversions use offsets", "[units][convert]") {
    UnitRegistry units;

    CHECK(units.convert(100.0, "degC", "degF") == Approx(212.0));
    CHECK(units.convert(32.0, "degF", "degC") == Approx(0.0).margin(1e-9));
    CHECK(units.convert(0.0, "degC", "K") == Approx(273.15));
    CHECK(units.convert(0.0, "K", "degF") == Approx(-459.67));
    CHECK(units.convert(491.67, "degR", "degC") == Approx(0.0).margin(1e-9));
}

TEST_CASE("Round trip conversion restores the value", "[units][convert]") {
    UnitRegistry units;
    const std::vector<std::pair<std::string, std::string>> pairs = {
        {"km", "mi"}, {"g", "lb"}, {"min", "wk"}, {"degC", "degF"}, {"K", "degC"}, {"gal", "mL"}, {"psi", "bar"},
        {"hp", "kW"}, {"kn", "mph"},
    };

    for (const auto& [from, to] : pairs) {
        for (double value : {-40.0, 0.5, 37.0, 12345.678}) {
            double there = units.convert(value, from, to);
            double back = units.convert(there, to, from);
            INFO(from << " -> " << to << " -> " << from << " for " << value);
            CHECK(back == Approx(value).epsilon(1e-9));
        }
    }
}

TEST_CASE("Incompatible and unknown units", "[units][errors]") {
    UnitRegistry units;

    REQUIRE_THROWS_AS(units.convert(1.0, "km", "kg"), DimensionalityError);
    REQUIRE_THROWS_AS(units.convert(1.0, "degC", "m"), DimensionalityError);
    REQUIRE_THROWS_AS(units.convert(1.0, "parsec", "m"), EvaluationError);
    REQUIRE_THROWS_WITH(units.convert(1.0, "m", "furlong"), Catch::Contains("unknown unit 'furlong'"));

    try {
        units.convert(1.0, "km", "s");
        FAIL("expected DimensionalityError");
    }
    catch (const DimensionalityError& e) {
        CHECK(e.kind() == ErrorKind::Dimensionality);
        CHECK(e.context().count("from_unit") == 1);
        CHECK(e.context().count("to_unit") == 1);
        CHECK(e.context().at("from_dimension") == "m");
        CHECK(e.context().at("to_dimension") == "s");
    }
}

TEST_CASE("Compatibility and conversion factors", "[units]") {
    UnitRegistry units;

    CHECK(units.compatible("N", "lbf"));
    CHECK(units.compatible("degC", "K"));
    CHECK_FALSE(units.compatible("m", "s"));
    REQUIRE_THROWS_AS(units.compatible("m", "parsec"), EvaluationError);

    CHECK(units.conversionFactor("km", "m") == Approx(1000.0));
    CHECK(units.conversionFactor("m", "km") == Approx(1e-3));
    REQUIRE_THROWS_AS(units.conversionFactor("degC", "K"), EvaluationError);
    REQUIRE_THROWS_AS(units.conversionFactor("m", "kg"), DimensionalityError);
}

TEST_CASE("Coherent units for derived dimensions", "[units]") {
    UnitRegistry units;

    Dimension force = Dimension::of(BaseDimension::Mass) * Dimension::of(BaseDimension::Length) /
                      Dimension::of(BaseDimension::Time, 2);
    REQUIRE(units.coherentUnit(force) != nullptr);
    CHECK(units.coherentUnit(force)->symbol == "N");
    CHECK(units.coherentUnit(Dimension::of(BaseDimension::Length))->symbol == "m");
    CHECK(units.coherentUnit(Dimension::of(BaseDimension::Temperature))->symbol == "K");
    CHECK(units.coherentUnit(Dimension::of(BaseDimension::Length, 3)) == nullptr);
}

TEST_CASE("Unit catalog is ordered and stable", "[units][catalog]") {
    UnitRegistry units;
    UnitCatalog first = units.listByCategory();
    UnitCatalog second = units.listByCategory();

    CHECK(first == second);
    CHECK(units.size() >= 70);
    for (const char* category : {"distance", "area", "volume", "mass", "time", "temperature", "velocity",
                                 "frequency", "force", "pressure", "energy", "power", "electrical",
                                 "magnetic_flux", "magnetic_flux_density"}) {
        INFO(category);
        CHECK(first.count(category) == 1);
    }
    CHECK(first.begin()->first == "area");
    CHECK(first.at("distance").front() == "m");
    CHECK(first.at("temperature") == std::vector<std::string>{"K", "degC", "degF", "degR"});
}
