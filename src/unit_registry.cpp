#include "scicalc/unit_registry.hpp"

#include "scicalc/errors.hpp"

#include <algorithm>
#include <cctype>

namespace scicalc {

namespace {
const Dimension kLength = Dimension::of(BaseDimension::Length);
const Dimension kMass = Dimension::of(BaseDimension::Mass);
const Dimension kTime = Dimension::of(BaseDimension::Time);
const Dimension kTemperature = Dimension::of(BaseDimension::Temperature);
const Dimension kCurrent = Dimension::of(BaseDimension::Current);

Dimension power(const Dimension& dimension, int exponent) {
    Dimension result;
    for (std::size_t i = 0; i < kBaseDimensionCount; ++i) {
        result.exponents[i] = dimension.exponents[i] * exponent;
    }
    return result;
}

std::string toLower(std::string_view text) {
    std::string result(text);
    for (char& ch : result) {
        ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    }
    return result;
}

// Без учёта регистра ищутся только слова: "Kilometer", "CELSIUS".
// Символы с приставками СИ (mg и Mg, mm и MM) различаются только регистром.
bool isWord(const std::string& key) {
    return key.size() >= 3 &&
           std::all_of(key.begin(), key.end(), [](unsigned char ch) { return std::isalpha(ch) != 0; });
}

std::string describe(const Dimension& dimension) {
    return dimension.isDimensionless() ? "dimensionless" : dimension.toString();
}
}

UnitRegistry::UnitRegistry() {
    registerDefaults();
    buildIndex();
}

void UnitRegistry::add(const std::string& category, const std::string& symbol, const std::string& name,
                       const Dimension& dimension, double factor, std::vector<std::string> aliases,
                       double offset) {
    units.push_back(Unit{symbol, name, category, dimension, ConversionRule{factor, offset}, std::move(aliases)});
}

// Полный каталог единиц. Множители заданы относительно когерентных единиц СИ.
void UnitRegistry::registerDefaults() {
    const Dimension area = power(kLength, 2);
    const Dimension volume = power(kLength, 3);
    const Dimension velocity = kLength / kTime;
    const Dimension frequency = power(kTime, -1);
    const Dimension force = kMass * kLength / power(kTime, 2);
    const Dimension pressure = force / area;
    const Dimension energy = force * kLength;
    const Dimension powerDim = energy / kTime;
    const Dimension voltage = powerDim / kCurrent;
    const Dimension resistance = voltage / kCurrent;
    const Dimension magneticFlux = energy / kCurrent;
    const Dimension fluxDensity = magneticFlux / area;

    // Расстояние
    add("distance", "m", "meter", kLength, 1.0, {"metre", "meters", "metres"});
    add("distance", "km", "kilometer", kLength, 1e3, {"kilometre", "kilometers", "kilometres"});
    add("distance", "cm", "centimeter", kLength, 1e-2, {"centimetre", "centimeters"});
    add("distance", "mm", "millimeter", kLength, 1e-3, {"millimetre", "millimeters"});
    add("distance", "um", "micrometer", kLength, 1e-6, {"micron", "micrometre"});
    add("distance", "nm", "nanometer", kLength, 1e-9, {"nanometre"});
    add("distance", "in", "inch", kLength, 0.0254, {"inches"});
    add("distance", "ft", "foot", kLength, 0.3048, {"feet"});
    add("distance", "yd", "yard", kLength, 0.9144, {"yards"});
    add("distance", "mi", "mile", kLength, 1609.344, {"miles"});
    add("distance", "nmi", "nauticalmile", kLength, 1852.0);

    // Площадь
    add("area", "ha", "hectare", area, 1e4, {"hectares"});
    add("area", "acre", "acre", area, 4046.8564224, {"acres"});

    // Объём
    add("volume", "L", "liter", volume, 1e-3, {"l", "litre", "liters", "litres"});
    add("volume", "mL", "milliliter", volume, 1e-6, {"ml", "millilitre", "milliliters"});
    add("volume", "gal", "gallon", volume, 3.785411784e-3, {"gallons"});
    add("volume", "qt", "quart", volume, 9.46352946e-4, {"quarts"});
    add("volume", "pt", "pint", volume, 4.73176473e-4, {"pints"});
    add("volume", "cup", "cup", volume, 2.365882365e-4, {"cups"});
    add("volume", "floz", "fluidounce", volume, 2.95735295625e-5);
    add("volume", "tbsp", "tablespoon", volume, 1.478676478125e-5);
    add("volume", "tsp", "teaspoon", volume, 4.92892159375e-6);

    // Масса
    add("mass", "kg", "kilogram", kMass, 1.0, {"kilograms"});
    add("mass", "g", "gram", kMass, 1e-3, {"grams"});
    add("mass", "mg", "milligram", kMass, 1e-6, {"milligrams"});
    add("mass", "t", "tonne", kMass, 1e3, {"metricton", "tonnes", "ton", "tons"});
    add("mass", "lb", "pound", kMass, 0.45359237, {"lbs", "pounds"});
    add("mass", "oz", "ounce", kMass, 0.028349523125, {"ounces"});
    add("mass", "st", "stone", kMass, 6.35029318);

    // Время
    add("time", "s", "second", kTime, 1.0, {"sec", "seconds"});
    add("time", "ms", "millisecond", kTime, 1e-3, {"milliseconds"});
    add("time", "min", "minute", kTime, 60.0, {"minutes"});
    add("time", "h", "hour", kTime, 3600.0, {"hr", "hours"});
    add("time", "d", "day", kTime, 86400.0, {"days"});
    add("time", "wk", "week", kTime, 604800.0, {"weeks"});

    // Температура: Цельсий и Фаренгейт являются аффинными шкалами
    add("temperature", "K", "kelvin", kTemperature, 1.0, {"k"});
    add("temperature", "degC", "celsius", kTemperature, 1.0, {"C", "c"}, 273.15);
    add("temperature", "degF", "fahrenheit", kTemperature, 5.0 / 9.0, {"F", "f"}, 459.67);
    add("temperature", "degR", "rankine", kTemperature, 5.0 / 9.0, {"R"});

    // Скорость
    add("velocity", "kph", "kilometerperhour", velocity, 1000.0 / 3600.0, {"kmh"});
    add("velocity", "mph", "mileperhour", velocity, 0.44704);
    add("velocity", "kn", "knot", velocity, 1852.0 / 3600.0, {"knots"});

    // Частота
    add("frequency", "Hz", "hertz", frequency, 1.0);
    add("frequency", "kHz", "kilohertz", frequency, 1e3);
    add("frequency", "MHz", "megahertz", frequency, 1e6);
    add("frequency", "rpm", "revolutionsperminute", frequency, 1.0 / 60.0);

    // Сила
    add("force", "N", "newton", force, 1.0, {"newtons"});
    add("force", "kN", "kilonewton", force, 1e3);
    add("force", "dyn", "dyne", force, 1e-5);
    add("force", "lbf", "poundforce", force, 4.4482216152605);

    // Давление
    add("pressure", "Pa", "pascal", pressure, 1.0);
    add("pressure", "kPa", "kilopascal", pressure, 1e3);
    add("pressure", "bar", "bar", pressure, 1e5);
    add("pressure", "atm", "atmosphere", pressure, 101325.0);
    add("pressure", "psi", "psi", pressure, 6894.757293168361);
    add("pressure", "mmHg", "millimeterofmercury", pressure, 133.322387415);
    add("pressure", "torr", "torr", pressure, 101325.0 / 760.0);

    // Энергия
    add("energy", "J", "joule", energy, 1.0, {"joules"});
    add("energy", "kJ", "kilojoule", energy, 1e3);
    add("energy", "cal", "calorie", energy, 4.184, {"calories"});
    add("energy", "kcal", "kilocalorie", energy, 4184.0);
    add("energy", "eV", "electronvolt", energy, 1.602176634e-19);
    add("energy", "Wh", "watthour", energy, 3600.0);
    add("energy", "kWh", "kilowatthour", energy, 3.6e6);
    add("energy", "BTU", "btu", energy, 1055.05585262);

    // Мощность
    add("power", "W", "watt", powerDim, 1.0, {"watts"});
    add("power", "kW", "kilowatt", powerDim, 1e3);
    add("power", "MW", "megawatt", powerDim, 1e6);
    add("power", "hp", "horsepower", powerDim, 745.69987158227022);

    // Электричество
    add("electrical", "A", "ampere", kCurrent, 1.0, {"amp", "amps"});
    add("electrical", "mA", "milliampere", kCurrent, 1e-3);
    add("electrical", "V", "volt", voltage, 1.0, {"volts"});
    add("electrical", "ohm", "ohm", resistance, 1.0, {"ohms"});

    // Магнитный поток и индукция
    add("magnetic_flux", "Wb", "weber", magneticFlux, 1.0);
    add("magnetic_flux", "Mx", "maxwell", magneticFlux, 1e-8);
    add("magnetic_flux_density", "T", "tesla", fluxDensity, 1.0);
    add("magnetic_flux_density", "G", "gauss", fluxDensity, 1e-4);
}

// Построение индексов поиска. Вызывается после заполнения вектора,
// когда адреса элементов больше не меняются.
void UnitRegistry::buildIndex() {
    for (std::size_t i = 0; i < units.size(); ++i) {
        const Unit& unit = units[i];
        std::vector<std::string> keys = {unit.symbol, unit.name};
        keys.insert(keys.end(), unit.aliases.begin(), unit.aliases.end());
        for (const auto& key : keys) {
            // При совпадении ключей побеждает единица, зарегистрированная раньше
            exactIndex.emplace(key, i);
            // Обозначение (первый ключ) ищется только точно
            if (&key != &keys.front() && isWord(key)) {
                foldedIndex.emplace(toLower(key), i);
            }
        }
    }
}

const Unit* UnitRegistry::lookup(std::string_view symbol) const {
    if (symbol.empty()) {
        return nullptr;
    }
    auto exact = exactIndex.find(std::string(symbol));
    if (exact != exactIndex.end()) {
        return &units[exact->second];
    }
    auto folded = foldedIndex.find(toLower(symbol));
    if (folded != foldedIndex.end()) {
        return &units[folded->second];
    }
    return nullptr;
}

const Unit& UnitRegistry::require(std::string_view symbol) const {
    const Unit* unit = lookup(symbol);
    if (unit == nullptr) {
        throw EvaluationError("unknown unit '" + std::string(symbol) + "'",
                              {{"unit", std::string(symbol)}},
                              "see the unit list for supported symbols");
    }
    return *unit;
}

double UnitRegistry::convert(double value, std::string_view from, std::string_view to) const {
    return convert(value, require(from), require(to));
}

// Линейные единицы пересчитываются одним множителем,
// аффинные: в два шага через базовую единицу (кельвин).
double UnitRegistry::convert(double value, const Unit& from, const Unit& to) const {
    if (!compatible(from, to)) {
        throw DimensionalityError(
            "cannot convert between incompatible units",
            {{"from_unit", from.name},
             {"to_unit", to.name},
             {"from_dimension", describe(from.dimension)},
             {"to_dimension", describe(to.dimension)}},
            "both units must measure the same physical quantity");
    }
    if (from.rule.isAffine() || to.rule.isAffine()) {
        return to.fromBase(from.toBase(value));
    }
    return value * (from.rule.factor / to.rule.factor);
}

bool UnitRegistry::compatible(const Unit& first, const Unit& second) const {
    return first.dimension == second.dimension;
}

bool UnitRegistry::compatible(std::string_view first, std::string_view second) const {
    return compatible(require(first), require(second));
}

double UnitRegistry::conversionFactor(std::string_view from, std::string_view to) const {
    const Unit& source = require(from);
    const Unit& target = require(to);
    if (!compatible(source, target)) {
        throw DimensionalityError(
            "cannot convert between incompatible units",
            {{"from_unit", source.name},
             {"to_unit", target.name},
             {"from_dimension", describe(source.dimension)},
             {"to_dimension", describe(target.dimension)}});
    }
    if (source.rule.isAffine() || target.rule.isAffine()) {
        throw EvaluationError("no single conversion factor for offset-based units",
                              {{"from_unit", source.name}, {"to_unit", target.name}},
                              "use a direct conversion instead");
    }
    return source.rule.factor / target.rule.factor;
}

const Unit* UnitRegistry::coherentUnit(const Dimension& dimension) const {
    auto it = std::find_if(units.begin(), units.end(), [&dimension](const Unit& unit) {
        return !unit.rule.isAffine() && unit.rule.factor == 1.0 && unit.dimension == dimension;
    });
    return it == units.end() ? nullptr : &*it;
}

UnitCatalog UnitRegistry::listByCategory() const {
    UnitCatalog catalog;
    for (const auto& unit : units) {
        catalog[unit.category].push_back(unit.symbol);
    }
    return catalog;
}

} // namespace scicalc
