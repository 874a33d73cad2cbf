#include "scicalc/value.hpp"

#include "scicalc/errors.hpp"

namespace scicalc {

Value Value::scalar(double magnitude) {
    return Value(Kind::Scalar, magnitude, Dimension::none(), nullptr);
}

Value Value::quantity(double magnitude, const Unit& unit) {
    return Value(Kind::Quantity, magnitude, unit.dimension, &unit);
}

Value Value::fromBase(double baseMagnitude, const Dimension& dimension, const UnitRegistry& units) {
    if (dimension.isDimensionless()) {
        return scalar(baseMagnitude);
    }
    // Когерентная единица имеет множитель 1, значение не меняется
    if (const Unit* coherent = units.coherentUnit(dimension)) {
        return quantity(baseMagnitude, *coherent);
    }
    return Value(Kind::Quantity, baseMagnitude, dimension, nullptr);
}

double Value::baseMagnitude() const {
    return unitRef != nullptr ? unitRef->toBase(amount) : amount;
}

std::string Value::unitLabel() const {
    if (isScalar()) {
        return "";
    }
    return unitRef != nullptr ? unitRef->symbol : dim.toString();
}

std::string Value::toString() const {
    if (isScalar()) {
        return formatNumber(amount);
    }
    return formatNumber(amount) + " " + unitLabel();
}

} // namespace scicalc
