#pragma once

#include <string>

#include "scicalc/dimension.hpp"
#include "scicalc/unit_registry.hpp"

namespace scicalc {

// Результат вычисления: безразмерное число (Scalar) или величина с
// единицей измерения (Quantity).
//
// Величина с именованной единицей хранит значение в этой единице и
// указатель на Unit внутри неизменяемого реестра (не владеет им).
// Составная величина без имени (например, m*s) хранит значение в базовых
// единицах СИ и только вектор размерности.
class Value {
public:
    enum class Kind { Scalar, Quantity };

    static Value scalar(double magnitude);

    // Величина в именованной единице реестра
    static Value quantity(double magnitude, const Unit& unit);

    // Величина по значению в базовых единицах СИ. При нулевой размерности
    // вырождается в Scalar; если в реестре есть когерентная единица этой
    // размерности, величина привязывается к ней.
    static Value fromBase(double baseMagnitude, const Dimension& dimension, const UnitRegistry& units);

    Kind kind() const { return valueKind; }
    bool isScalar() const { return valueKind == Kind::Scalar; }
    bool isQuantity() const { return valueKind == Kind::Quantity; }

    // Значение в собственной единице (или в СИ для составной величины)
    double magnitude() const { return amount; }

    const Dimension& dimension() const { return dim; }

    // nullptr для Scalar и для составных величин
    const Unit* unit() const { return unitRef; }

    // Значение в базовых единицах СИ (с учётом смещения шкалы)
    double baseMagnitude() const;

    // Обозначение единицы: "km", "kg*m/s^2" или пустая строка для Scalar
    std::string unitLabel() const;

    // "5 km", "3.5"
    std::string toString() const;

private:
    Value(Kind kind, double magnitude, const Dimension& dimension, const Unit* unit)
        : valueKind(kind), amount(magnitude), dim(dimension), unitRef(unit) {}

    Kind valueKind;
    double amount;
    Dimension dim;
    const Unit* unitRef;
};

} // namespace scicalc
