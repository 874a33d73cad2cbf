#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <string>

namespace scicalc {

// Базовые физические размерности
enum class BaseDimension : std::size_t {
    Length = 0,
    Mass,
    Time,
    Temperature,
    Current
};

constexpr std::size_t kBaseDimensionCount = 5;

// Вектор размерности: целые показатели степеней базовых размерностей.
// Например, ньютон = Mass^1 * Length^1 * Time^-2.
struct Dimension {
    std::array<int, kBaseDimensionCount> exponents{};

    // Безразмерная величина (все показатели равны нулю)
    static Dimension none() { return Dimension{}; }

    // Одна базовая размерность в заданной степени
    static Dimension of(BaseDimension base, int power = 1);

    bool isDimensionless() const;

    int exponent(BaseDimension base) const { return exponents[static_cast<std::size_t>(base)]; }

    // Умножение величин складывает показатели, деление вычитает
    Dimension operator*(const Dimension& other) const;
    Dimension operator/(const Dimension& other) const;

    // Возведение в степень. Возвращает nullopt, если хотя бы один
    // показатель перестаёт быть целым (например, метр^0.5).
    std::optional<Dimension> raisedTo(double power) const;

    bool operator==(const Dimension& other) const = default;

    // Запись в базовых единицах СИ: "kg*m/s^2", "1/s", "" для безразмерной
    std::string toString() const;
};

} // namespace scicalc
