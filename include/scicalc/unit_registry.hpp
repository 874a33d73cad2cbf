#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "scicalc/dimension.hpp"

namespace scicalc {

// Правило пересчёта в базовую единицу СИ: base = (value + offset) * factor.
// Ненулевое смещение означает аффинную шкалу (градусы Цельсия, Фаренгейта).
struct ConversionRule {
    double factor = 1.0;
    double offset = 0.0;

    bool isAffine() const { return offset != 0.0; }
};

// Физическая единица измерения
struct Unit {
    std::string symbol;               // Основное обозначение ("km")
    std::string name;                 // Каноническое имя ("kilometer")
    std::string category;             // Категория для каталога ("distance")
    Dimension dimension;
    ConversionRule rule;
    std::vector<std::string> aliases; // Дополнительные имена ("kilometre")

    // Значение в базовых единицах СИ
    double toBase(double value) const { return (value + rule.offset) * rule.factor; }

    // Обратный пересчёт из базовых единиц СИ
    double fromBase(double value) const { return value / rule.factor - rule.offset; }
};

// Каталог: категория -> обозначения единиц
using UnitCatalog = std::map<std::string, std::vector<std::string>>;

// Реестр единиц измерения.
// Заполняется один раз в конструкторе и далее доступен только для чтения,
// поэтому один экземпляр можно без блокировок разделять между потоками.
// Указатели на Unit остаются действительными всё время жизни реестра.
class UnitRegistry {
public:
    UnitRegistry();

    UnitRegistry(const UnitRegistry&) = delete;
    UnitRegistry& operator=(const UnitRegistry&) = delete;

    // Поиск по обозначению, имени или синониму.
    // Сначала точное совпадение, затем без учёта регистра
    // (только имена и синонимы-слова, не обозначения: Mg не mg).
    // Возвращает nullptr, если единица неизвестна.
    const Unit* lookup(std::string_view symbol) const;

    // Пересчёт значения между единицами.
    // Выбрасывает EvaluationError для неизвестных единиц и
    // DimensionalityError для несовместимых.
    double convert(double value, std::string_view from, std::string_view to) const;
    double convert(double value, const Unit& from, const Unit& to) const;

    // Совместимость: векторы размерностей совпадают покомпонентно
    bool compatible(const Unit& first, const Unit& second) const;
    bool compatible(std::string_view first, std::string_view second) const;

    // Множитель пересчёта между линейными единицами (target = value * factor).
    // Для аффинных шкал единого множителя нет: EvaluationError.
    double conversionFactor(std::string_view from, std::string_view to) const;

    // Когерентная единица СИ (множитель 1) для размерности, например
    // ньютон для kg*m/s^2. nullptr, если такой в реестре нет.
    const Unit* coherentUnit(const Dimension& dimension) const;

    // Каталог по категориям: категории по алфавиту, единицы в порядке регистрации
    UnitCatalog listByCategory() const;

    std::size_t size() const { return units.size(); }

private:
    std::vector<Unit> units;
    std::unordered_map<std::string, std::size_t> exactIndex;
    std::unordered_map<std::string, std::size_t> foldedIndex;

    // Регистрация доступна только во время построения реестра
    void add(const std::string& category, const std::string& symbol, const std::string& name,
             const Dimension& dimension, double factor, std::vector<std::string> aliases = {},
             double offset = 0.0);
    void registerDefaults();
    void buildIndex();

    const Unit& require(std::string_view symbol) const;
};

} // namespace scicalc
