#pragma once

#include <cstddef>
#include <functional>
#include <limits>
#include <map>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace scicalc {

// Допустимое число аргументов функции: [min; max]
struct Arity {
    static constexpr std::size_t kUnbounded = std::numeric_limits<std::size_t>::max();

    std::size_t min = 1;
    std::size_t max = 1;

    static Arity exactly(std::size_t count) { return {count, count}; }
    static Arity between(std::size_t low, std::size_t high) { return {low, high}; }
    static Arity atLeast(std::size_t count) { return {count, kUnbounded}; }

    bool accepts(std::size_t count) const { return count >= min && count <= max; }

    // "1", "1 or 2", "at least 1"
    std::string describe() const;
};

// Ограничение на отдельный аргумент, например "x > 0"
struct ParameterDomain {
    std::string constraint;
    std::function<bool(double)> holds;
};

// Ограничение на весь список аргументов, например "at least two values"
struct ArgumentsDomain {
    std::string constraint;
    std::function<bool(const std::vector<double>&)> holds;
};

// Научная функция из белого списка.
// Реализация чистая: зависит только от аргументов.
struct ScientificFunction {
    std::string name;
    std::string category;
    std::string description;
    Arity arity;
    // Ограничения по позициям. Для функций с переменным числом
    // аргументов последнее ограничение действует на все оставшиеся.
    std::vector<ParameterDomain> parameters;
    std::vector<ArgumentsDomain> argumentRules;
    std::function<double(const std::vector<double>&)> implementation;

    // Ограничение для аргумента с индексом index (nullptr, если его нет)
    const ParameterDomain* parameterDomain(std::size_t index) const;
};

// Каталог: категория -> имена функций
using FunctionCatalog = std::map<std::string, std::vector<std::string>>;

// Реестр научных функций. Как и реестр единиц, заполняется в конструкторе
// и далее неизменяем.
class FunctionRegistry {
public:
    FunctionRegistry();

    FunctionRegistry(const FunctionRegistry&) = delete;
    FunctionRegistry& operator=(const FunctionRegistry&) = delete;

    // Поиск без учёта регистра. nullptr, если функции нет в белом списке.
    const ScientificFunction* get(std::string_view name) const;

    bool contains(std::string_view name) const { return get(name) != nullptr; }

    // Категория -> имена в порядке регистрации
    FunctionCatalog listByCategory() const;

    // Имя -> описание
    std::map<std::string, std::string> describeAll() const;

    std::size_t size() const { return functions.size(); }

private:
    std::vector<ScientificFunction> functions;
    std::unordered_map<std::string, std::size_t> index;

    void add(ScientificFunction function);
    void registerTrigonometric();
    void registerLogarithmic();
    void registerExponential();
    void registerStatistical();
};

} // namespace scicalc
