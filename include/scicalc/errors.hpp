#pragma once

#include <cstddef>
#include <map>
#include <stdexcept>
#include <string>
#include <utility>

namespace scicalc {

// Виды ошибок вычислителя. Не пересекаются между собой.
enum class ErrorKind {
    Syntax,         // Ошибка разбора (только на этапе парсинга)
    Domain,         // Аргумент функции вне области определения
    Dimensionality, // Несовместимые физические размерности
    Evaluation      // Прочие ошибки вычисления
};

// Имя вида ошибки: "syntax", "domain", "dimensionality", "evaluation"
const char* toString(ErrorKind kind);

// Базовое исключение вычислителя.
// Помимо текста хранит структурированный контекст (позиция, значение,
// ограничение и т.д.) и необязательную подсказку для пользователя.
class CalcError : public std::runtime_error {
public:
    using Context = std::map<std::string, std::string>;

    CalcError(ErrorKind kind, std::string message, Context context = {}, std::string hint = {});

    ErrorKind kind() const noexcept { return errorKind; }

    // Сообщение без контекста (what() содержит и контекст)
    const std::string& message() const noexcept { return text; }
    const Context& context() const noexcept { return details; }
    const std::string& hint() const noexcept { return remedy; }

private:
    ErrorKind errorKind;
    std::string text;
    Context details;
    std::string remedy;
};

// Синтаксическая ошибка. Всегда содержит позицию символа во входной строке.
class SyntaxError final : public CalcError {
public:
    SyntaxError(std::string message, std::size_t position, Context context = {}, std::string hint = {});

    std::size_t position() const noexcept { return offset; }

private:
    std::size_t offset;
};

class DomainError final : public CalcError {
public:
    explicit DomainError(std::string message, Context context = {}, std::string hint = {})
        : CalcError(ErrorKind::Domain, std::move(message), std::move(context), std::move(hint)) {}
};

class DimensionalityError final : public CalcError {
public:
    explicit DimensionalityError(std::string message, Context context = {}, std::string hint = {})
        : CalcError(ErrorKind::Dimensionality, std::move(message), std::move(context), std::move(hint)) {}
};

class EvaluationError final : public CalcError {
public:
    explicit EvaluationError(std::string message, Context context = {}, std::string hint = {})
        : CalcError(ErrorKind::Evaluation, std::move(message), std::move(context), std::move(hint)) {}
};

// Форматирование числа для сообщений об ошибках (до 12 значащих цифр)
std::string formatNumber(double value);

} // namespace scicalc
