#include "scicalc/commands.hpp"

#include "scicalc/console.hpp"

#include <iostream>
#include <stdexcept>

using scicalc::CalculationResult;
using scicalc::Calculator;

namespace {
int printResult(const CalculationResult& result) {
    if (result.ok()) {
        std::cout << Color::GREEN << formatResult(result) << Color::RESET << "\n";
        return 0;
    }
    std::cerr << Color::RED << formatResult(result) << Color::RESET << "\n";
    if (!result.error->hint.empty()) {
        std::cerr << Color::GRAY << "Подсказка: " << result.error->hint << Color::RESET << "\n";
    }
    return 1;
}

// Каталог "категория: элементы через пробел"
template <typename Catalog>
void printCatalog(const Catalog& catalog) {
    for (const auto& [category, names] : catalog) {
        std::cout << Color::BOLD << Color::CYAN << category << Color::RESET << ":";
        for (const auto& name : names) {
            std::cout << " " << name;
        }
        std::cout << "\n";
    }
}
}

std::string formatResult(const CalculationResult& result) {
    if (result.ok()) {
        std::string text = scicalc::formatNumber(*result.value);
        return result.unit.empty() ? text : text + " " + result.unit;
    }

    const auto& error = *result.error;
    std::string text = std::string(scicalc::toString(error.kind)) + ": " + error.message;
    if (!error.context.empty()) {
        text += " (";
        bool first = true;
        for (const auto& [key, value] : error.context) {
            text += (first ? "" : " | ") + key + ": " + value;
            first = false;
        }
        text += ")";
    }
    return text;
}

int runEvalCommand(const Calculator& calculator, const std::string& expression) {
    return printResult(calculator.evaluate(expression));
}

int runConvertCommand(const Calculator& calculator, const std::string& value, const std::string& fromUnit,
                      const std::string& toUnit) {
    double number = 0.0;
    std::size_t consumed = 0;
    try {
        number = std::stod(value, &consumed);
    }
    catch (const std::logic_error&) {
        consumed = 0;
    }
    if (consumed == 0 || consumed != value.size()) {
        printError("Некорректное числовое значение: " + value);
        return 1;
    }
    return printResult(calculator.convert(number, fromUnit, toUnit));
}

int runUnitsCommand(const Calculator& calculator) {
    std::cout << Color::BOLD << "Единицы измерения (" << calculator.units().size() << "):\n" << Color::RESET;
    printCatalog(calculator.listUnits());
    return 0;
}

int runFunctionsCommand(const Calculator& calculator) {
    std::cout << Color::BOLD << "Функции (" << calculator.functions().size() << "):\n" << Color::RESET;
    printCatalog(calculator.listFunctions());

    std::cout << "\n";
    for (const auto& [name, description] : calculator.functions().describeAll()) {
        std::cout << "  " << Color::YELLOW << name << Color::RESET << " - " << description << "\n";
    }
    return 0;
}
