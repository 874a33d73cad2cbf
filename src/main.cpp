#include <exception>
#include <iostream>
#include <string>
#include <vector>

#include "scicalc/batch_mode.hpp"
#include "scicalc/calculator.hpp"
#include "scicalc/commands.hpp"
#include "scicalc/console.hpp"
#include "scicalc/generate_mode.hpp"

namespace {
void printUsage() {
    std::cout << Color::BOLD << "Использование:\n" << Color::RESET;
    std::cout << "  scicalc                          интерактивная обработка файла выражений в CSV\n";
    std::cout << "  scicalc eval <выражение>         вычислить одно выражение\n";
    std::cout << "  scicalc convert <число> <из> <в>  пересчитать значение между единицами\n";
    std::cout << "  scicalc units                    список единиц измерения\n";
    std::cout << "  scicalc functions                список функций\n";
    std::cout << "  scicalc generate                 сгенерировать файл выражений в tests\n";
}

// Аргументы с from включительно, склеенные через пробел: eval 5 km to mi
std::string joinArguments(const std::vector<std::string>& arguments, std::size_t from) {
    std::string result;
    for (std::size_t i = from; i < arguments.size(); ++i) {
        if (i > from) {
            result += ' ';
        }
        result += arguments[i];
    }
    return result;
}

int dispatch(const std::vector<std::string>& arguments) {
    if (arguments.empty()) {
        scicalc::Calculator calculator;
        runBatchMode(calculator);
        return 0;
    }

    const std::string& command = arguments[0];
    if (command == "generate") {
        runGenerateMode();
        return 0;
    }
    if (command == "help" || command == "--help" || command == "-h") {
        printUsage();
        return 0;
    }

    scicalc::Calculator calculator;
    if (command == "eval" && arguments.size() >= 2) {
        return runEvalCommand(calculator, joinArguments(arguments, 1));
    }
    if (command == "convert" && arguments.size() == 4) {
        return runConvertCommand(calculator, arguments[1], arguments[2], arguments[3]);
    }
    if (command == "units" && arguments.size() == 1) {
        return runUnitsCommand(calculator);
    }
    if (command == "functions" && arguments.size() == 1) {
        return runFunctionsCommand(calculator);
    }

    printError("Неизвестная команда или неверные аргументы: " + joinArguments(arguments, 0));
    printUsage();
    return 1;
}
}

// Точка входа в программу
int main(int argc, char** argv) {
    std::vector<std::string> arguments(argv + 1, argv + argc);
    try {
        return dispatch(arguments);
    }
    catch (const std::exception& ex) {
        printError(ex.what());
        return 1;
    }
}
