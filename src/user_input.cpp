#include "scicalc/user_input.hpp"

#include "scicalc/console.hpp"
#include "scicalc/file_utils.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <stdexcept>
#include <thread>

namespace {
// Вывод приглашения и чтение строки без пробелов по краям
std::string prompt(const std::string& text) {
    std::cout << Color::BOLD << text << Color::RESET;
    std::string input;
    if (!std::getline(std::cin, input)) {
        throw std::runtime_error("Ввод прерван");
    }
    return trim(input);
}

bool isNumber(const std::string& text) {
    return !text.empty() &&
           std::all_of(text.begin(), text.end(), [](unsigned char ch) { return std::isdigit(ch) != 0; });
}

// Вариант 1 или 2 из меню
char askChoice(const std::string& first, const std::string& second) {
    std::cout << "  " << Color::CYAN << "1" << Color::RESET << ". " << first << "\n";
    std::cout << "  " << Color::CYAN << "2" << Color::RESET << ". " << second << "\n\n";
    std::string choice = prompt("Ваш выбор (1 или 2): ");
    if (choice != "1" && choice != "2") {
        throw std::runtime_error("Некорректный выбор. Используйте 1 или 2");
    }
    return choice[0];
}

std::filesystem::path withExtension(std::filesystem::path path, const char* extension) {
    if (path.extension() != extension) {
        path.replace_extension(extension);
    }
    return path;
}
}

std::string trim(const std::string& text) {
    std::size_t first = text.find_first_not_of(" \t");
    if (first == std::string::npos) {
        return "";
    }
    std::size_t last = text.find_last_not_of(" \t");
    return text.substr(first, last - first + 1);
}

std::size_t parsePositiveNumber(const std::string& value) {
    if (!isNumber(value)) {
        throw std::runtime_error("Некорректное числовое значение: " + value);
    }
    std::size_t result = 0;
    try {
        result = std::stoul(value);
    }
    catch (const std::out_of_range&) {
        throw std::runtime_error("Слишком большое число: " + value);
    }
    if (result == 0) {
        throw std::runtime_error("Число должно быть положительным");
    }
    return result;
}

std::filesystem::path selectInputFile() {
    std::filesystem::path testsDir = findProjectRoot() / "tests";
    auto txtFiles = findFilesWithExtension(testsDir, ".txt");

    if (txtFiles.empty()) {
        std::cout << Color::YELLOW << "Внимание: " << Color::RESET << "не найдено .txt файлов в папке tests.\n";
        std::cout << "Директория: " << Color::CYAN << testsDir << Color::RESET << "\n\n";
    } else {
        std::cout << Color::BOLD << "Найденные .txt файлы в папке tests:\n" << Color::RESET;
        for (std::size_t i = 0; i < txtFiles.size(); ++i) {
            std::cout << "  " << Color::CYAN << (i + 1) << Color::RESET << ". " << Color::YELLOW
                      << txtFiles[i].filename().string() << Color::RESET << "\n";
        }
        std::cout << "\n";
    }

    std::string input = prompt("Введите номер файла или путь до входного файла: ");
    if (input.empty()) {
        throw std::runtime_error("Пустой ввод");
    }

    if (isNumber(input) && !txtFiles.empty()) {
        std::size_t index = parsePositiveNumber(input);
        if (index > txtFiles.size()) {
            throw std::runtime_error("Номер файла вне допустимого диапазона");
        }
        return txtFiles[index - 1];
    }

    std::filesystem::path inputPath = input;
    if (!std::filesystem::exists(inputPath)) {
        throw std::runtime_error("Файл не найден: " + inputPath.string());
    }
    return inputPath;
}

std::filesystem::path selectOutputFile(const std::filesystem::path& inputPath) {
    std::cout << Color::BOLD << "Выберите способ задания выходного файла:\n" << Color::RESET;
    char choice = askChoice("Название по умолчанию (имя входного файла + _results_ + время)", "Кастомное название");

    if (choice == '1') {
        return inputPath.parent_path() / (inputPath.stem().string() + "_results_" + getCurrentTimeString() + ".csv");
    }

    std::string customName = prompt("Введите название выходного файла (расширение .csv добавится автоматически): ");
    if (customName.empty()) {
        throw std::runtime_error("Пустое название файла");
    }

    // Относительный путь задаётся от директории входного файла
    std::filesystem::path customPath(customName);
    if (customPath.is_absolute()) {
        return withExtension(customPath, ".csv");
    }
    return withExtension(inputPath.parent_path() / customPath, ".csv");
}

std::size_t selectThreadCount() {
    std::size_t defaultThreads = std::thread::hardware_concurrency();
    if (defaultThreads == 0) {
        defaultThreads = 2;
    }

    std::string input = prompt("Введите количество потоков (по умолчанию: " + std::to_string(defaultThreads) + "): ");
    if (input.empty()) {
        return defaultThreads;
    }
    return parsePositiveNumber(input);
}

bool askContinue() {
    std::string input = prompt("Обработать еще один файл? (y/n): ");
    std::transform(input.begin(), input.end(), input.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return input == "y" || input == "yes" || input == "д" || input == "да";
}

std::size_t askExpressionCount() {
    std::string input = prompt("Введите количество выражений для генерации: ");
    if (input.empty()) {
        throw std::runtime_error("Пустой ввод");
    }
    return parsePositiveNumber(input);
}

std::filesystem::path selectGeneratedFileName(std::size_t expressionCount) {
    std::string automatic = "generate_" + std::to_string(expressionCount) + ".txt";
    std::cout << Color::BOLD << "Выберите способ задания имени файла:\n" << Color::RESET;
    char choice = askChoice("Автоматическое название (" + automatic + ")", "Кастомное название");

    if (choice == '1') {
        return automatic;
    }

    std::string customName = prompt("Введите название файла (расширение .txt добавится автоматически): ");
    if (customName.empty()) {
        throw std::runtime_error("Пустое название файла");
    }
    return withExtension(customName, ".txt");
}
