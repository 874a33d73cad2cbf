#include "scicalc/generate_mode.hpp"

#include "scicalc/console.hpp"
#include "scicalc/expression_generator.hpp"
#include "scicalc/file_utils.hpp"
#include "scicalc/user_input.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>

void runGenerateMode() {
    printHeader();
    std::cout << Color::BOLD << Color::CYAN << "Режим генерации выражений\n" << Color::RESET << "\n";

    std::size_t expressionCount = askExpressionCount();
    std::filesystem::path fileName = selectGeneratedFileName(expressionCount);

    std::filesystem::path testsDir = findProjectRoot() / "tests";
    std::filesystem::create_directories(testsDir);
    std::filesystem::path outputPath = testsDir / fileName;

    std::cout << "\n";
    std::cout << Color::BOLD << "Конфигурация:\n" << Color::RESET;
    std::cout << "  Количество выражений: " << Color::CYAN << expressionCount << Color::RESET << "\n";
    std::cout << "  Выходной файл:        " << Color::YELLOW << outputPath << Color::RESET << "\n\n";

    std::cout << Color::BOLD << "Генерация выражений..." << Color::RESET << std::flush;
    auto start = std::chrono::steady_clock::now();

    std::ofstream output(outputPath);
    if (!output.is_open()) {
        throw std::runtime_error("Не удалось создать файл: " + outputPath.string());
    }

    ExpressionGenerator generator;
    for (std::size_t i = 0; i < expressionCount; ++i) {
        // Глубина от 2 до 5, чтобы выражения укладывались в предел длины
        output << generator.generate(2 + static_cast<int>(i % 4)) << "\n";

        if ((i + 1) % 10000 == 0) {
            std::cout << "\r  " << Color::CYAN << (i + 1) << "/" << expressionCount << " выражений сгенерировано..."
                      << Color::RESET << std::flush;
        }
    }
    output.close();
    if (!output) {
        throw std::runtime_error("Ошибка записи в файл: " + outputPath.string());
    }

    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
    std::cout << "\r  " << Color::GREEN << "✓" << Color::RESET << " (" << expressionCount << " выражений, "
              << duration.count() << " мс)\n\n";
    std::cout << Color::GREEN << "Файл успешно создан: " << outputPath << Color::RESET << "\n\n";
}
