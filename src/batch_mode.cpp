#include "scicalc/batch_mode.hpp"

#include "scicalc/console.hpp"
#include "scicalc/expression_processor.hpp"
#include "scicalc/file_utils.hpp"
#include "scicalc/progress_bar.hpp"
#include "scicalc/user_input.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <iostream>
#include <thread>

namespace {
void processOneFile(const scicalc::Calculator& calculator) {
    std::filesystem::path inputPath = selectInputFile();
    std::filesystem::path outputPath = selectOutputFile(inputPath);
    std::size_t threadCount = selectThreadCount();

    std::cout << "\n";
    std::cout << Color::BOLD << "Конфигурация:\n" << Color::RESET;
    std::cout << "  Входной файл:  " << Color::YELLOW << inputPath << Color::RESET << "\n";
    std::cout << "  Выходной файл: " << Color::YELLOW << outputPath << Color::RESET << "\n";
    std::cout << "  Потоков:       " << Color::CYAN << threadCount << Color::RESET << "\n\n";

    // Подсчет строк нужен только для прогресс-бара
    std::cout << Color::BOLD << "Подсчет строк в файле..." << Color::RESET << std::flush;
    std::size_t totalLines = countLinesInFile(inputPath);
    std::cout << " " << Color::GREEN << "✓" << Color::RESET << " (" << totalLines << " строк)\n\n";

    std::cout << Color::BOLD << "Обработка выражений:\n" << Color::RESET;
    auto start = std::chrono::steady_clock::now();

    std::atomic<std::size_t> completed{0};
    std::thread progressThread(displayProgress, std::cref(completed), totalLines);
    scicalc::BatchSummary summary;
    try {
        summary = scicalc::evaluateFile(calculator, inputPath, outputPath, threadCount, completed);
    }
    catch (...) {
        // Останавливаем прогресс-бар и пробрасываем ошибку дальше
        completed.store(totalLines);
        progressThread.join();
        throw;
    }
    completed.store(totalLines);
    progressThread.join();

    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);

    std::cout << "\n" << Color::BOLD << "Статистика:\n" << Color::RESET;
    std::cout << "  Всего выражений:  " << Color::CYAN << summary.total << Color::RESET << "\n";
    std::cout << "  Успешно:          " << Color::GREEN << summary.succeeded << Color::RESET << "\n";
    if (summary.failed > 0) {
        std::cout << "  Ошибок:           " << Color::RED << summary.failed << Color::RESET << "\n";
    }
    std::cout << "  Время обработки:  " << Color::MAGENTA << duration.count() << " мс" << Color::RESET << "\n";
    if (duration.count() > 0) {
        std::cout << "  Производительность: " << Color::YELLOW
                  << static_cast<long long>(summary.total * 1000.0 / duration.count()) << " выр/сек" << Color::RESET
                  << "\n";
    }
    std::cout << "\n" << Color::GREEN << "Результаты сохранены в: " << outputPath << Color::RESET << "\n\n";
}
}

void runBatchMode(const scicalc::Calculator& calculator) {
    printHeader();

    bool continueProcessing = true;
    while (continueProcessing) {
        try {
            processOneFile(calculator);
        }
        catch (const std::exception& ex) {
            std::cerr << "\n";
            printError(ex.what());
            std::cerr << "\n";
        }
        continueProcessing = askContinue();
        if (continueProcessing) {
            std::cout << "\n";
        }
    }

    std::cout << Color::CYAN << "Работа завершена. До свидания!" << Color::RESET << "\n\n";
}
