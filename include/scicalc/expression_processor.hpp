#pragma once

#include <atomic>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <future>
#include <stdexcept>
#include <string>
#include <vector>

#include "scicalc/calculator.hpp"
#include "scicalc/csv_writer.hpp"
#include "scicalc/thread_pool.hpp"

namespace scicalc {

// Размеры порций по умолчанию
constexpr std::size_t kDefaultChunkSize = 10000; // Строк, читаемых за раз
constexpr std::size_t kDefaultBatchSize = 1000;  // Результатов, передаваемых в callback за раз

// Вычисление одной строки файла. Ошибки вычислителя попадают в запись,
// а не в исключение, поэтому задача пула не бросает CalcError.
inline EvaluationRecord evaluateLine(const Calculator& calculator, std::size_t lineNumber, std::string text) {
    CalculationResult result = calculator.evaluate(text);
    return EvaluationRecord::from(lineNumber, std::move(text), result);
}

// Потоковое чтение и обработка файла по частям (chunks).
// Строки читаются порциями по chunkSize и сразу отправляются в пул потоков;
// результаты собираются пачками по batchSize в порядке строк файла и
// передаются в processBatch. Весь файл в память не загружается.
// Все задачи разделяют один Calculator по константной ссылке.
template <typename ProcessCallback>
void processExpressionsStreaming(const std::filesystem::path& path, const Calculator& calculator, ThreadPool& pool,
                                 std::atomic<std::size_t>& completed, ProcessCallback&& processBatch,
                                 std::size_t chunkSize = kDefaultChunkSize,
                                 std::size_t batchSize = kDefaultBatchSize) {
    std::ifstream input(path);
    if (!input.is_open()) {
        throw std::runtime_error("Не удалось открыть входной файл: " + path.string());
    }

    std::vector<std::future<EvaluationRecord>> futures;
    futures.reserve(batchSize);

    auto flushBatch = [&]() {
        if (futures.empty()) {
            return;
        }
        std::vector<EvaluationRecord> batch;
        batch.reserve(futures.size());
        for (auto& future : futures) {
            batch.push_back(future.get());
        }
        processBatch(batch);
        futures.clear();
    };

    std::vector<std::string> chunk;
    chunk.reserve(chunkSize);
    std::size_t firstLine = 1; // Номер первой строки текущей порции

    auto dispatchChunk = [&]() {
        for (std::size_t i = 0; i < chunk.size(); ++i) {
            futures.push_back(pool.enqueue(
                [&calculator, &completed](std::size_t lineNumber, std::string text) {
                    EvaluationRecord record = evaluateLine(calculator, lineNumber, std::move(text));
                    completed.fetch_add(1);
                    return record;
                },
                firstLine + i, std::move(chunk[i])));
            if (futures.size() >= batchSize) {
                flushBatch();
            }
        }
        firstLine += chunk.size();
        chunk.clear();
    };

    std::string line;
    while (std::getline(input, line)) {
        // Windows-переводы строк
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        chunk.push_back(std::move(line));
        if (chunk.size() >= chunkSize) {
            dispatchChunk();
        }
    }
    dispatchChunk();
    flushBatch();
}

// Итог обработки файла
struct BatchSummary {
    std::size_t total = 0;
    std::size_t succeeded = 0;
    std::size_t failed = 0;
};

// Вычисляет все строки входного файла на пуле из threadCount потоков и
// записывает результаты в CSV в порядке строк. Счётчик completed
// увеличивается по мере готовности строк (для прогресс-бара).
// Выбрасывает std::runtime_error при ошибках ввода-вывода.
BatchSummary evaluateFile(const Calculator& calculator, const std::filesystem::path& inputPath,
                          const std::filesystem::path& outputPath, std::size_t threadCount,
                          std::atomic<std::size_t>& completed);

} // namespace scicalc
