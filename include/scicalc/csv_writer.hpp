#pragma once

#include <cstddef>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <vector>

#include "scicalc/calculator.hpp"

namespace scicalc {

// Результат вычисления одной строки входного файла
struct EvaluationRecord {
    std::size_t lineNumber = 0;   // Номер строки в исходном файле (с единицы)
    std::string expression;       // Исходный текст выражения
    std::string status;           // "success" или "error"
    std::optional<double> value;  // Результат (если вычисление успешно)
    std::string unit;             // Единица результата
    std::string errorKind;        // "syntax", "domain", "dimensionality", "evaluation"
    std::string message;          // Сообщение об ошибке вместе с контекстом

    // Запись по результату калькулятора
    static EvaluationRecord from(std::size_t lineNumber, std::string expression, const CalculationResult& result);
};

// Запись результатов в формате CSV:
// line,expression,status,result,unit,error_kind,message
// Текстовые поля заключаются в кавычки, кавычки внутри удваиваются.
class CsvWriter {
public:
    // Открывает файл на перезапись и сразу пишет заголовок.
    // Выбрасывает std::runtime_error, если файл не открывается.
    explicit CsvWriter(std::filesystem::path targetPath);

    // Записывает пакет результатов
    void write(const std::vector<EvaluationRecord>& records);

    // Записывает один результат
    void writeRecord(const EvaluationRecord& record);

    const std::filesystem::path& path() const { return target; }

    // Строка CSV без перевода строки
    static std::string formatRecord(const EvaluationRecord& record);

private:
    std::filesystem::path target;
    std::ofstream stream;
};

} // namespace scicalc
