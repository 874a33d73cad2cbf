#include "scicalc/csv_writer.hpp"

#include <sstream>
#include <stdexcept>

namespace scicalc {

namespace {
std::string quoted(const std::string& text) {
    std::string result = "\"";
    for (char ch : text) {
        if (ch == '"') {
            result += '"';
        }
        result += ch;
    }
    return result + "\"";
}

// Сообщение с контекстом: "log is undefined for -5 (value: -5 | ...)"
std::string describeError(const ErrorInfo& error) {
    std::string text = error.message;
    if (error.context.empty()) {
        return text;
    }
    text += " (";
    bool first = true;
    for (const auto& [key, value] : error.context) {
        if (!first) {
            text += " | ";
        }
        text += key + ": " + value;
        first = false;
    }
    return text + ")";
}
}

EvaluationRecord EvaluationRecord::from(std::size_t lineNumber, std::string expression,
                                        const CalculationResult& result) {
    EvaluationRecord record;
    record.lineNumber = lineNumber;
    record.expression = std::move(expression);
    if (result.ok()) {
        record.status = "success";
        record.value = result.value;
        record.unit = result.unit;
    } else {
        record.status = "error";
        record.errorKind = toString(result.error->kind);
        record.message = describeError(*result.error);
    }
    return record;
}

CsvWriter::CsvWriter(std::filesystem::path targetPath)
    : target(std::move(targetPath)), stream(target, std::ios::trunc) {
    if (!stream.is_open()) {
        throw std::runtime_error("Не удалось открыть файл для записи CSV: " + target.string());
    }
    stream << "line,expression,status,result,unit,error_kind,message\n";
}

std::string CsvWriter::formatRecord(const EvaluationRecord& record) {
    std::ostringstream line;
    line.precision(15);
    line << record.lineNumber << ',' << quoted(record.expression) << ',' << record.status << ',';
    if (record.value.has_value()) {
        line << *record.value;
    }
    line << ',' << quoted(record.unit) << ',' << record.errorKind << ',' << quoted(record.message);
    return line.str();
}

void CsvWriter::writeRecord(const EvaluationRecord& record) {
    stream << formatRecord(record) << '\n';
    if (!stream) {
        throw std::runtime_error("Ошибка записи в файл CSV: " + target.string());
    }
}

void CsvWriter::write(const std::vector<EvaluationRecord>& records) {
    for (const auto& record : records) {
        writeRecord(record);
    }
    stream.flush();
}

} // namespace scicalc
