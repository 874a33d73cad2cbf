#pragma once

#include <cstddef>
#include <filesystem>
#include <string>

// Удаление пробелов и табуляций по краям строки
std::string trim(const std::string& text);

// Разбор положительного целого числа.
// Выбрасывает std::runtime_error для нуля и нечисловых значений.
std::size_t parsePositiveNumber(const std::string& value);

// Интерактивный выбор входного файла из папки tests или по пути
std::filesystem::path selectInputFile();

// Интерактивный выбор выходного CSV файла
std::filesystem::path selectOutputFile(const std::filesystem::path& inputPath);

// Интерактивный ввод количества потоков
std::size_t selectThreadCount();

// Запрос продолжения работы с другим файлом
bool askContinue();

// Интерактивный ввод количества выражений для генерации
std::size_t askExpressionCount();

// Интерактивный выбор имени файла для генерации
std::filesystem::path selectGeneratedFileName(std::size_t expressionCount);
