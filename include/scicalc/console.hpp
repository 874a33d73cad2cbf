#pragma once

#include <iostream>
#include <string>

// Цвета ANSI для вывода в терминал
namespace Color {
    constexpr const char* RESET = "\033[0m";
    constexpr const char* BOLD = "\033[1m";
    constexpr const char* RED = "\033[31m";     // Ошибки
    constexpr const char* GREEN = "\033[32m";   // Результаты
    constexpr const char* YELLOW = "\033[33m";
    constexpr const char* MAGENTA = "\033[35m";
    constexpr const char* CYAN = "\033[36m";
    constexpr const char* GRAY = "\033[90m";    // Подсказки
}

// Рамка с названием программы
void printHeader();

// Сообщение об ошибке в stderr красным цветом
void printError(const std::string& message);
