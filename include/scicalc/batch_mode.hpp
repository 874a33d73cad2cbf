#pragma once

#include "scicalc/calculator.hpp"

// Интерактивная пакетная обработка файлов выражений с записью в CSV.
// Повторяется, пока пользователь соглашается продолжить.
void runBatchMode(const scicalc::Calculator& calculator);
