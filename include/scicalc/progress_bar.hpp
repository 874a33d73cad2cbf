#pragma once

#include <atomic>
#include <cstddef>
#include <string>

// Строка прогресс-бара: "[███▒░░] 50% (5/10)" без цветов
std::string renderProgress(std::size_t current, std::size_t total, int width = 50);

// Отображение прогресса до достижения total.
// Запускается в отдельном потоке.
void displayProgress(const std::atomic<std::size_t>& completed, std::size_t total);
