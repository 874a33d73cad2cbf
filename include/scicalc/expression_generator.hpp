#pragma once

#include <cstddef>
#include <random>
#include <string>

// Генератор случайных выражений для нагрузочного тестирования.
// Смешивает арифметику, научные функции и величины с единицами,
// изредка (около 5%) вносит ошибки: незакрытые скобки, лишние символы,
// сложение несовместимых величин.
class ExpressionGenerator {
public:
    // Вероятность внесения ошибки в узел выражения
    static constexpr double kErrorProbability = 0.05;

    ExpressionGenerator();

    // Фиксированное зерно даёт воспроизводимую последовательность
    explicit ExpressionGenerator(unsigned seed);

    // Выражение с глубиной вложенности не больше depth
    std::string generate(int depth);

private:
    std::mt19937 engine;

    std::string generateArithmetic(int depth);
    std::string generateFunctionCall(int depth);
    std::string generateQuantity();

    // Число с двумя знаками после запятой из [low; high]
    std::string generateNumber(double low, double high);

    // Вносит ошибку в выражение с вероятностью kErrorProbability
    std::string introduceError(std::string expression);

    double chance();
    std::size_t pick(std::size_t count);
};
