#pragma once

#include <string>
#include <vector>

#include "scicalc/calculator.hpp"

// Подкоманды командной строки. Возвращают код завершения (0 или 1).

// eval <expression>
int runEvalCommand(const scicalc::Calculator& calculator, const std::string& expression);

// convert <value> <from> <to>
int runConvertCommand(const scicalc::Calculator& calculator, const std::string& value, const std::string& fromUnit,
                      const std::string& toUnit);

// units
int runUnitsCommand(const scicalc::Calculator& calculator);

// functions
int runFunctionsCommand(const scicalc::Calculator& calculator);

// Текстовое представление результата: "3.10685596119 mi" или
// "dimensionality: cannot add ... (left: 5 m | ...)"
std::string formatResult(const scicalc::CalculationResult& result);
