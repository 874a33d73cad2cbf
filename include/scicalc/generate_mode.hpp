#pragma once

// Режим генерации файла случайных выражений в папку tests
void runGenerateMode();
