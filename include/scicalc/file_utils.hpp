#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

// Быстрый подсчет количества строк в файле.
// Последняя строка без завершающего '\n' тоже считается.
std::size_t countLinesInFile(const std::filesystem::path& path);

// Поиск корневой директории проекта (ищет папку tests или файл CMakeLists.txt)
std::filesystem::path findProjectRoot();

// Файлы с заданным расширением в директории (без учёта регистра), по алфавиту
std::vector<std::filesystem::path> findFilesWithExtension(const std::filesystem::path& directory,
                                                          const std::string& extension);

// Текущее время для имени файла: 20240131_235959
std::string getCurrentTimeString();
