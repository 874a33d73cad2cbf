#include "scicalc/file_utils.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace {
std::string toLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return text;
}
}

// Файл читается блоками по 4 МБ, считаются символы новой строки
std::size_t countLinesInFile(const std::filesystem::path& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input.is_open()) {
        throw std::runtime_error("Не удалось открыть файл для подсчета строк: " + path.string());
    }

    constexpr std::size_t bufferSize = 4 * 1024 * 1024;
    std::vector<char> buffer(bufferSize);

    std::size_t lineCount = 0;
    char last = '\n';
    while (input.read(buffer.data(), static_cast<std::streamsize>(buffer.size())) || input.gcount() > 0) {
        auto bytesRead = static_cast<std::size_t>(input.gcount());
        lineCount += static_cast<std::size_t>(std::count(buffer.begin(), buffer.begin() + bytesRead, '\n'));
        last = buffer[bytesRead - 1];
    }

    // Последняя строка без \n
    if (last != '\n') {
        ++lineCount;
    }
    return lineCount;
}

std::filesystem::path findProjectRoot() {
    std::error_code error;
    std::filesystem::path current = std::filesystem::current_path(error);
    if (error) {
        return {};
    }
    std::filesystem::path start = current;

    // Поднимаемся вверх по директориям, пока не найдем папку tests или CMakeLists.txt
    while (!current.empty()) {
        if (std::filesystem::is_directory(current / "tests", error) ||
            std::filesystem::is_regular_file(current / "CMakeLists.txt", error)) {
            return current;
        }
        std::filesystem::path parent = current.parent_path();
        if (parent == current) {
            break;
        }
        current = parent;
    }
    return start;
}

std::vector<std::filesystem::path> findFilesWithExtension(const std::filesystem::path& directory,
                                                          const std::string& extension) {
    std::vector<std::filesystem::path> files;
    std::error_code error;
    if (!std::filesystem::is_directory(directory, error)) {
        return files;
    }

    std::string wanted = toLower(extension);
    for (const auto& entry : std::filesystem::directory_iterator(directory, error)) {
        // Недоступные файлы пропускаются
        if (entry.is_regular_file(error) && toLower(entry.path().extension().string()) == wanted) {
            files.push_back(entry.path());
        }
    }

    std::sort(files.begin(), files.end());
    return files;
}

std::string getCurrentTimeString() {
    auto time = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local{};
    localtime_r(&time, &local);

    std::ostringstream stream;
    stream << std::put_time(&local, "%Y%m%d_%H%M%S");
    return stream.str();
}
