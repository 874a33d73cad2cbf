#include "scicalc/progress_bar.hpp"

#include "scicalc/console.hpp"

#include <algorithm>
#include <chrono>
#include <iostream>
#include <thread>

std::string renderProgress(std::size_t current, std::size_t total, int width) {
    double fraction = total == 0 ? 1.0 : static_cast<double>(std::min(current, total)) / static_cast<double>(total);
    int filled = static_cast<int>(width * fraction);

    std::string bar = "[";
    for (int i = 0; i < width; ++i) {
        if (i < filled) {
            bar += "█";
        } else if (i == filled) {
            bar += "▒";
        } else {
            bar += "░";
        }
    }
    bar += "] " + std::to_string(static_cast<int>(fraction * 100.0)) + "% (" + std::to_string(current) + "/" +
           std::to_string(total) + ")";
    return bar;
}

void displayProgress(const std::atomic<std::size_t>& completed, std::size_t total) {
    while (completed.load() < total) {
        std::cout << "\r  " << Color::CYAN << renderProgress(completed.load(), total) << Color::RESET << std::flush;
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    std::cout << "\r  " << Color::GREEN << renderProgress(total, total) << Color::RESET << "\n";
}
