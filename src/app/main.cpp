/**
 * @file main.cpp
 * @brief Точка входа приложения CoreOrient
 * @author Yan Bubenok <yan@bubenok.com>
 */

#include "cli.hpp"
#include <exception>
#include <iostream>
#include <string>
#include <vector>

int main(int argc, char* argv[]) {
    try {
        std::vector<std::string> args(argv + 1, argv + argc);
        return coreorient::app::runCli(args, std::cout, std::cerr);
    } catch (const std::exception& e) {
        std::cerr << "Критическая ошибка: " << e.what() << std::endl;
        return coreorient::app::kExitFailure;
    }
}
