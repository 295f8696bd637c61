/**
 * @file cli.hpp
 * @brief Командная строка: пересчёт одного замера и скважины
 */

#pragma once

#include <ostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace coreorient::app {

/// Коды завершения
constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

/**
 * @brief Ошибка аргументов командной строки
 */
class UsageError : public std::runtime_error {
public:
    explicit UsageError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Выполнить команду
 *
 * @param args Аргументы без имени программы
 * @param out Поток результатов
 * @param err Поток ошибок
 * @return kExitOk, kExitFailure (ошибка данных/ввода-вывода) или kExitUsage
 */
int runCli(const std::vector<std::string>& args, std::ostream& out, std::ostream& err);

/**
 * @brief Текст справки
 */
[[nodiscard]] std::string usageText();

} // namespace coreorient::app
