/**
 * @file file_utils.hpp
 * @brief Вспомогательные функции для работы с файлами
 */

#pragma once

#include <filesystem>
#include <string>

namespace coreorient::io {

/**
 * @brief Атомарная запись строковых данных в файл (через временный файл + rename).
 * @throws std::runtime_error Если файл не удалось записать
 */
void atomicWrite(const std::filesystem::path& path, const std::string& content);

/**
 * @brief Чтение файла целиком
 * @throws std::runtime_error Если файл не удалось открыть
 */
[[nodiscard]] std::string readTextFile(const std::filesystem::path& path);

} // namespace coreorient::io
