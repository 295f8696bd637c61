/**
 * @file types.cpp
 * @brief Реализация базовых типов
 * @author Yan Bubenok <yan@bubenok.com>
 */

#include "types.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace coreorient::model {

ReferenceLine parseReferenceLine(const std::string& str) {
    std::string lowered = str;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "top") return ReferenceLine::Top;
    if (lowered == "bottom") return ReferenceLine::Bottom;

    throw std::invalid_argument(
        "Некорректное положение ориентирной линии: \"" + str + "\" (ожидается top или bottom)");
}

} // namespace coreorient::model
