#pragma once

#include <string>
#include <stdexcept>

namespace stockbook::domain {

/**
 * @brief Оценка качества бумаги
 */
enum class Grade {
    A,
    B,
    C
};

inline std::string toString(Grade grade) {
    switch (grade) {
        case Grade::A: return "A";
        case Grade::B: return "B";
        case Grade::C: return "C";
    }
    return "UNKNOWN";
}

/**
 * @brief Создать из строки ("A" / "B" / "C", регистр не важен)
 * @throws std::invalid_argument если строка не распознана
 */
inline Grade gradeFromString(const std::string& str) {
    if (str == "A" || str == "a") return Grade::A;
    if (str == "B" || str == "b") return Grade::B;
    if (str == "C" || str == "c") return Grade::C;
    throw std::invalid_argument("Unknown Grade: " + str);
}

} // namespace stockbook::domain
