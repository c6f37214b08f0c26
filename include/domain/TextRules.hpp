#pragma once

#include "EntityId.hpp"
#include "exceptions/DomainExceptions.hpp"
#include <cctype>
#include <optional>
#include <stdexcept>
#include <string>

namespace stockbook::domain::rules {

inline bool isBlank(const std::string& value) {
    for (char c : value) {
        if (!std::isspace(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

inline std::string trimmed(const std::string& value) {
    size_t begin = 0;
    size_t end = value.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(value[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(value[end - 1]))) --end;
    return value.substr(begin, end - begin);
}

/**
 * @brief Число символов UTF-8 строки (байты продолжения не считаются)
 *
 * Совпадает с length() в SQLite для TEXT.
 */
inline size_t characterCount(const std::string& value) {
    size_t count = 0;
    for (char c : value) {
        if ((static_cast<unsigned char>(c) & 0xC0) != 0x80) ++count;
    }
    return count;
}

/**
 * @brief Первые count символов UTF-8 строки, без разрыва многобайтных символов
 */
inline std::string leadingCharacters(const std::string& value, size_t count) {
    size_t seen = 0;
    for (size_t i = 0; i < value.size(); ++i) {
        if ((static_cast<unsigned char>(value[i]) & 0xC0) != 0x80) {
            if (seen == count) return value.substr(0, i);
            ++seen;
        }
    }
    return value;
}

inline void requireMaxLength(const std::string& value, size_t maxLength, const std::string& field) {
    if (characterCount(value) > maxLength) {
        throw ValidationError(field + " cannot exceed " + std::to_string(maxLength) + " characters");
    }
}

inline void requireMaxLength(const std::optional<std::string>& value, size_t maxLength,
                             const std::string& field) {
    if (value) requireMaxLength(*value, maxLength, field);
}

inline void requireNotBlank(const std::string& value, const std::string& field) {
    if (isBlank(value)) {
        throw ValidationError(field + " cannot be empty");
    }
}

inline void requirePositiveId(EntityId id, const std::string& field) {
    if (id <= 0) {
        throw ValidationError(field + " must be positive");
    }
}

inline void requirePositiveId(const OptionalId& id, const std::string& field) {
    if (id) requirePositiveId(*id, field);
}

/**
 * @brief Общая логика присвоения суррогатного ключа
 * @throws std::logic_error если ключ уже присвоен
 */
inline void assignOnce(OptionalId& slot, EntityId id, const std::string& entity) {
    if (slot) {
        throw std::logic_error(entity + " already has id " + std::to_string(*slot));
    }
    requirePositiveId(id, entity + " id");
    slot = id;
}

} // namespace stockbook::domain::rules
