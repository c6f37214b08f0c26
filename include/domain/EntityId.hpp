#pragma once

#include <cstdint>
#include <optional>

namespace stockbook::domain {

/// Суррогатный ключ строки (INTEGER PRIMARY KEY)
using EntityId = int64_t;

/// Ключ, которого нет до первого сохранения
using OptionalId = std::optional<EntityId>;

} // namespace stockbook::domain
