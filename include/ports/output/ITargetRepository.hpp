#pragma once

#include "domain/EntityId.hpp"
#include "domain/Target.hpp"
#include "domain/enums/TargetStatus.hpp"
#include <optional>
#include <vector>

namespace stockbook::ports::output {

/**
 * @brief Критерии поиска ценовых целей
 */
struct TargetFilter {
    domain::OptionalId portfolioId;
    domain::OptionalId stockId;
    std::optional<domain::TargetStatus> status;
};

/**
 * @brief Интерфейс репозитория ценовых целей
 *
 * Output Port. Списки упорядочены по id.
 */
class ITargetRepository {
public:
    virtual ~ITargetRepository() = default;

    virtual domain::EntityId create(const domain::Target& target) = 0;

    virtual std::optional<domain::Target> getById(domain::EntityId id) = 0;

    virtual std::vector<domain::Target> getActiveByPortfolio(domain::EntityId portfolioId) = 0;

    virtual std::vector<domain::Target> list(const TargetFilter& filter = {}) = 0;

    virtual bool update(domain::EntityId id, const domain::Target& target) = 0;

    /**
     * @brief Сменить статус без загрузки сущности
     * @return false если цели нет
     */
    virtual bool updateStatus(domain::EntityId id, domain::TargetStatus status) = 0;

    virtual bool deleteById(domain::EntityId id) = 0;
};

} // namespace stockbook::ports::output
