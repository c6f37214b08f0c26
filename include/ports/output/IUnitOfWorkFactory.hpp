#pragma once

#include "IUnitOfWork.hpp"
#include <memory>

namespace stockbook::ports::output {

/**
 * @brief Фабрика Unit of Work: новый экземпляр на каждую логическую транзакцию
 */
class IUnitOfWorkFactory {
public:
    virtual ~IUnitOfWorkFactory() = default;

    virtual std::unique_ptr<IUnitOfWork> create() = 0;
};

} // namespace stockbook::ports::output
