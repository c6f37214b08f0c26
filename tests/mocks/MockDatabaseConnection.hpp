#pragma once

#include <gmock/gmock.h>

#include "adapters/secondary/persistence/IDatabaseConnection.hpp"
#include <functional>
#include <memory>

namespace stockbook::tests {

/**
 * @brief gmock-обёртка над настоящим соединением
 *
 * По умолчанию все вызовы уходят в delegate; тесты считают вызовы
 * acquire() через EXPECT_CALL.
 */
class MockDatabaseConnection : public adapters::secondary::IDatabaseConnection {
public:
    explicit MockDatabaseConnection(std::shared_ptr<adapters::secondary::IDatabaseConnection> delegate)
        : delegate_(std::move(delegate))
    {
        ON_CALL(*this, acquire).WillByDefault([this]() { return delegate_->acquire(); });
        ON_CALL(*this, withinTransaction).WillByDefault(
            [this](const std::function<void(adapters::secondary::SqliteSession&)>& work) {
                delegate_->withinTransaction(work);
            });
        ON_CALL(*this, isTransactional).WillByDefault([this]() { return delegate_->isTransactional(); });
        ON_CALL(*this, initializeSchema).WillByDefault([this]() { delegate_->initializeSchema(); });
    }

    MOCK_METHOD(std::shared_ptr<adapters::secondary::SqliteSession>, acquire, (), (override));
    MOCK_METHOD(void, withinTransaction,
                (const std::function<void(adapters::secondary::SqliteSession&)>& work), (override));
    MOCK_METHOD(bool, isTransactional, (), (const, override));
    MOCK_METHOD(void, initializeSchema, (), (override));

private:
    std::shared_ptr<adapters::secondary::IDatabaseConnection> delegate_;
};

} // namespace stockbook::tests
