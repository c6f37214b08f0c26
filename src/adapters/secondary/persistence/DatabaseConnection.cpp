// src/adapters/secondary/persistence/DatabaseConnection.cpp
#include "adapters/secondary/persistence/DatabaseConnection.hpp"
#include "adapters/secondary/persistence/SchemaMigrations.hpp"
#include "ports/output/PersistenceErrors.hpp"
#include <filesystem>
#include <iostream>
#include <stdexcept>

namespace stockbook::adapters::secondary {

DatabaseConnection::DatabaseConnection(std::shared_ptr<const settings::DbSettings> settings)
    : settings_(std::move(settings))
{
    if (!settings_) {
        throw std::invalid_argument("DbSettings is required");
    }
    if (settings_->isInMemory()) {
        return;
    }

    std::filesystem::path parent =
        std::filesystem::path(settings_->getDatabasePath()).parent_path();
    if (parent.empty()) {
        return;
    }
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) {
        std::cerr << "[DatabaseConnection] Cannot create directory " << parent
                  << ": " << ec.message() << std::endl;
        throw ports::output::ConnectionUnavailableError(
            "Cannot create database directory '" + parent.string() + "': " + ec.message());
    }
}

std::shared_ptr<SqliteSession> DatabaseConnection::openSession() const {
    auto session = std::make_shared<SqliteSession>(
        settings_->getDatabasePath(), settings_->getTimeoutSeconds() * 1000);

    session->execute(settings_->getForeignKeys() ? "PRAGMA foreign_keys = ON"
                                                 : "PRAGMA foreign_keys = OFF");
    if (!settings_->isInMemory()) {
        session->execute("PRAGMA journal_mode = " + settings_->getJournalMode());
    }
    return session;
}

std::shared_ptr<SqliteSession> DatabaseConnection::acquire() {
    if (!settings_->isInMemory()) {
        return openSession();
    }
    std::lock_guard<std::mutex> lock(mutex_);
    if (!memorySession_) {
        memorySession_ = openSession();
    }
    return memorySession_;
}

void DatabaseConnection::withinTransaction(const std::function<void(SqliteSession&)>& work) {
    auto session = acquire();
    session->begin();
    try {
        work(*session);
        session->commit();
    } catch (...) {
        try {
            session->rollback();
        } catch (const std::exception& e) {
            std::cerr << "[DatabaseConnection] Rollback failed: " << e.what() << std::endl;
        }
        throw;
    }
}

void DatabaseConnection::initializeSchema() {
    std::call_once(schemaOnce_, [this]() {
        auto session = acquire();
        int applied = applyMigrations(*session);
        std::cout << "[DatabaseConnection] Schema ready at version " << schemaVersion(*session)
                  << " (" << applied << " migration(s) applied)" << std::endl;
    });
}

} // namespace stockbook::adapters::secondary
