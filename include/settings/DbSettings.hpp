// include/settings/DbSettings.hpp
#pragma once

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdlib>
#include <stdexcept>
#include <string>

namespace stockbook::settings
{

    /**
     * @brief Настройки встроенной БД SQLite
     *
     * Читает параметры из переменных окружения. DATABASE_URL вида
     * sqlite:///<path> имеет приоритет над STOCKBOOK_DB_PATH.
     */
    class DbSettings
    {
    public:
        static constexpr const char *MEMORY_PATH = ":memory:";

        DbSettings()
        {
            const char *url = std::getenv("DATABASE_URL");
            databasePath_ = url ? pathFromUrl(url)
                                : getEnvOrDefault("STOCKBOOK_DB_PATH", "data/database/stockbook.db");
            timeoutSeconds_ = parseTimeout(getEnvOrDefault("STOCKBOOK_DB_TIMEOUT", "30"));
            foreignKeys_ = parseBool(getEnvOrDefault("STOCKBOOK_DB_FOREIGN_KEYS", "true"));
            journalMode_ = parseJournalMode(getEnvOrDefault("STOCKBOOK_DB_JOURNAL_MODE", "WAL"));
        }

        explicit DbSettings(std::string databasePath,
                            int timeoutSeconds = 30,
                            bool foreignKeys = true,
                            const std::string &journalMode = "WAL")
            : databasePath_(std::move(databasePath)),
              timeoutSeconds_(timeoutSeconds),
              foreignKeys_(foreignKeys),
              journalMode_(parseJournalMode(journalMode))
        {
            if (databasePath_.empty())
            {
                throw std::invalid_argument("Database path cannot be empty");
            }
            if (timeoutSeconds_ < 0)
            {
                throw std::invalid_argument("Database timeout cannot be negative");
            }
        }

        std::string getDatabasePath() const { return databasePath_; }
        int getTimeoutSeconds() const { return timeoutSeconds_; }
        bool getForeignKeys() const { return foreignKeys_; }
        std::string getJournalMode() const { return journalMode_; }

        bool isInMemory() const { return databasePath_ == MEMORY_PATH; }

        std::string getDatabaseUrl() const { return "sqlite:///" + databasePath_; }

        /**
         * @brief sqlite:///data/db.sqlite → data/db.sqlite
         * @throws std::invalid_argument для других схем
         */
        static std::string pathFromUrl(const std::string &url)
        {
            const std::string prefix = "sqlite:///";
            if (url.rfind(prefix, 0) != 0 || url.size() == prefix.size())
            {
                throw std::invalid_argument("Unsupported DATABASE_URL: " + url);
            }
            return url.substr(prefix.size());
        }

    private:
        std::string databasePath_;
        int timeoutSeconds_;
        bool foreignKeys_;
        std::string journalMode_;

        static std::string getEnvOrDefault(const char *name, const char *defaultValue)
        {
            const char *value = std::getenv(name);
            return value ? std::string(value) : std::string(defaultValue);
        }

        static int parseTimeout(const std::string &value)
        {
            int seconds = std::stoi(value);
            if (seconds < 0)
            {
                throw std::invalid_argument("Database timeout cannot be negative: " + value);
            }
            return seconds;
        }

        static bool parseBool(std::string value)
        {
            std::transform(value.begin(), value.end(), value.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            if (value == "1" || value == "true" || value == "yes" || value == "on")
                return true;
            if (value == "0" || value == "false" || value == "no" || value == "off")
                return false;
            throw std::invalid_argument("Invalid boolean value: " + value);
        }

        static std::string parseJournalMode(std::string value)
        {
            std::transform(value.begin(), value.end(), value.begin(),
                           [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
            static const std::array<const char *, 6> modes = {
                "DELETE", "TRUNCATE", "PERSIST", "MEMORY", "WAL", "OFF"};
            for (const char *mode : modes)
            {
                if (value == mode)
                    return value;
            }
            throw std::invalid_argument("Unsupported journal mode: " + value);
        }
    };

} // namespace stockbook::settings
