// include/settings/BusinessRules.hpp
#pragma once

#include "domain/Decimal.hpp"
#include "domain/Money.hpp"
#include "domain/exceptions/DomainExceptions.hpp"
#include <cstdlib>
#include <stdexcept>
#include <string>

namespace stockbook::settings
{

    /**
     * @brief Бизнес-правила по умолчанию
     *
     * Создаётся один раз при старте и передаётся через shared_ptr
     * в фабрику Unit of Work и репозитории.
     */
    class BusinessRules
    {
    public:
        BusinessRules()
            : BusinessRules(
                  getEnvOrDefault("STOCKBOOK_DEFAULT_CURRENCY", domain::Money::DEFAULT_CURRENCY),
                  parseInt("STOCKBOOK_MAX_POSITIONS", getEnvOrDefault("STOCKBOOK_MAX_POSITIONS", "10")),
                  domain::Decimal::parse(getEnvOrDefault("STOCKBOOK_MAX_RISK_PER_TRADE", "2.0")),
                  domain::Decimal::parse(getEnvOrDefault("STOCKBOOK_MAX_RISK_LIMIT", "10.0")))
        {
        }

        /**
         * @throws domain::ValidationError при некорректных значениях
         */
        BusinessRules(const std::string &defaultCurrency,
                      int maxPositions,
                      const domain::Decimal &maxRiskPerTrade,
                      const domain::Decimal &maxRiskLimit)
            : defaultCurrency_(domain::Money::normalizeCurrency(defaultCurrency)),
              maxPositions_(maxPositions),
              maxRiskPerTrade_(maxRiskPerTrade),
              maxRiskLimit_(maxRiskLimit)
        {
            if (maxPositions_ <= 0)
            {
                throw domain::ValidationError("Max positions must be positive");
            }
            if (!maxRiskPerTrade_.isPositive())
            {
                throw domain::ValidationError("Max risk per trade must be positive");
            }
            if (maxRiskLimit_ < maxRiskPerTrade_)
            {
                throw domain::ValidationError("Max risk limit cannot be below max risk per trade");
            }
        }

        const std::string &getDefaultCurrency() const { return defaultCurrency_; }
        int getMaxPositions() const { return maxPositions_; }
        const domain::Decimal &getMaxRiskPerTrade() const { return maxRiskPerTrade_; }
        const domain::Decimal &getMaxRiskLimit() const { return maxRiskLimit_; }

    private:
        std::string defaultCurrency_;
        int maxPositions_;
        domain::Decimal maxRiskPerTrade_;
        domain::Decimal maxRiskLimit_;

        static std::string getEnvOrDefault(const char *name, const char *defaultValue)
        {
            const char *value = std::getenv(name);
            return value ? std::string(value) : std::string(defaultValue);
        }

        static int parseInt(const char *name, const std::string &value)
        {
            try
            {
                return std::stoi(value);
            }
            catch (const std::exception &)
            {
                throw domain::ValidationError(std::string(name) + " must be an integer, got '" + value + "'");
            }
        }
    };

} // namespace stockbook::settings
