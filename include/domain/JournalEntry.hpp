#pragma once

#include "Date.hpp"
#include "EntityId.hpp"
#include "TextRules.hpp"
#include <algorithm>
#include <optional>
#include <string>
#include <vector>

namespace stockbook::domain {

/**
 * @brief Запись торгового дневника
 *
 * Может ссылаться на портфель, бумагу и сделку (все ссылки необязательны).
 * Теги хранятся в колонке tags как JSON-массив.
 */
class JournalEntry {
public:
    static constexpr size_t MAX_CONTENT_LENGTH = 10000;
    static constexpr size_t MAX_TITLE_LENGTH = 200;
    static constexpr size_t DEFAULT_PREVIEW_LENGTH = 50;

    JournalEntry(
        Date entryDate,
        std::string content,
        std::optional<std::string> title = std::nullopt,
        OptionalId portfolioId = std::nullopt,
        OptionalId stockId = std::nullopt,
        OptionalId transactionId = std::nullopt,
        std::vector<std::string> tags = {},
        OptionalId id = std::nullopt
    ) : entryDate_(entryDate)
      , portfolioId_(portfolioId)
      , stockId_(stockId)
      , transactionId_(transactionId)
    {
        rules::requirePositiveId(portfolioId_, "Portfolio ID");
        rules::requirePositiveId(stockId_, "Stock ID");
        rules::requirePositiveId(transactionId_, "Transaction ID");
        updateContent(std::move(content));
        setTitle(std::move(title));
        for (auto& tag : tags) {
            addTag(tag);
        }
        if (id) assignId(*id);
    }

    const OptionalId& id() const { return id_; }
    const Date& entryDate() const { return entryDate_; }
    const std::string& content() const { return content_; }
    const std::optional<std::string>& title() const { return title_; }
    const OptionalId& portfolioId() const { return portfolioId_; }
    const OptionalId& stockId() const { return stockId_; }
    const OptionalId& transactionId() const { return transactionId_; }
    const std::vector<std::string>& tags() const { return tags_; }

    void assignId(EntityId id) { rules::assignOnce(id_, id, "JournalEntry"); }

    /**
     * @throws ValidationError если текст пустой или длиннее 10000 символов
     */
    void updateContent(std::string content) {
        rules::requireNotBlank(content, "Journal entry content");
        rules::requireMaxLength(content, MAX_CONTENT_LENGTH, "Journal entry content");
        content_ = std::move(content);
    }

    void setTitle(std::optional<std::string> title) {
        if (title && rules::isBlank(*title)) {
            title.reset();
        }
        rules::requireMaxLength(title, MAX_TITLE_LENGTH, "Title");
        title_ = std::move(title);
    }

    /**
     * @brief Добавить тег (пробелы отрезаются, дубликаты игнорируются)
     */
    void addTag(const std::string& tag) {
        std::string value = rules::trimmed(tag);
        rules::requireNotBlank(value, "Tag");
        if (!hasTag(value)) {
            tags_.push_back(std::move(value));
        }
    }

    bool removeTag(const std::string& tag) {
        auto it = std::find(tags_.begin(), tags_.end(), rules::trimmed(tag));
        if (it == tags_.end()) return false;
        tags_.erase(it);
        return true;
    }

    bool hasTag(const std::string& tag) const {
        return std::find(tags_.begin(), tags_.end(), tag) != tags_.end();
    }

    /**
     * @brief Начало текста для списков: первые maxLength символов + "..."
     */
    std::string preview(size_t maxLength = DEFAULT_PREVIEW_LENGTH) const {
        if (rules::characterCount(content_) <= maxLength) {
            return content_;
        }
        return rules::leadingCharacters(content_, maxLength) + "...";
    }

private:
    OptionalId id_;
    Date entryDate_;
    std::string content_;
    std::optional<std::string> title_;
    OptionalId portfolioId_;
    OptionalId stockId_;
    OptionalId transactionId_;
    std::vector<std::string> tags_;
};

} // namespace stockbook::domain
