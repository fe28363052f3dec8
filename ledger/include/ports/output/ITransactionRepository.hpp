#pragma once

#include "domain/Transaction.hpp"
#include <string>
#include <optional>
#include <vector>

namespace budget::ports::output {

/**
 * @brief Интерфейс журнала проводок
 *
 * Журнал только дополняется: изменения строк не предусмотрены, удалить
 * можно только что добавленные проводки, если операция, частью которой
 * они были, не завершилась.
 */
class ITransactionRepository {
public:
    virtual ~ITransactionRepository() = default;

    /**
     * @brief Добавить проводки одной атомарной операцией
     *
     * Назначает каждой проводке порядковый номер журнала.
     * Если запись не удалась, не сохраняется ни одна проводка.
     *
     * @return Сохранённые проводки с заполненным sequence
     */
    virtual std::vector<domain::Transaction> append(const std::vector<domain::Transaction>& transactions) = 0;

    /**
     * @brief Откатить проводки, добавленные последним append
     *
     * Вызывается под той же блокировкой владельца, до того как проводки
     * попали в кэш балансов.
     */
    virtual void discard(const std::vector<std::string>& transactionIds) = 0;

    virtual std::optional<domain::Transaction> findById(const std::string& id) = 0;

    /**
     * @brief Проводки счёта в порядке журнала
     */
    virtual std::vector<domain::Transaction> findByAccount(const std::string& accountId) = 0;

    virtual std::vector<domain::Transaction> findByOwner(const std::string& ownerId) = 0;

    /**
     * @brief Ноги перевода
     */
    virtual std::vector<domain::Transaction> findByTransferId(const std::string& transferId) = 0;

    /**
     * @brief Сторнирующие проводки для данной
     */
    virtual std::vector<domain::Transaction> findReversalsOf(const std::string& transactionId) = 0;
};

} // namespace budget::ports::output
