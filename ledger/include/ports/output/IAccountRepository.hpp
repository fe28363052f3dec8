#pragma once

#include "domain/Account.hpp"
#include "domain/AccountEvent.hpp"
#include "domain/Money.hpp"
#include <string>
#include <optional>
#include <vector>

namespace budget::ports::output {

/**
 * @brief Интерфейс репозитория счетов
 *
 * Output Port для хранения дерева счетов, кэша балансов и журнала изменений.
 */
class IAccountRepository {
public:
    virtual ~IAccountRepository() = default;

    /**
     * @brief Сохранить счёт (вставка или обновление)
     */
    virtual void save(const domain::Account& account) = 0;

    /**
     * @brief Найти счёт по ID
     *
     * @param id UUID счёта
     * @return Account или nullopt
     */
    virtual std::optional<domain::Account> findById(const std::string& id) = 0;

    /**
     * @brief Все счета владельца, включая неактивные
     */
    virtual std::vector<domain::Account> findByOwner(const std::string& ownerId) = 0;

    /**
     * @brief Счета с пустым ownerId (битые записи)
     */
    virtual std::vector<domain::Account> findWithoutOwner() = 0;

    /**
     * @brief Удалить счёт
     *
     * @return true если удалён
     */
    virtual bool deleteById(const std::string& id) = 0;

    /**
     * @brief Изменить кэш баланса на delta
     *
     * @return false если счёт не найден
     */
    virtual bool adjustBalance(const std::string& id, const domain::Money& delta) = 0;

    /**
     * @brief Перезаписать кэш баланса
     */
    virtual bool setCachedBalance(const std::string& id, const domain::Money& balance) = 0;

    virtual void appendEvent(const domain::AccountEvent& event) = 0;

    /**
     * @brief Журнал изменений счёта в порядке записи
     */
    virtual std::vector<domain::AccountEvent> findEvents(const std::string& accountId) = 0;
};

} // namespace budget::ports::output
