#pragma once

#include "domain/Account.hpp"
#include "domain/AccountEvent.hpp"
#include "domain/AccountRequest.hpp"
#include "domain/AccountTree.hpp"
#include <optional>
#include <string>
#include <vector>

namespace budget::ports::input {

/**
 * @brief Интерфейс сервиса дерева счетов
 *
 * Input Port. Каждая операция принимает владельца явно.
 */
class IAccountService {
public:
    virtual ~IAccountService() = default;

    /**
     * @brief Создать счёт
     *
     * @throws InvalidHierarchy чужой/неактивный родитель, цикл, категория, дубль имени
     * @throws UnknownAccount родитель не найден
     * @throws InvalidArgument пустое имя
     */
    virtual domain::Account createAccount(
        const std::string& ownerId,
        const domain::AccountRequest& request
    ) = 0;

    /**
     * @brief Создать корневые счета Income и Expenses, если их нет
     *
     * @return Корневые счета владельца после вызова
     */
    virtual std::vector<domain::Account> setupDefaultAccounts(const std::string& ownerId) = 0;

    /**
     * @brief Перенести счёт под другого родителя (nullopt - на верхний уровень)
     */
    virtual domain::Account reparent(
        const std::string& ownerId,
        const std::string& accountId,
        const std::optional<std::string>& newParentId
    ) = 0;

    virtual domain::Account rename(
        const std::string& ownerId,
        const std::string& accountId,
        const std::string& name
    ) = 0;

    /**
     * @brief Деактивировать счёт вместе с потомками
     */
    virtual domain::Account deactivate(const std::string& ownerId, const std::string& accountId) = 0;

    /**
     * @brief Активировать счёт. Родитель должен быть активен.
     */
    virtual domain::Account activate(const std::string& ownerId, const std::string& accountId) = 0;

    /**
     * @brief Удалить счёт с поддеревом
     *
     * Без проводок поддерево удаляется, иначе деактивируется.
     */
    virtual domain::AccountRemoval removeAccount(const std::string& ownerId, const std::string& accountId) = 0;

    virtual std::optional<domain::Account> getAccount(const std::string& ownerId, const std::string& accountId) = 0;

    virtual std::vector<domain::Account> getAccounts(const std::string& ownerId) = 0;

    virtual domain::AccountTree getTree(const std::string& ownerId, bool includeInactive) = 0;

    /**
     * @brief Путь от корня: "Income > Salary"
     */
    virtual std::string getFullPath(const std::string& ownerId, const std::string& accountId) = 0;

    virtual std::vector<domain::AccountEvent> getAccountHistory(
        const std::string& ownerId, const std::string& accountId) = 0;
};

} // namespace budget::ports::input
