/**
 * @file LedgerEndpointTest.cpp
 * @brief Тесты HTTP обработчиков ledger поверх in-memory сервисов
 *
 * Владелец передаётся заголовком X-Owner-Id, без него любой endpoint
 * отвечает 401.
 */

#include "LedgerTestBase.hpp"

#include <nlohmann/json.hpp>

#include "adapters/primary/AccountHandler.hpp"
#include "adapters/primary/AllocationHandler.hpp"
#include "adapters/primary/HealthHandler.hpp"
#include "adapters/primary/IntegrityHandler.hpp"
#include "adapters/primary/LoanHandler.hpp"
#include "adapters/primary/PeriodHandler.hpp"
#include "adapters/primary/SettingsHandler.hpp"
#include "adapters/primary/TemplateHandler.hpp"
#include "adapters/primary/TransactionHandler.hpp"
#include "adapters/primary/WeeklyRunHandler.hpp"

#include <SimpleRequest.hpp>
#include <SimpleResponse.hpp>

using namespace budget;
using namespace budget::tests;
using namespace budget::adapters::primary;
using json = nlohmann::json;

// ============================================================================
// TEST FIXTURE
// ============================================================================

class LedgerEndpointTest : public LedgerTestBase {
protected:
    void SetUp() override {
        LedgerTestBase::SetUp();

        accountHandler_ = std::make_shared<AccountHandler>(accountService_, ledgerService_);
        periodHandler_ = std::make_shared<PeriodHandler>(periodService_, settingsService_);
        transactionHandler_ = std::make_shared<TransactionHandler>(ledgerService_);
        templateHandler_ = std::make_shared<TemplateHandler>(templateService_);
        allocationHandler_ = std::make_shared<AllocationHandler>(allocationService_);
        loanHandler_ = std::make_shared<LoanHandler>(loanService_);
        integrityHandler_ = std::make_shared<IntegrityHandler>(integrityService_);
        weeklyRunHandler_ = std::make_shared<WeeklyRunHandler>(processor_, settingsService_);
        settingsHandler_ = std::make_shared<SettingsHandler>(settingsService_);
        healthHandler_ = std::make_shared<HealthHandler>(settings_);
    }

    /**
     * @brief Выполнить запрос и вернуть ответ
     */
    SimpleResponse call(IHttpHandler& handler,
                        const std::string& method,
                        const std::string& path,
                        const json& body = nullptr,
                        const std::string& owner = OWNER) {
        std::map<std::string, std::string> headers;
        headers["Content-Type"] = "application/json";
        if (!owner.empty()) {
            headers["X-Owner-Id"] = owner;
        }

        SimpleRequest req(method, path, body.is_null() ? "" : body.dump(), "127.0.0.1", 8080, headers);
        SimpleResponse res;
        handler.handle(req, res);
        return res;
    }

    static json parse(const SimpleResponse& res) {
        return json::parse(res.getBody());
    }

    /// Открыть ledger и вернуть id первого периода
    std::string openViaHttp() {
        auto res = call(*periodHandler_, "POST", "/api/v1/periods/open", json{{"epoch", "2024-01-01"}});
        EXPECT_EQ(res.getStatus(), 201);
        return parse(res)["id"].get<std::string>();
    }

    std::string rootId(const std::string& name) {
        auto res = call(*accountHandler_, "POST", "/api/v1/accounts/defaults");
        for (const auto& account : parse(res)) {
            if (account["name"] == name) {
                return account["id"].get<std::string>();
            }
        }
        return "";
    }

    std::string createViaHttp(const std::string& name, const std::string& category, const std::string& parentId) {
        json body{{"name", name}, {"category", category}};
        if (!parentId.empty()) {
            body["parent_id"] = parentId;
        }
        auto res = call(*accountHandler_, "POST", "/api/v1/accounts", body);
        EXPECT_EQ(res.getStatus(), 201);
        return parse(res)["id"].get<std::string>();
    }

    std::shared_ptr<AccountHandler> accountHandler_;
    std::shared_ptr<PeriodHandler> periodHandler_;
    std::shared_ptr<TransactionHandler> transactionHandler_;
    std::shared_ptr<TemplateHandler> templateHandler_;
    std::shared_ptr<AllocationHandler> allocationHandler_;
    std::shared_ptr<LoanHandler> loanHandler_;
    std::shared_ptr<IntegrityHandler> integrityHandler_;
    std::shared_ptr<WeeklyRunHandler> weeklyRunHandler_;
    std::shared_ptr<SettingsHandler> settingsHandler_;
    std::shared_ptr<HealthHandler> healthHandler_;
};

// ============================================================================
// Общие правила
// ============================================================================

TEST_F(LedgerEndpointTest, MissingOwnerHeader_Returns401) {
    auto res = call(*accountHandler_, "GET", "/api/v1/accounts", nullptr, "");

    EXPECT_EQ(res.getStatus(), 401);
    EXPECT_EQ(parse(res)["kind"], "Unauthorized");
}

TEST_F(LedgerEndpointTest, Health_ReportsStorage) {
    auto res = call(*healthHandler_, "GET", "/api/v1/health", nullptr, "");

    EXPECT_EQ(res.getStatus(), 200);
    EXPECT_EQ(parse(res)["status"], "ok");
    EXPECT_EQ(parse(res)["storage"], "memory");
}

TEST_F(LedgerEndpointTest, MalformedJson_Returns400) {
    SimpleRequest req("POST", "/api/v1/accounts", "{not json", "127.0.0.1", 8080,
                      std::map<std::string, std::string>{{"X-Owner-Id", OWNER}});
    SimpleResponse res;
    accountHandler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 400);
}

// ============================================================================
// Счета
// ============================================================================

TEST_F(LedgerEndpointTest, Accounts_CreateGetAndTree) {
    auto expenses = rootId("Expenses");
    auto food = createViaHttp("Food", "EXPENSE", expenses);

    auto get = call(*accountHandler_, "GET", "/api/v1/accounts/" + food);
    ASSERT_EQ(get.getStatus(), 200);
    EXPECT_EQ(parse(get)["full_path"], "Expenses > Food");
    EXPECT_EQ(parse(get)["balance"], "0.00");

    auto tree = call(*accountHandler_, "GET", "/api/v1/accounts");
    ASSERT_EQ(tree.getStatus(), 200);
    EXPECT_EQ(parse(tree)["accounts"].size(), 2u);
}

TEST_F(LedgerEndpointTest, Accounts_ErrorKindsMapToStatus) {
    auto expenses = rootId("Expenses");

    auto mismatch = call(*accountHandler_, "POST", "/api/v1/accounts",
                         json{{"name", "Bonus"}, {"category", "INCOME"}, {"parent_id", expenses}});
    EXPECT_EQ(mismatch.getStatus(), 422);
    EXPECT_EQ(parse(mismatch)["kind"], "InvalidHierarchy");

    auto missing = call(*accountHandler_, "GET", "/api/v1/accounts/nope");
    EXPECT_EQ(missing.getStatus(), 404);

    auto badCategory = call(*accountHandler_, "POST", "/api/v1/accounts",
                            json{{"name", "X"}, {"category", "LUXURY"}});
    EXPECT_EQ(badCategory.getStatus(), 400);
}

TEST_F(LedgerEndpointTest, Accounts_ReparentIntoDescendant_Returns422) {
    auto expenses = rootId("Expenses");
    auto food = createViaHttp("Food", "EXPENSE", expenses);
    auto groceries = createViaHttp("Groceries", "EXPENSE", food);

    auto res = call(*accountHandler_, "PUT", "/api/v1/accounts/" + food + "/parent",
                    json{{"parent_id", groceries}});

    EXPECT_EQ(res.getStatus(), 422);
}

// ============================================================================
// Проводки
// ============================================================================

TEST_F(LedgerEndpointTest, Transactions_PostTransferReverse) {
    auto period = openViaHttp();
    auto income = rootId("Income");
    auto food = createViaHttp("Food", "EXPENSE", rootId("Expenses"));

    auto post = call(*transactionHandler_, "POST", "/api/v1/transactions",
                     json{{"account_id", income}, {"period_id", period}, {"amount", "500.00"}, {"kind", "INCOME"}});
    ASSERT_EQ(post.getStatus(), 201);

    auto transfer = call(*transactionHandler_, "POST", "/api/v1/transfers",
                         json{{"source_account_id", income}, {"destination_account_id", food},
                              {"period_id", period}, {"amount", "120.00"}});
    ASSERT_EQ(transfer.getStatus(), 201);
    EXPECT_EQ(parse(transfer)["debit"]["amount"], "-120.00");
    EXPECT_EQ(parse(transfer)["credit"]["amount"], "120.00");

    auto creditId = parse(transfer)["credit"]["id"].get<std::string>();
    auto reverse = call(*transactionHandler_, "POST", "/api/v1/transactions/" + creditId + "/reverse");
    ASSERT_EQ(reverse.getStatus(), 201);
    EXPECT_EQ(parse(reverse).size(), 2u);

    auto again = call(*transactionHandler_, "POST", "/api/v1/transactions/" + creditId + "/reverse");
    EXPECT_EQ(again.getStatus(), 409);

    auto balance = call(*accountHandler_, "GET", "/api/v1/accounts/" + income + "/balance");
    EXPECT_EQ(parse(balance)["balance"], "500.00");
}

TEST_F(LedgerEndpointTest, Transfers_SameAccount_Returns422) {
    auto period = openViaHttp();
    auto income = rootId("Income");

    auto res = call(*transactionHandler_, "POST", "/api/v1/transfers",
                    json{{"source_account_id", income}, {"destination_account_id", income},
                         {"period_id", period}, {"amount", "1.00"}});

    EXPECT_EQ(res.getStatus(), 422);
    EXPECT_EQ(parse(res)["kind"], "SameAccount");
}

TEST_F(LedgerEndpointTest, Periods_CurrentBeforeFirst_Returns409) {
    openViaHttp();

    auto res = call(*periodHandler_, "GET", "/api/v1/periods/current?date=2023-06-01");

    EXPECT_EQ(res.getStatus(), 409);
    EXPECT_EQ(parse(res)["kind"], "PeriodGapError");
}

// ============================================================================
// Шаблоны и распределение
// ============================================================================

TEST_F(LedgerEndpointTest, Allocation_RunWithTemplates) {
    auto period = openViaHttp();
    auto income = rootId("Income");
    auto rent = createViaHttp("Rent", "EXPENSE", rootId("Expenses"));

    auto tpl = call(*templateHandler_, "POST", "/api/v1/templates",
                    json{{"destination_account_id", rent}, {"rule", {{"type", "FIXED"}, {"amount", "100.00"}}}});
    ASSERT_EQ(tpl.getStatus(), 201);
    EXPECT_EQ(parse(tpl)["rule"]["type"], "FIXED");

    auto run = call(*allocationHandler_, "POST", "/api/v1/allocations/run",
                    json{{"period_id", period}, {"source_account_id", income}, {"pool", "150.00"}});
    ASSERT_EQ(run.getStatus(), 200);
    EXPECT_EQ(parse(run)["total_allocated"], "100.00");
    EXPECT_EQ(parse(run)["remaining_pool"], "50.00");
    EXPECT_EQ(parse(run)["outcomes"][0]["status"], "FUNDED");

    auto badPool = call(*allocationHandler_, "POST", "/api/v1/allocations/run",
                        json{{"period_id", period}, {"source_account_id", income}, {"pool", "0"}});
    EXPECT_EQ(badPool.getStatus(), 422);
}

TEST_F(LedgerEndpointTest, Templates_UnknownRuleType_Returns400) {
    auto rent = createViaHttp("Rent", "EXPENSE", rootId("Expenses"));

    auto res = call(*templateHandler_, "POST", "/api/v1/templates",
                    json{{"destination_account_id", rent}, {"rule", {{"type", "MAGIC"}}}});

    EXPECT_EQ(res.getStatus(), 400);
}

// ============================================================================
// Займы
// ============================================================================

TEST_F(LedgerEndpointTest, Loans_DisburseAccrueRepay) {
    auto period = openViaHttp();
    auto lender = createViaHttp("Emergency", "SAVINGS", "");
    auto borrower = createViaHttp("Car", "EXPENSE", "");

    auto loan = call(*loanHandler_, "POST", "/api/v1/loans",
                     json{{"lender_account_id", lender}, {"borrower_account_id", borrower},
                          {"principal", "1000.00"}, {"rate_per_period", "0.02"}, {"period_id", period}});
    ASSERT_EQ(loan.getStatus(), 201);
    auto loanId = parse(loan)["id"].get<std::string>();

    auto accrued = call(*loanHandler_, "POST", "/api/v1/loans/" + loanId + "/accrue", json{{"period_id", period}});
    ASSERT_EQ(accrued.getStatus(), 200);
    EXPECT_EQ(parse(accrued)["outstanding"], "1020.00");

    auto repay = call(*loanHandler_, "POST", "/api/v1/loans/" + loanId + "/repay",
                      json{{"amount", "1020.00"}, {"period_id", period}});
    ASSERT_EQ(repay.getStatus(), 201);
    EXPECT_EQ(parse(repay)["outstanding_after"], "0.00");

    auto over = call(*loanHandler_, "POST", "/api/v1/loans/" + loanId + "/repay",
                     json{{"amount", "1.00"}, {"period_id", period}});
    EXPECT_EQ(over.getStatus(), 409);
    EXPECT_EQ(parse(over)["kind"], "OverpaymentError");

    auto get = call(*loanHandler_, "GET", "/api/v1/loans/" + loanId);
    EXPECT_EQ(parse(get)["status"], "PAID");
}

// ============================================================================
// Обслуживание
// ============================================================================

TEST_F(LedgerEndpointTest, WeeklyRun_ReturnsReport) {
    auto period = openViaHttp();
    auto income = rootId("Income");
    call(*transactionHandler_, "POST", "/api/v1/transactions",
         json{{"account_id", income}, {"period_id", period}, {"amount", "300.00"}});

    auto res = call(*weeklyRunHandler_, "POST", "/api/v1/weekly-run", json{{"date", "2024-01-03"}});

    ASSERT_EQ(res.getStatus(), 200);
    EXPECT_EQ(parse(res)["period_id"], period);
    EXPECT_EQ(parse(res)["allocation"]["pool"], "300.00");
}

TEST_F(LedgerEndpointTest, Integrity_CleanAfterSetup) {
    rootId("Income");

    auto res = call(*integrityHandler_, "GET", "/api/v1/integrity?fix=false");

    ASSERT_EQ(res.getStatus(), 200);
    EXPECT_TRUE(parse(res)["clean"].get<bool>());
    EXPECT_EQ(parse(res)["accounts_checked"], 2);
}

TEST_F(LedgerEndpointTest, Settings_PartialUpdate) {
    auto put = call(*settingsHandler_, "PUT", "/api/v1/settings",
                    json{{"auto_repay", true}, {"auto_repay_threshold", "25.00"}});
    ASSERT_EQ(put.getStatus(), 200);

    auto get = call(*settingsHandler_, "GET", "/api/v1/settings");
    EXPECT_TRUE(parse(get)["auto_repay"].get<bool>());
    EXPECT_EQ(parse(get)["auto_repay_threshold"], "25.00");
    EXPECT_EQ(parse(get)["week_start_day"], 0);

    auto invalid = call(*settingsHandler_, "PUT", "/api/v1/settings", json{{"week_start_day", 9}});
    EXPECT_EQ(invalid.getStatus(), 422);

    auto offset = call(*settingsHandler_, "PUT", "/api/v1/settings", json{{"utc_offset_minutes", 180}});
    ASSERT_EQ(offset.getStatus(), 200);
    EXPECT_EQ(parse(offset)["utc_offset_minutes"], 180);
}

TEST_F(LedgerEndpointTest, Transactions_AmountBeyondRange_Returns400) {
    auto period = openViaHttp();
    auto income = rootId("Income");

    auto text = call(*transactionHandler_, "POST", "/api/v1/transactions",
                     json{{"account_id", income}, {"period_id", period}, {"amount", "9223372037"}});
    EXPECT_EQ(text.getStatus(), 400);

    auto number = call(*transactionHandler_, "POST", "/api/v1/transactions",
                       json{{"account_id", income}, {"period_id", period}, {"amount", 1e17}});
    EXPECT_EQ(number.getStatus(), 400);

    auto balance = call(*accountHandler_, "GET", "/api/v1/accounts/" + income + "/balance");
    EXPECT_EQ(parse(balance)["balance"], "0.00");
}
