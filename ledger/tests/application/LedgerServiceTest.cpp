#include "LedgerTestBase.hpp"
#include "mocks/MockTransactionRepository.hpp"

#include <gmock/gmock.h>

using namespace budget;
using namespace budget::tests;
using domain::AccountCategory;
using ::testing::_;
using ::testing::NiceMock;
using ::testing::Throw;

class LedgerServiceTest : public LedgerTestBase {
protected:
    void SetUp() override {
        LedgerTestBase::SetUp();
        period_ = openLedger();
        wallet_ = createAccount("Wallet", AccountCategory::INCOME);
        savings_ = createAccount("Savings", AccountCategory::SAVINGS);
    }

    domain::TransferLegs transfer(const char* amount) {
        domain::TransferRequest request;
        request.sourceAccountId = wallet_.id;
        request.destinationAccountId = savings_.id;
        request.periodId = period_.id;
        request.amount = money(amount);
        return ledgerService_->postTransfer(OWNER, request);
    }

    domain::WeeklyPeriod period_;
    domain::Account wallet_;
    domain::Account savings_;
};

// ============================================
// POST
// ============================================

TEST_F(LedgerServiceTest, Post_UpdatesJournalAndCache) {
    auto tx = postIncome(wallet_.id, period_.id, "250.00");

    EXPECT_EQ(tx.periodStart, period_.startDate);
    EXPECT_GT(tx.sequence, 0);
    EXPECT_EQ(cached(wallet_.id), money("250.00"));
    EXPECT_EQ(ledgerService_->getBalance(OWNER, wallet_.id), money("250.00"));
}

TEST_F(LedgerServiceTest, Post_ZeroAmount_Throws) {
    EXPECT_THROW(postIncome(wallet_.id, period_.id, "0"), domain::InvalidAmount);
}

TEST_F(LedgerServiceTest, Post_InactiveAccount_Throws) {
    accountService_->deactivate(OWNER, wallet_.id);

    EXPECT_THROW(postIncome(wallet_.id, period_.id, "1.00"), domain::InvalidState);
}

TEST_F(LedgerServiceTest, Post_UnknownPeriod_Throws) {
    EXPECT_THROW(postIncome(wallet_.id, "no-such-period", "1.00"), domain::UnknownPeriod);
}

TEST_F(LedgerServiceTest, Post_NegativeAmountIsDebit) {
    postIncome(wallet_.id, period_.id, "100.00");

    domain::PostingRequest expense;
    expense.accountId = wallet_.id;
    expense.periodId = period_.id;
    expense.amount = money("-30.00");
    expense.kind = domain::TransactionKind::EXPENSE;
    ledgerService_->post(OWNER, expense);

    EXPECT_EQ(cached(wallet_.id), money("70.00"));
}

// ============================================
// TRANSFER
// ============================================

TEST_F(LedgerServiceTest, Transfer_BothLegsShareTransferId) {
    postIncome(wallet_.id, period_.id, "100.00");

    auto legs = transfer("40.00");

    ASSERT_TRUE(legs.debit.transferId.has_value());
    EXPECT_EQ(legs.debit.transferId, legs.credit.transferId);
    EXPECT_EQ(legs.debit.amount + legs.credit.amount, domain::Money::zero());
    EXPECT_EQ(cached(wallet_.id), money("60.00"));
    EXPECT_EQ(cached(savings_.id), money("40.00"));
}

TEST_F(LedgerServiceTest, Transfer_SameAccount_Throws) {
    domain::TransferRequest request;
    request.sourceAccountId = wallet_.id;
    request.destinationAccountId = wallet_.id;
    request.periodId = period_.id;
    request.amount = money("1.00");

    EXPECT_THROW(ledgerService_->postTransfer(OWNER, request), domain::SameAccount);
}

TEST_F(LedgerServiceTest, Transfer_NonPositive_Throws) {
    EXPECT_THROW(transfer("-5.00"), domain::InvalidAmount);
}

TEST_F(LedgerServiceTest, Transfer_StorageFailure_LeavesNoLeg) {
    auto failing = std::make_shared<NiceMock<mocks::MockTransactionRepository>>();
    EXPECT_CALL(*failing, append(_)).WillOnce(Throw(std::runtime_error("disk full")));
    buildServices(failing);

    EXPECT_THROW(transfer("10.00"), std::runtime_error);

    EXPECT_EQ(cached(wallet_.id), domain::Money::zero());
    EXPECT_EQ(cached(savings_.id), domain::Money::zero());
    EXPECT_EQ(transactionRepo_->count(), 0u);
}

// ============================================
// REVERSE
// ============================================

TEST_F(LedgerServiceTest, Reverse_RestoresBalance) {
    auto tx = postIncome(wallet_.id, period_.id, "123.45");

    auto reversals = ledgerService_->reverse(OWNER, tx.id, period_.id, "");

    ASSERT_EQ(reversals.size(), 1u);
    EXPECT_EQ(reversals[0].reversesId, tx.id);
    EXPECT_EQ(reversals[0].amount, money("-123.45"));
    EXPECT_EQ(cached(wallet_.id), domain::Money::zero());
    EXPECT_EQ(ledgerService_->getBalance(OWNER, wallet_.id), domain::Money::zero());
}

TEST_F(LedgerServiceTest, Reverse_Twice_Throws) {
    auto tx = postIncome(wallet_.id, period_.id, "10.00");
    auto reversals = ledgerService_->reverse(OWNER, tx.id, period_.id, "");

    EXPECT_THROW(ledgerService_->reverse(OWNER, tx.id, period_.id, ""), domain::InvalidState);
    EXPECT_THROW(ledgerService_->reverse(OWNER, reversals[0].id, period_.id, ""), domain::InvalidState);
}

TEST_F(LedgerServiceTest, Reverse_TransferLeg_ReversesBothLegs) {
    postIncome(wallet_.id, period_.id, "100.00");
    auto legs = transfer("25.00");

    auto reversals = ledgerService_->reverse(OWNER, legs.credit.id, period_.id, "mistake");

    ASSERT_EQ(reversals.size(), 2u);
    EXPECT_TRUE(reversals[0].transferId.has_value());
    EXPECT_NE(reversals[0].transferId, legs.debit.transferId);
    EXPECT_EQ(reversals[0].description, "mistake");
    EXPECT_EQ(cached(wallet_.id), money("100.00"));
    EXPECT_EQ(cached(savings_.id), domain::Money::zero());
}

TEST_F(LedgerServiceTest, Reverse_UnknownTransaction_Throws) {
    EXPECT_THROW(ledgerService_->reverse(OWNER, "missing", period_.id, ""), domain::UnknownTransaction);
}

// ============================================
// QUERIES
// ============================================

TEST_F(LedgerServiceTest, History_NewestFirstAndFilteredByRange) {
    auto second = periodService_->currentPeriod(OWNER, date("2024-01-09"));
    auto t1 = postIncome(wallet_.id, period_.id, "1.00");
    auto t2 = postIncome(wallet_.id, second.id, "2.00");
    auto t3 = postIncome(wallet_.id, second.id, "3.00");

    std::vector<std::string> ids;
    for (const auto& tx : ledgerService_->history(OWNER, wallet_.id)) {
        ids.push_back(tx.id);
    }
    EXPECT_EQ(ids, (std::vector<std::string>{t3.id, t2.id, t1.id}));

    domain::PeriodRange firstWeek{date("2024-01-01"), date("2024-01-08")};
    std::vector<std::string> filtered;
    for (const auto& tx : ledgerService_->history(OWNER, wallet_.id, firstWeek)) {
        filtered.push_back(tx.id);
    }
    EXPECT_EQ(filtered, std::vector<std::string>{t1.id});
}

TEST_F(LedgerServiceTest, GetBalance_AsOfPeriod) {
    auto second = periodService_->currentPeriod(OWNER, date("2024-01-09"));
    postIncome(wallet_.id, period_.id, "10.00");
    postIncome(wallet_.id, second.id, "5.00");

    EXPECT_EQ(ledgerService_->getBalance(OWNER, wallet_.id, period_.id), money("10.00"));
    EXPECT_EQ(ledgerService_->getBalance(OWNER, wallet_.id, second.id), money("15.00"));
}

TEST_F(LedgerServiceTest, BalanceWithDescendants) {
    auto child = createAccount("Emergency", AccountCategory::SAVINGS, savings_.id);
    postIncome(savings_.id, period_.id, "10.00");
    postIncome(child.id, period_.id, "7.50");

    EXPECT_EQ(ledgerService_->getBalanceWithDescendants(OWNER, savings_.id), money("17.50"));
}

TEST_F(LedgerServiceTest, RecomputeBalances_FixesDriftedCache) {
    postIncome(wallet_.id, period_.id, "42.00");
    accountRepo_->setCachedBalance(wallet_.id, money("1.00"));

    EXPECT_EQ(ledgerService_->recomputeBalances(OWNER), 1);
    EXPECT_EQ(cached(wallet_.id), money("42.00"));
    EXPECT_EQ(ledgerService_->recomputeBalances(OWNER), 0);
}

TEST_F(LedgerServiceTest, GetTransaction_OtherOwner_NotFound) {
    auto tx = postIncome(wallet_.id, period_.id, "1.00");

    EXPECT_TRUE(ledgerService_->getTransaction(OWNER, tx.id).has_value());
    EXPECT_FALSE(ledgerService_->getTransaction("family-2", tx.id).has_value());
}
