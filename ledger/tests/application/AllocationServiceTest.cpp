#include "LedgerTestBase.hpp"
#include "mocks/FailingRepositories.hpp"

using namespace budget;
using namespace budget::tests;
using domain::AccountCategory;
using domain::AllocationStatus;

class AllocationServiceTest : public LedgerTestBase {
protected:
    void SetUp() override {
        LedgerTestBase::SetUp();
        period_ = openLedger();
        income_ = defaultRoot("Income");
        expenses_ = defaultRoot("Expenses");
        rent_ = createAccount("Rent", AccountCategory::EXPENSE, expenses_.id);
        food_ = createAccount("Food", AccountCategory::EXPENSE, expenses_.id);
        fun_ = createAccount("Fun", AccountCategory::EXPENSE, expenses_.id);
    }

    domain::AllocationReport run(const char* pool, bool reprocess = false) {
        domain::AllocationRunRequest request;
        request.periodId = period_.id;
        request.sourceAccountId = income_.id;
        request.pool = money(pool);
        request.reprocess = reprocess;
        return allocationService_->runAllocation(OWNER, request);
    }

    static domain::FixedRule fixed(const char* amount) { return domain::FixedRule{money(amount)}; }
    static domain::PercentageRule percent(const char* value) {
        return domain::PercentageRule{domain::Rate::fromString(value)};
    }
    static domain::RangeRule range(const char* min, const char* max) {
        return domain::RangeRule{money(min), money(max)};
    }

    domain::WeeklyPeriod period_;
    domain::Account income_;
    domain::Account expenses_;
    domain::Account rent_;
    domain::Account food_;
    domain::Account fun_;
};

TEST_F(AllocationServiceTest, FixedTemplate_FundedFromPool) {
    createTemplate(rent_.id, fixed("100.00"));

    auto report = run("150.00");

    ASSERT_EQ(report.outcomes.size(), 1u);
    EXPECT_EQ(report.outcomes[0].status, AllocationStatus::FUNDED);
    EXPECT_EQ(report.totalAllocated, money("100.00"));
    EXPECT_EQ(report.remainingPool, money("50.00"));
    EXPECT_EQ(cached(rent_.id), money("100.00"));
    EXPECT_EQ(cached(income_.id), money("-100.00"));
}

TEST_F(AllocationServiceTest, PercentageTemplates_UseOriginalPool) {
    createTemplate(rent_.id, percent("30"), 1);
    createTemplate(food_.id, percent("25"), 2);

    auto report = run("200.00");

    ASSERT_EQ(report.outcomes.size(), 2u);
    EXPECT_EQ(report.outcomes[0].allocated, money("60.00"));
    EXPECT_EQ(report.outcomes[1].allocated, money("50.00"));
    EXPECT_EQ(report.remainingPool, money("90.00"));
}

TEST_F(AllocationServiceTest, RangeTemplate_BelowFloorIsSkipped) {
    createTemplate(rent_.id, fixed("140.00"), 1);
    createTemplate(food_.id, range("20.00", "50.00"), 2);

    auto report = run("150.00");

    EXPECT_EQ(report.outcomes[1].status, AllocationStatus::SKIPPED_BELOW_FLOOR);
    EXPECT_EQ(report.remainingPool, money("10.00"));
    EXPECT_EQ(cached(food_.id), domain::Money::zero());
}

TEST_F(AllocationServiceTest, FixedAboveSmallPool_TakesWholePool) {
    createTemplate(rent_.id, fixed("150.00"));

    auto report = run("100.00");

    EXPECT_EQ(report.outcomes[0].status, AllocationStatus::PARTIALLY_FUNDED);
    EXPECT_EQ(report.outcomes[0].nominal, money("150.00"));
    EXPECT_EQ(report.outcomes[0].allocated, money("100.00"));
    EXPECT_EQ(report.remainingPool, domain::Money::zero());
}

TEST_F(AllocationServiceTest, PercentageThenFixed) {
    createTemplate(rent_.id, percent("30"), 1);
    createTemplate(food_.id, fixed("50.00"), 2);

    auto report = run("200.00");

    EXPECT_EQ(cached(rent_.id), money("60.00"));
    EXPECT_EQ(cached(food_.id), money("50.00"));
    EXPECT_EQ(report.remainingPool, money("90.00"));
}

TEST_F(AllocationServiceTest, RangeFloorAbovePool_NothingMoves) {
    createTemplate(food_.id, range("20.00", "50.00"));
    auto journalSize = transactionRepo_->count();

    auto report = run("10.00");

    EXPECT_EQ(report.outcomes[0].status, AllocationStatus::SKIPPED_BELOW_FLOOR);
    EXPECT_EQ(report.remainingPool, money("10.00"));
    EXPECT_EQ(transactionRepo_->count(), journalSize);
}

TEST_F(AllocationServiceTest, RangeTemplate_TakesUpToMax) {
    createTemplate(food_.id, range("20.00", "50.00"));

    auto report = run("35.00");

    EXPECT_EQ(report.outcomes[0].status, AllocationStatus::FUNDED);
    EXPECT_EQ(report.outcomes[0].allocated, money("35.00"));
}

TEST_F(AllocationServiceTest, FixedTemplate_PartiallyFundedThenPoolExhausted) {
    createTemplate(rent_.id, fixed("100.00"), 1);
    createTemplate(food_.id, fixed("10.00"), 2);

    auto report = run("80.00");

    EXPECT_EQ(report.outcomes[0].status, AllocationStatus::PARTIALLY_FUNDED);
    EXPECT_EQ(report.outcomes[0].allocated, money("80.00"));
    EXPECT_EQ(report.outcomes[1].status, AllocationStatus::SKIPPED_POOL_EXHAUSTED);

    auto stored = allocationService_->listAllocations(OWNER, period_.id);
    ASSERT_EQ(stored.size(), 1u);
    EXPECT_TRUE(stored[0].partiallyFunded);
}

TEST_F(AllocationServiceTest, PriorityThenCreationOrder) {
    createTemplate(fun_.id, fixed("30.00"), 5);
    createTemplate(rent_.id, fixed("30.00"), 1);
    createTemplate(food_.id, fixed("30.00"), 1);

    auto report = run("60.00");

    EXPECT_EQ(report.outcomes[0].destinationAccountId, rent_.id);
    EXPECT_EQ(report.outcomes[1].destinationAccountId, food_.id);
    EXPECT_EQ(report.outcomes[2].status, AllocationStatus::SKIPPED_POOL_EXHAUSTED);
}

TEST_F(AllocationServiceTest, InactiveTemplatesAreIgnored) {
    auto t = createTemplate(rent_.id, fixed("10.00"));
    templateService_->setTemplateActive(OWNER, t.id, false);

    auto report = run("50.00");

    EXPECT_TRUE(report.outcomes.empty());
    EXPECT_EQ(report.remainingPool, money("50.00"));
}

TEST_F(AllocationServiceTest, SecondRun_IsIdempotent) {
    createTemplate(rent_.id, fixed("100.00"));
    createTemplate(food_.id, percent("10"));
    run("200.00");
    auto journalSize = transactionRepo_->count();

    auto again = run("200.00");

    EXPECT_EQ(again.countWithStatus(AllocationStatus::SKIPPED_ALREADY_PROCESSED), 2u);
    EXPECT_EQ(again.totalAllocated, money("120.00"));
    EXPECT_EQ(transactionRepo_->count(), journalSize);
    EXPECT_EQ(cached(rent_.id), money("100.00"));
    EXPECT_EQ(cached(food_.id), money("20.00"));
}

TEST_F(AllocationServiceTest, Reprocess_ReversesThenReallocates) {
    auto t = createTemplate(rent_.id, fixed("100.00"));
    run("200.00");
    domain::TemplateUpdate update;
    update.rule = domain::AllocationRule{fixed("70.00")};
    templateService_->updateTemplate(OWNER, t.id, update);

    auto report = run("200.00", true);

    EXPECT_EQ(report.reversedAllocations, 1);
    EXPECT_EQ(report.outcomes[0].status, AllocationStatus::FUNDED);
    EXPECT_EQ(cached(rent_.id), money("70.00"));
    EXPECT_EQ(cached(income_.id), money("-70.00"));

    int reversed = 0;
    for (const auto& allocation : allocationService_->listAllocations(OWNER, period_.id)) {
        reversed += allocation.reversed ? 1 : 0;
    }
    EXPECT_EQ(reversed, 1);
}

TEST_F(AllocationServiceTest, FailedTemplate_DoesNotStopRun) {
    createTemplate(rent_.id, fixed("10.00"), 1);
    createTemplate(food_.id, fixed("10.00"), 2);
    accountService_->deactivate(OWNER, rent_.id);

    auto report = run("50.00");

    EXPECT_EQ(report.outcomes[0].status, AllocationStatus::FAILED);
    EXPECT_FALSE(report.outcomes[0].error.empty());
    EXPECT_EQ(report.outcomes[1].status, AllocationStatus::FUNDED);
    EXPECT_EQ(report.remainingPool, money("40.00"));
}

TEST_F(AllocationServiceTest, NonPositivePool_Throws) {
    EXPECT_THROW(run("0"), domain::InvalidPool);
    EXPECT_THROW(run("-1.00"), domain::InvalidPool);
}

TEST_F(AllocationServiceTest, ManualAllocation_PostsTransfer) {
    domain::ManualAllocationRequest request;
    request.sourceAccountId = income_.id;
    request.destinationAccountId = fun_.id;
    request.periodId = period_.id;
    request.amount = money("15.00");
    request.notes = "Cinema";

    auto allocation = allocationService_->allocateManually(OWNER, request);

    EXPECT_TRUE(allocation.isManual());
    EXPECT_TRUE(allocation.processed);
    EXPECT_EQ(cached(fun_.id), money("15.00"));
    EXPECT_EQ(allocationService_->listAllocations(OWNER, period_.id).size(), 1u);
}

TEST_F(AllocationServiceTest, AllocationNotSaved_TransferRolledBack_RerunFundsOnce) {
    auto failing = std::make_shared<mocks::FailingAllocationRepository>();
    allocationRepo_ = failing;
    buildServices(transactionRepo_);
    createTemplate(food_.id, fixed("40.00"));

    failing->failSaves = 1;
    EXPECT_THROW(run("100.00"), std::runtime_error);

    EXPECT_EQ(cached(food_.id), money("0.00"));
    EXPECT_EQ(cached(income_.id), money("0.00"));
    EXPECT_EQ(transactionRepo_->count(), 0u);
    EXPECT_TRUE(allocationService_->listAllocations(OWNER, period_.id).empty());

    auto report = run("100.00");

    ASSERT_EQ(report.outcomes.size(), 1u);
    EXPECT_EQ(report.outcomes[0].status, AllocationStatus::FUNDED);
    EXPECT_EQ(cached(food_.id), money("40.00"));
    EXPECT_EQ(posting_->fold(food_.id), money("40.00"));
    EXPECT_EQ(transactionRepo_->count(), 2u);

    run("100.00");
    EXPECT_EQ(cached(food_.id), money("40.00"));
}

TEST_F(AllocationServiceTest, ManualAllocationNotSaved_LeavesNoLegs) {
    auto failing = std::make_shared<mocks::FailingAllocationRepository>();
    allocationRepo_ = failing;
    buildServices(transactionRepo_);
    failing->failSaves = 1;

    domain::ManualAllocationRequest request;
    request.sourceAccountId = income_.id;
    request.destinationAccountId = fun_.id;
    request.periodId = period_.id;
    request.amount = money("15.00");

    EXPECT_THROW(allocationService_->allocateManually(OWNER, request), std::runtime_error);
    EXPECT_EQ(cached(fun_.id), money("0.00"));
    EXPECT_EQ(transactionRepo_->count(), 0u);
}
