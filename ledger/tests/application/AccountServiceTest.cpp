#include "LedgerTestBase.hpp"

#include <random>

using namespace budget;
using namespace budget::tests;
using domain::AccountCategory;

class AccountServiceTest : public LedgerTestBase {};

// ============================================
// CREATE
// ============================================

TEST_F(AccountServiceTest, CreateAccount_TopLevel) {
    auto account = createAccount("Groceries", AccountCategory::EXPENSE);

    EXPECT_FALSE(account.id.empty());
    EXPECT_EQ(account.ownerId, OWNER);
    EXPECT_TRUE(account.isTopLevel());
    EXPECT_TRUE(account.active);
    EXPECT_EQ(accountRepo_->count(), 1u);

    auto history = accountService_->getAccountHistory(OWNER, account.id);
    ASSERT_EQ(history.size(), 1u);
    EXPECT_EQ(history[0].action, domain::AccountAction::CREATED);
}

TEST_F(AccountServiceTest, CreateAccount_TrimsAndRequiresName) {
    EXPECT_EQ(createAccount("  Rent ", AccountCategory::EXPENSE).name, "Rent");
    EXPECT_THROW(createAccount("   ", AccountCategory::EXPENSE), domain::InvalidArgument);
}

TEST_F(AccountServiceTest, CreateAccount_UnderParentOfOtherCategory_Throws) {
    auto income = defaultRoot("Income");

    EXPECT_THROW(createAccount("Food", AccountCategory::EXPENSE, income.id), domain::InvalidHierarchy);
}

TEST_F(AccountServiceTest, CreateAccount_UnknownParent_Throws) {
    EXPECT_THROW(createAccount("Food", AccountCategory::EXPENSE, std::string("nope")), domain::UnknownAccount);
}

TEST_F(AccountServiceTest, CreateAccount_ParentOfOtherOwner_Throws) {
    domain::AccountRequest foreign;
    foreign.name = "Expenses";
    foreign.category = AccountCategory::EXPENSE;
    auto theirs = accountService_->createAccount("family-2", foreign);

    EXPECT_THROW(createAccount("Food", AccountCategory::EXPENSE, theirs.id), domain::InvalidHierarchy);
    EXPECT_TRUE(accountService_->getAccounts(OWNER).empty());
}

TEST_F(AccountServiceTest, Reparent_UnderOtherOwnersAccount_Throws) {
    domain::AccountRequest foreign;
    foreign.name = "Expenses";
    foreign.category = AccountCategory::EXPENSE;
    auto theirs = accountService_->createAccount("family-2", foreign);
    auto food = createAccount("Food", AccountCategory::EXPENSE);

    EXPECT_THROW(accountService_->reparent(OWNER, food.id, theirs.id), domain::InvalidHierarchy);
    EXPECT_TRUE(accountService_->getAccount(OWNER, food.id)->isTopLevel());
}

TEST_F(AccountServiceTest, CreateAccount_DuplicateSiblingName_Throws) {
    auto expenses = defaultRoot("Expenses");
    createAccount("Food", AccountCategory::EXPENSE, expenses.id);

    EXPECT_THROW(createAccount("Food", AccountCategory::EXPENSE, expenses.id), domain::InvalidHierarchy);
    EXPECT_NO_THROW(createAccount("Food", AccountCategory::EXPENSE));
}

TEST_F(AccountServiceTest, SetupDefaultAccounts_Idempotent) {
    auto first = accountService_->setupDefaultAccounts(OWNER);
    auto second = accountService_->setupDefaultAccounts(OWNER);

    EXPECT_EQ(first.size(), 2u);
    EXPECT_EQ(second.size(), 2u);
    EXPECT_EQ(accountRepo_->count(), 2u);
    for (const auto& root : second) {
        EXPECT_TRUE(root.isRoot);
    }
}

// ============================================
// STRUCTURE EDITS
// ============================================

TEST_F(AccountServiceTest, Reparent_MovesAndRecordsEvent) {
    auto expenses = defaultRoot("Expenses");
    auto food = createAccount("Food", AccountCategory::EXPENSE);

    auto moved = accountService_->reparent(OWNER, food.id, expenses.id);

    EXPECT_EQ(moved.parentId, expenses.id);
    EXPECT_EQ(accountService_->getFullPath(OWNER, food.id), "Expenses > Food");
    auto history = accountService_->getAccountHistory(OWNER, food.id);
    ASSERT_EQ(history.size(), 2u);
    EXPECT_EQ(history[1].action, domain::AccountAction::MOVED);
    EXPECT_EQ(history[1].newValue, expenses.id);
}

TEST_F(AccountServiceTest, Reparent_UnderOwnDescendant_Throws) {
    auto a = createAccount("A", AccountCategory::EXPENSE);
    auto b = createAccount("B", AccountCategory::EXPENSE, a.id);
    auto c = createAccount("C", AccountCategory::EXPENSE, b.id);

    EXPECT_THROW(accountService_->reparent(OWNER, a.id, c.id), domain::InvalidHierarchy);
    EXPECT_FALSE(accountService_->getAccount(OWNER, a.id)->parentId.has_value());
}

TEST_F(AccountServiceTest, RandomReparenting_NeverCreatesCycle) {
    std::vector<std::string> ids;
    for (int i = 0; i < 12; ++i) {
        ids.push_back(createAccount("Envelope " + std::to_string(i), AccountCategory::EXPENSE).id);
    }

    std::mt19937 rng(20240101);
    std::uniform_int_distribution<size_t> pick(0, ids.size());
    int rejected = 0;

    for (int step = 0; step < 300; ++step) {
        const auto& child = ids[pick(rng) % ids.size()];
        size_t target = pick(rng);
        std::optional<std::string> parent;
        if (target < ids.size()) {
            parent = ids[target];
        }

        try {
            accountService_->reparent(OWNER, child, parent);
        } catch (const domain::InvalidHierarchy&) {
            ++rejected;
        }

        auto index = domain::AccountHierarchy::index(accountRepo_->findByOwner(OWNER));
        ASSERT_TRUE(domain::AccountHierarchy::findCycles(index).empty()) << "step " << step;
    }

    EXPECT_GT(rejected, 0);
}

TEST_F(AccountServiceTest, Rename_ConflictWithSibling_Throws) {
    auto a = createAccount("A", AccountCategory::EXPENSE);
    createAccount("B", AccountCategory::EXPENSE);

    EXPECT_THROW(accountService_->rename(OWNER, a.id, "B"), domain::InvalidHierarchy);
    EXPECT_EQ(accountService_->rename(OWNER, a.id, "Alpha").name, "Alpha");
}

TEST_F(AccountServiceTest, Deactivate_CascadesToSubtree) {
    auto a = createAccount("A", AccountCategory::EXPENSE);
    auto b = createAccount("B", AccountCategory::EXPENSE, a.id);
    auto c = createAccount("C", AccountCategory::EXPENSE, b.id);

    accountService_->deactivate(OWNER, a.id);

    EXPECT_FALSE(accountService_->getAccount(OWNER, b.id)->active);
    EXPECT_FALSE(accountService_->getAccount(OWNER, c.id)->active);
    EXPECT_TRUE(accountService_->getTree(OWNER, false).roots.empty());
    EXPECT_EQ(accountService_->getTree(OWNER, true).accounts.size(), 3u);
}

TEST_F(AccountServiceTest, Activate_UnderInactiveParent_Throws) {
    auto a = createAccount("A", AccountCategory::EXPENSE);
    auto b = createAccount("B", AccountCategory::EXPENSE, a.id);
    accountService_->deactivate(OWNER, a.id);

    EXPECT_THROW(accountService_->activate(OWNER, b.id), domain::InvalidHierarchy);

    accountService_->activate(OWNER, a.id);
    EXPECT_TRUE(accountService_->activate(OWNER, b.id).active);
}

// ============================================
// REMOVE
// ============================================

TEST_F(AccountServiceTest, Remove_WithoutHistory_DeletesSubtree) {
    auto a = createAccount("A", AccountCategory::EXPENSE);
    createAccount("B", AccountCategory::EXPENSE, a.id);

    auto removal = accountService_->removeAccount(OWNER, a.id);

    EXPECT_TRUE(removal.hardDeleted);
    EXPECT_EQ(removal.accountIds.size(), 2u);
    EXPECT_EQ(accountRepo_->count(), 0u);
}

TEST_F(AccountServiceTest, Remove_WithHistory_Deactivates) {
    auto period = openLedger();
    auto a = createAccount("A", AccountCategory::EXPENSE);
    auto b = createAccount("B", AccountCategory::EXPENSE, a.id);
    postIncome(b.id, period.id, "10.00");

    auto removal = accountService_->removeAccount(OWNER, a.id);

    EXPECT_FALSE(removal.hardDeleted);
    EXPECT_FALSE(accountService_->getAccount(OWNER, a.id)->active);
    EXPECT_FALSE(accountService_->getAccount(OWNER, b.id)->active);
}

// ============================================
// OWNERSHIP
// ============================================

TEST_F(AccountServiceTest, OtherOwnerCannotSeeAccount) {
    auto a = createAccount("A", AccountCategory::EXPENSE);

    EXPECT_FALSE(accountService_->getAccount("family-2", a.id).has_value());
    EXPECT_THROW(accountService_->rename("family-2", a.id, "X"), domain::UnknownAccount);
    EXPECT_TRUE(accountService_->getAccounts("family-2").empty());
}
