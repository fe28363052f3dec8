#include <gtest/gtest.h>

#include "domain/AccountHierarchy.hpp"

using namespace budget::domain;

namespace {

Account account(const std::string& id, AccountCategory category,
                const std::optional<std::string>& parentId = std::nullopt) {
    Account a(id, "owner", "name-" + id, category, parentId);
    return a;
}

} // namespace

class AccountHierarchyTest : public ::testing::Test {
protected:
    void SetUp() override {
        // expenses ─┬─ food ── groceries
        //           └─ rent
        // income
        accounts_ = {
            account("expenses", AccountCategory::EXPENSE),
            account("food", AccountCategory::EXPENSE, std::string("expenses")),
            account("groceries", AccountCategory::EXPENSE, std::string("food")),
            account("rent", AccountCategory::EXPENSE, std::string("expenses")),
            account("income", AccountCategory::INCOME),
        };
        accounts_[0].isRoot = true;
        accounts_[4].isRoot = true;
        index_ = AccountHierarchy::index(accounts_);
    }

    std::vector<Account> accounts_;
    AccountHierarchy::Index index_;
};

TEST_F(AccountHierarchyTest, ChainContains) {
    EXPECT_TRUE(AccountHierarchy::chainContains(index_, "groceries", "expenses"));
    EXPECT_TRUE(AccountHierarchy::chainContains(index_, "groceries", "groceries"));
    EXPECT_FALSE(AccountHierarchy::chainContains(index_, "rent", "food"));
}

TEST_F(AccountHierarchyTest, Descendants_BreadthFirst) {
    auto below = AccountHierarchy::descendants(index_, "expenses");

    ASSERT_EQ(below.size(), 3u);
    EXPECT_EQ(below.back(), "groceries");
    EXPECT_TRUE(AccountHierarchy::descendants(index_, "income").empty());
}

TEST_F(AccountHierarchyTest, RootAncestor) {
    EXPECT_EQ(AccountHierarchy::rootAncestor(index_, "groceries").id, "expenses");
    EXPECT_EQ(AccountHierarchy::rootAncestor(index_, "income").id, "income");
    EXPECT_THROW(AccountHierarchy::rootAncestor(index_, "missing"), UnknownAccount);
}

TEST_F(AccountHierarchyTest, ValidatePlacement_RejectsCycle) {
    const auto& food = index_.at("food");
    const auto& groceries = index_.at("groceries");

    EXPECT_THROW(AccountHierarchy::validatePlacement(index_, food, groceries), InvalidHierarchy);
    EXPECT_THROW(AccountHierarchy::validatePlacement(index_, food, food), InvalidHierarchy);
}

TEST_F(AccountHierarchyTest, ValidatePlacement_RejectsCategoryMismatch) {
    auto salary = account("salary", AccountCategory::INCOME);

    EXPECT_THROW(AccountHierarchy::validatePlacement(index_, salary, index_.at("food")), InvalidHierarchy);
    EXPECT_NO_THROW(AccountHierarchy::validatePlacement(index_, salary, index_.at("income")));
}

TEST_F(AccountHierarchyTest, ValidatePlacement_RejectsInactiveParentAndRootChild) {
    auto parent = index_.at("rent");
    parent.active = false;
    index_["rent"] = parent;
    auto utilities = account("utilities", AccountCategory::EXPENSE);

    EXPECT_THROW(AccountHierarchy::validatePlacement(index_, utilities, index_.at("rent")), InvalidHierarchy);
    EXPECT_THROW(AccountHierarchy::validatePlacement(index_, index_.at("income"), index_.at("food")),
                 InvalidHierarchy);
}

TEST_F(AccountHierarchyTest, ValidateSiblingName) {
    EXPECT_THROW(AccountHierarchy::validateSiblingName(index_, std::string("expenses"), "name-food"),
                 InvalidHierarchy);
    EXPECT_NO_THROW(AccountHierarchy::validateSiblingName(index_, std::string("expenses"), "name-food", "food"));
    EXPECT_NO_THROW(AccountHierarchy::validateSiblingName(index_, std::nullopt, "name-food"));
}

TEST_F(AccountHierarchyTest, BuildTree_SortsAndHidesInactiveSubtrees) {
    accounts_[1].active = false;    // food
    accounts_[1].sortOrder = 0;
    accounts_[3].sortOrder = -1;    // rent раньше food

    auto full = AccountHierarchy::buildTree("owner", accounts_, true);
    ASSERT_EQ(full.childrenOf("expenses").size(), 2u);
    EXPECT_EQ(full.childrenOf("expenses").front(), "rent");

    auto visible = AccountHierarchy::buildTree("owner", accounts_, false);
    EXPECT_EQ(visible.accounts.count("food"), 0u);
    // groceries не попадает в корни: её родитель существует, просто скрыт
    EXPECT_EQ(visible.roots.size(), 2u);
}

TEST_F(AccountHierarchyTest, FullPath) {
    EXPECT_EQ(AccountHierarchy::fullPath(index_, "groceries"), "name-expenses > name-food > name-groceries");
}

TEST_F(AccountHierarchyTest, FindCycles) {
    EXPECT_TRUE(AccountHierarchy::findCycles(index_).empty());

    index_["expenses"].parentId = "groceries";
    auto cycles = AccountHierarchy::findCycles(index_);

    ASSERT_EQ(cycles.size(), 1u);
    EXPECT_EQ(cycles.front().size(), 3u);
}
