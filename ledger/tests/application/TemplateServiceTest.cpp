#include "LedgerTestBase.hpp"

using namespace budget;
using namespace budget::tests;
using domain::AccountCategory;

class TemplateServiceTest : public LedgerTestBase {
protected:
    void SetUp() override {
        LedgerTestBase::SetUp();
        rent_ = createAccount("Rent", AccountCategory::EXPENSE);
        savings_ = createAccount("Savings", AccountCategory::SAVINGS);
    }

    domain::Account rent_;
    domain::Account savings_;
};

// ============================================================================
// Создание
// ============================================================================

TEST_F(TemplateServiceTest, CreateTemplate_AssignsIdAndCreationOrder) {
    auto first = createTemplate(rent_.id, domain::FixedRule{money("800.00")});
    auto second = createTemplate(savings_.id, domain::PercentageRule{domain::Rate::fromString("10")});

    EXPECT_FALSE(first.id.empty());
    EXPECT_LT(first.creationOrder, second.creationOrder);
    EXPECT_EQ(first.ownerId, OWNER);
    EXPECT_TRUE(first.active);
}

TEST_F(TemplateServiceTest, CreateTemplate_UnknownDestination_Throws) {
    EXPECT_THROW(createTemplate("missing", domain::FixedRule{money("1.00")}), domain::UnknownAccount);
}

TEST_F(TemplateServiceTest, CreateTemplate_InvalidRules_Throw) {
    EXPECT_THROW(createTemplate(rent_.id, domain::FixedRule{money("0")}), domain::InvalidAmount);
    EXPECT_THROW(createTemplate(rent_.id, domain::PercentageRule{domain::Rate::fromString("101")}),
                 domain::InvalidAmount);
    EXPECT_THROW(createTemplate(rent_.id, domain::RangeRule{money("50.00"), money("20.00")}),
                 domain::InvalidAmount);
    EXPECT_TRUE(templateService_->listTemplates(OWNER, false).empty());
}

// ============================================================================
// Изменение
// ============================================================================

TEST_F(TemplateServiceTest, UpdateTemplate_ChangesOnlyGivenFields) {
    auto created = createTemplate(rent_.id, domain::FixedRule{money("800.00")}, 2);

    domain::TemplateUpdate update;
    update.rule = domain::AllocationRule{domain::RangeRule{money("100.00"), money("300.00")}};
    update.notes = "Flexible";
    auto updated = templateService_->updateTemplate(OWNER, created.id, update);

    EXPECT_EQ(domain::ruleTypeName(updated.rule), "RANGE");
    EXPECT_EQ(updated.priority, 2);
    EXPECT_EQ(updated.destinationAccountId, rent_.id);
    EXPECT_EQ(templateService_->getTemplate(OWNER, created.id)->notes, "Flexible");
}

TEST_F(TemplateServiceTest, UpdateTemplate_InvalidRule_KeepsStored) {
    auto created = createTemplate(rent_.id, domain::FixedRule{money("800.00")});

    domain::TemplateUpdate update;
    update.rule = domain::AllocationRule{domain::FixedRule{money("-5.00")}};

    EXPECT_THROW(templateService_->updateTemplate(OWNER, created.id, update), domain::InvalidAmount);
    EXPECT_EQ(domain::ruleTypeName(templateService_->getTemplate(OWNER, created.id)->rule), "FIXED");
}

TEST_F(TemplateServiceTest, SetTemplateActive_FiltersActiveList) {
    auto a = createTemplate(rent_.id, domain::FixedRule{money("1.00")});
    createTemplate(savings_.id, domain::FixedRule{money("2.00")});

    templateService_->setTemplateActive(OWNER, a.id, false);

    EXPECT_EQ(templateService_->listTemplates(OWNER, true).size(), 1u);
    EXPECT_EQ(templateService_->listTemplates(OWNER, false).size(), 2u);
}

TEST_F(TemplateServiceTest, DeleteTemplate_RemovesIt) {
    auto created = createTemplate(rent_.id, domain::FixedRule{money("1.00")});

    templateService_->deleteTemplate(OWNER, created.id);

    EXPECT_FALSE(templateService_->getTemplate(OWNER, created.id).has_value());
    EXPECT_THROW(templateService_->deleteTemplate(OWNER, created.id), domain::UnknownTemplate);
}

// ============================================================================
// Порядок и изоляция
// ============================================================================

TEST_F(TemplateServiceTest, ListTemplates_OrderedByPriorityThenCreation) {
    auto late = createTemplate(rent_.id, domain::FixedRule{money("1.00")}, 3);
    auto firstOne = createTemplate(savings_.id, domain::FixedRule{money("1.00")}, 1);
    auto secondOne = createTemplate(rent_.id, domain::FixedRule{money("2.00")}, 1);

    auto list = templateService_->listTemplates(OWNER, false);

    ASSERT_EQ(list.size(), 3u);
    EXPECT_EQ(list[0].id, firstOne.id);
    EXPECT_EQ(list[1].id, secondOne.id);
    EXPECT_EQ(list[2].id, late.id);
}

TEST_F(TemplateServiceTest, OtherOwner_CannotSeeOrChange) {
    auto created = createTemplate(rent_.id, domain::FixedRule{money("1.00")});

    EXPECT_FALSE(templateService_->getTemplate("family-2", created.id).has_value());
    EXPECT_THROW(templateService_->setTemplateActive("family-2", created.id, false), domain::UnknownTemplate);
    EXPECT_TRUE(templateService_->listTemplates("family-2", false).empty());
}
