#include "LedgerFixture.hpp"

using namespace ledger;
using namespace ledger::test;
using ports::input::CreateJournalRequest;
using ports::input::UpdateJournalRequest;
using ports::input::JournalFilter;

class JournalRegistryServiceTest : public LedgerFixture {
protected:
    static CreateJournalRequest request(const std::string& code, JournalType type = JournalType::GENERAL) {
        CreateJournalRequest r;
        r.code = code;
        r.name = "Journal " + code;
        r.type = type;
        return r;
    }

    std::string defaultJournal() {
        return journals->resolveForPosting(std::nullopt).code;
    }
};

// ================================================================
// SEED
// ================================================================

TEST_F(JournalRegistryServiceTest, SeedCreatesStandardJournals) {
    EXPECT_EQ(journalRepo->size(), 4u);
    EXPECT_EQ(defaultJournal(), "OD");

    auto sales = journals->getJournal("VT");
    EXPECT_EQ(sales.type, JournalType::SALES);
    EXPECT_EQ(sales.defaultDebitAccount, std::optional<std::string>("411"));
    EXPECT_EQ(sales.defaultCreditAccount, std::optional<std::string>("701"));

    auto purchases = journals->getJournal("AC");
    EXPECT_EQ(purchases.defaultDebitAccount, std::optional<std::string>("601"));
    EXPECT_EQ(purchases.defaultCreditAccount, std::optional<std::string>("401"));

    EXPECT_FALSE(journals->getJournal("BQ").defaultDebitAccount.has_value());

    EXPECT_EQ(journals->seedDefaultJournals(), 0);
}

TEST_F(JournalRegistryServiceTest, SeedWithoutChartLeavesNoDefaultAccounts) {
    auto emptyAccounts = std::make_shared<adapters::secondary::InMemoryAccountRepository>();
    auto emptyJournals = std::make_shared<adapters::secondary::InMemoryJournalRepository>();
    application::JournalRegistryService registry(emptyJournals, emptyAccounts);

    EXPECT_EQ(registry.seedDefaultJournals(), 4);
    EXPECT_FALSE(registry.getJournal("VT").defaultDebitAccount.has_value());
    EXPECT_EQ(registry.resolveForPosting(std::nullopt).code, "OD");
}

// ================================================================
// CREATE
// ================================================================

TEST_F(JournalRegistryServiceTest, CreateWithDefaultAccounts) {
    auto r = request("VE", JournalType::SALES);
    r.defaultDebitAccount = "411";
    r.defaultCreditAccount = "701";

    auto created = journals->createJournal(r);
    EXPECT_EQ(created.code, "VE");
    EXPECT_TRUE(created.isActive);
    EXPECT_FALSE(created.isDefault);
    EXPECT_EQ(journals->getJournal("VE").defaultCreditAccount, std::optional<std::string>("701"));
}

TEST_F(JournalRegistryServiceTest, DuplicateCode_Rejected) {
    expectLedgerError(LedgerErrorCode::DUPLICATE_CODE, [&] { journals->createJournal(request("VT")); });
}

TEST_F(JournalRegistryServiceTest, InvalidIdentity_Rejected) {
    expectLedgerError(LedgerErrorCode::INVALID_ARGUMENT, [&] { journals->createJournal(request("")); });
    expectLedgerError(LedgerErrorCode::INVALID_ARGUMENT, [&] {
        journals->createJournal(request(std::string(11, 'J')));
    });

    auto unnamed = request("NN");
    unnamed.name.clear();
    expectLedgerError(LedgerErrorCode::INVALID_ARGUMENT, [&] { journals->createJournal(unnamed); });
}

TEST_F(JournalRegistryServiceTest, DefaultAccountMustBePostable) {
    auto unknown = request("X1");
    unknown.defaultDebitAccount = "999";
    expectLedgerError(LedgerErrorCode::UNKNOWN_ACCOUNT, [&] { journals->createJournal(unknown); });

    ports::input::CreateAccountRequest summary;
    summary.code = "70";
    summary.name = "Ventes (total)";
    summary.type = AccountType::REVENUE;
    summary.allowPosting = false;
    chart->createAccount(summary);

    auto notPostable = request("X2");
    notPostable.defaultCreditAccount = "70";
    expectLedgerError(LedgerErrorCode::ACCOUNT_NOT_POSTABLE, [&] { journals->createJournal(notPostable); });

    chart->deactivate("626");
    auto inactive = request("X3");
    inactive.defaultDebitAccount = "626";
    expectLedgerError(LedgerErrorCode::UNKNOWN_ACCOUNT, [&] { journals->createJournal(inactive); });

    EXPECT_EQ(journalRepo->size(), 4u);
}

// ================================================================
// DEFAULT JOURNAL
// ================================================================

TEST_F(JournalRegistryServiceTest, NewDefaultReplacesOld) {
    auto r = request("GEN");
    r.isDefault = true;
    journals->createJournal(r);

    EXPECT_EQ(defaultJournal(), "GEN");
    EXPECT_FALSE(journals->getJournal("OD").isDefault);

    UpdateJournalRequest update;
    update.isDefault = true;
    journals->updateJournal("VT", update);

    int defaults = 0;
    for (const auto& journal : journals->listJournals(JournalFilter{})) {
        if (journal.isDefault) ++defaults;
    }
    EXPECT_EQ(defaults, 1);
    EXPECT_EQ(defaultJournal(), "VT");
}

TEST_F(JournalRegistryServiceTest, DefaultCannotBeUnsetOrDeactivated) {
    UpdateJournalRequest update;
    update.isDefault = false;
    expectLedgerError(LedgerErrorCode::INVALID_STATE, [&] { journals->updateJournal("OD", update); });
    expectLedgerError(LedgerErrorCode::INVALID_STATE, [&] { journals->deactivate("OD"); });

    EXPECT_TRUE(journals->getJournal("OD").isActive);
    EXPECT_EQ(defaultJournal(), "OD");
}

TEST_F(JournalRegistryServiceTest, InactiveJournalCannotBecomeDefault) {
    journals->deactivate("BQ");

    UpdateJournalRequest update;
    update.isDefault = true;
    expectLedgerError(LedgerErrorCode::INVALID_STATE, [&] { journals->updateJournal("BQ", update); });

    journals->reactivate("BQ");
    EXPECT_TRUE(journals->updateJournal("BQ", update).isDefault);
}

TEST_F(JournalRegistryServiceTest, NoDefaultJournal_UnknownJournal) {
    auto emptyJournals = std::make_shared<adapters::secondary::InMemoryJournalRepository>();
    application::JournalRegistryService registry(emptyJournals, accountRepo);
    registry.createJournal(request("VT", JournalType::SALES));

    expectLedgerError(LedgerErrorCode::UNKNOWN_JOURNAL, [&] { registry.resolveForPosting(std::nullopt); });
    EXPECT_EQ(registry.resolveForPosting(std::string("VT")).code, "VT");
}

// ================================================================
// UPDATE AND LISTING
// ================================================================

TEST_F(JournalRegistryServiceTest, UpdateDefaultAccounts) {
    UpdateJournalRequest update;
    update.defaultDebitAccount = "521";
    update.defaultCreditAccount = "";

    auto updated = journals->updateJournal("BQ", update);
    EXPECT_EQ(updated.defaultDebitAccount, std::optional<std::string>("521"));
    EXPECT_FALSE(updated.defaultCreditAccount.has_value());

    UpdateJournalRequest clear;
    clear.defaultCreditAccount = "";
    EXPECT_FALSE(journals->updateJournal("VT", clear).defaultCreditAccount.has_value());
    EXPECT_EQ(journals->getJournal("VT").defaultDebitAccount, std::optional<std::string>("411"));

    UpdateJournalRequest bad;
    bad.defaultDebitAccount = "999";
    expectLedgerError(LedgerErrorCode::UNKNOWN_ACCOUNT, [&] { journals->updateJournal("BQ", bad); });
}

TEST_F(JournalRegistryServiceTest, ListFiltersAndSorts) {
    journals->deactivate("AC");

    auto all = journals->listJournals(JournalFilter{});
    ASSERT_EQ(all.size(), 4u);
    EXPECT_EQ(all.front().code, "AC");
    EXPECT_EQ(all.back().code, "VT");

    JournalFilter active;
    active.active = true;
    EXPECT_EQ(journals->listJournals(active).size(), 3u);

    JournalFilter treasury;
    treasury.type = JournalType::TREASURY;
    auto banks = journals->listJournals(treasury);
    ASSERT_EQ(banks.size(), 1u);
    EXPECT_EQ(banks[0].code, "BQ");
}

TEST_F(JournalRegistryServiceTest, InactiveJournalRejectedForPosting) {
    journals->deactivate("AC");
    expectLedgerError(LedgerErrorCode::UNKNOWN_JOURNAL, [&] { journals->resolveForPosting(std::string("AC")); });
    expectLedgerError(LedgerErrorCode::NOT_FOUND, [&] { journals->getJournal("ZZ"); });
}
