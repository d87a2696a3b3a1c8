#include "LedgerFixture.hpp"

using namespace ledger;
using namespace ledger::test;

class BalanceServiceTest : public LedgerFixture {
protected:
    void SetUp() override {
        LedgerFixture::SetUp();
        year = openYear();
    }

    FiscalYear year;
};

// ================================================================
// CURRENT BALANCE & ROLLUP
// ================================================================

TEST_F(BalanceServiceTest, UntouchedAccountIsZero) {
    auto balance = balances->currentBalance("521");
    EXPECT_EQ(balance.accountCode, "521");
    EXPECT_EQ(balance.asOf, "current");
    EXPECT_TRUE(balance.balance.isZero());
}

TEST_F(BalanceServiceTest, OpeningBalanceIncluded) {
    addAccount("5211", AccountType::ASSET, "521", true, 5000);

    post("2026-02-10", {debit("5211", 1500), credit("701", 1500)});

    auto child = balances->currentBalance("5211");
    EXPECT_EQ(child.ownBalance, Money(6500));
    EXPECT_EQ(child.balance, Money(6500));
}

TEST_F(BalanceServiceTest, ParentRollsUpDescendants) {
    addAccount("5211", AccountType::ASSET, "521");
    addAccount("5212", AccountType::ASSET, "521");
    addAccount("52121", AccountType::ASSET, "5212");

    post("2026-02-10", {debit("5211", 100), credit("701", 100)});
    post("2026-02-11", {debit("52121", 40), credit("701", 40)});
    post("2026-02-12", {debit("521", 7), credit("701", 7)});

    auto parent = balances->currentBalance("521");
    EXPECT_EQ(parent.ownBalance, Money(7));
    EXPECT_EQ(parent.balance, Money(147));

    EXPECT_EQ(balances->currentBalance("5212").balance, Money(40));
}

TEST_F(BalanceServiceTest, ContraChildSubtractsFromParent) {
    // Амортизация под счётом основных средств: нормальная сторона кредит
    addAccount("24", AccountType::ASSET);
    addAccount("284", AccountType::LIABILITY, "24");

    post("2026-02-10", {debit("24", 1000), credit("521", 1000)});
    post("2026-02-28", {debit("681", 200), credit("284", 200)});

    EXPECT_EQ(balances->currentBalance("284").balance, Money(200));
    EXPECT_EQ(balances->currentBalance("24").balance, Money(800));
}

TEST_F(BalanceServiceTest, UnknownAccount_NotFound) {
    expectLedgerError(LedgerErrorCode::NOT_FOUND, [&] { balances->currentBalance("000"); });
    expectLedgerError(LedgerErrorCode::NOT_FOUND, [&] { balances->balanceAsOf("000", Date(2026, 1, 1)); });
}

// ================================================================
// BALANCE AS OF DATE
// ================================================================

TEST_F(BalanceServiceTest, BalanceAsOfIncludesBoundaryDay) {
    post("2026-01-10", {debit("501", 100), credit("701", 100)});
    post("2026-02-10", {debit("501", 250), credit("701", 250)});
    post("2026-03-10", {debit("601", 50), credit("501", 50)});

    EXPECT_TRUE(balances->balanceAsOf("501", Date(2026, 1, 9)).balance.isZero());
    EXPECT_EQ(balances->balanceAsOf("501", Date(2026, 1, 10)).balance, Money(100));
    EXPECT_EQ(balances->balanceAsOf("501", Date(2026, 2, 28)).balance, Money(350));
    EXPECT_EQ(balances->balanceAsOf("501", Date(2026, 12, 31)).balance, Money(300));
    EXPECT_EQ(balances->balanceAsOf("501", Date(2026, 12, 31)).asOf, "2026-12-31");

    EXPECT_EQ(balances->currentBalance("501").balance,
              balances->balanceAsOf("501", Date(2026, 12, 31)).balance);
}

TEST_F(BalanceServiceTest, BalanceAsOfIgnoresDrafts) {
    journal->createDraft(entry("2026-01-10", {debit("501", 100), credit("701", 100)}));
    EXPECT_TRUE(balances->balanceAsOf("501", Date(2026, 12, 31)).balance.isZero());
}

// ================================================================
// TRIAL BALANCE
// ================================================================

TEST_F(BalanceServiceTest, TrialBalanceForPeriod) {
    post("2026-01-10", {debit("411", 1000), credit("701", 1000)});
    post("2026-01-20", {debit("521", 600), credit("411", 600)});
    post("2026-02-05", {debit("601", 300), credit("401", 300)});

    auto report = balances->trialBalance(year.periods[0].id);
    EXPECT_EQ(report.periodId, "FY20260101-P01");
    EXPECT_TRUE(report.isBalanced());
    // Чистые колонки: 411 дебет 400, 521 дебет 600, 701 кредит 1000
    EXPECT_EQ(report.totalDebit, Money(1000));
    EXPECT_EQ(report.totalCredit, Money(1000));
    // Валовые обороты периода
    EXPECT_EQ(report.totalPeriodDebit, Money(1600));
    EXPECT_EQ(report.totalPeriodCredit, Money(1600));

    // Активные проводимые счета присутствуют даже без оборотов
    ASSERT_EQ(report.rows.size(), 10u);
    EXPECT_EQ(report.rows.front().accountCode, "121");
    EXPECT_EQ(report.rows.back().accountCode, "701");

    for (const auto& row : report.rows) {
        if (row.accountCode == "411") {
            EXPECT_EQ(row.periodDebit, Money(1000));
            EXPECT_EQ(row.periodCredit, Money(600));
            EXPECT_EQ(row.debit, Money(400));
            EXPECT_TRUE(row.credit.isZero());
        } else if (row.accountCode == "701") {
            EXPECT_EQ(row.credit, Money(1000));
        } else if (row.accountCode == "601") {
            EXPECT_TRUE(row.periodDebit.isZero());
        }
    }
}

TEST_F(BalanceServiceTest, TrialBalanceExcludesOpeningBalances) {
    addAccount("5211", AccountType::ASSET, "521", true, 9000);
    auto report = balances->trialBalance(year.periods[0].id);
    EXPECT_TRUE(report.totalDebit.isZero());
    EXPECT_TRUE(report.isBalanced());
}

TEST_F(BalanceServiceTest, TrialBalanceKeepsInactiveAccountsWithMovement) {
    post("2026-01-10", {debit("626", 80), credit("521", 80)});
    chart->deactivate("626");
    chart->deactivate("641");

    auto report = balances->trialBalance(year.periods[0].id);
    bool has626 = false;
    bool has641 = false;
    for (const auto& row : report.rows) {
        has626 = has626 || row.accountCode == "626";
        has641 = has641 || row.accountCode == "641";
    }
    EXPECT_TRUE(has626);
    EXPECT_FALSE(has641);
}

TEST_F(BalanceServiceTest, TrialBalanceUnknownPeriod_NotFound) {
    expectLedgerError(LedgerErrorCode::NOT_FOUND, [&] { balances->trialBalance("FY20990101-P01"); });
}

// ================================================================
// DRIFT DETECTION
// ================================================================

TEST_F(BalanceServiceTest, NoDriftAfterNormalPosting) {
    post("2026-01-10", {debit("411", 1000), credit("701", 1000)});
    EXPECT_TRUE(balances->findBalanceDrift().empty());
}

TEST_F(BalanceServiceTest, DriftDetectedAfterDirectWrite) {
    post("2026-01-10", {debit("411", 1000), credit("701", 1000)});
    store->overwriteMovement("411", Money(999));

    auto drift = balances->findBalanceDrift();
    ASSERT_EQ(drift.size(), 1u);
    EXPECT_EQ(drift.front().accountCode, "411");
    EXPECT_EQ(drift.front().stored, Money(999));
    EXPECT_EQ(drift.front().replayed, Money(1000));
}

TEST_F(BalanceServiceTest, CorruptedEntryMakesTrialBalanceFail) {
    post("2026-01-10", {debit("411", 1000), credit("701", 1000)});

    // Запись в обход JournalService: одна сторона без пары
    JournalEntry broken;
    broken.entryId = store->nextEntryId();
    broken.date = Date(2026, 1, 15);
    broken.lines.emplace_back("501", EntrySide::DEBIT, Money(250));
    broken.recomputeTotals();
    broken.status = EntryStatus::POSTED;
    store->commitPosting(broken, {});

    expectLedgerError(LedgerErrorCode::LEDGER_INCONSISTENT, [&] {
        balances->trialBalance(year.periods[0].id);
    });
    EXPECT_NO_THROW(balances->trialBalance(year.periods[1].id));
}
