#include "LedgerFixture.hpp"

using namespace ledger;
using namespace ledger::test;

class ClosingServiceTest : public LedgerFixture {
protected:
    void SetUp() override {
        LedgerFixture::SetUp();
        year = openYear();
    }

    /// Выручка 5000, расходы 1200 + 300
    void postTypicalYear() {
        post("2026-02-10", {debit("411", 5000), credit("701", 5000)});
        post("2026-05-15", {debit("601", 1200), credit("401", 1200)});
        post("2026-11-30", {debit("626", 300), credit("401", 300)});
    }

    FiscalYear year;
};

// ================================================================
// HAPPY PATH
// ================================================================

TEST_F(ClosingServiceTest, IncomeStatementAccountsMovedToRetainedEarnings) {
    postTypicalYear();
    closeAllPeriods(year);

    auto result = closing->closeFiscalYear(year.id, std::nullopt);

    EXPECT_EQ(result.fiscalYearId, "FY20260101");
    EXPECT_EQ(result.retainedEarningsAccount, "121");
    EXPECT_EQ(result.netIncome, Money(3500));
    ASSERT_EQ(result.closingEntryIds.size(), 3u);

    EXPECT_TRUE(balances->currentBalance("701").balance.isZero());
    EXPECT_TRUE(balances->currentBalance("601").balance.isZero());
    EXPECT_TRUE(balances->currentBalance("626").balance.isZero());
    EXPECT_EQ(balances->currentBalance("121").balance, Money(3500));

    // Балансовые счета не затронуты
    EXPECT_EQ(balances->currentBalance("411").balance, Money(5000));
    EXPECT_EQ(balances->currentBalance("401").balance, Money(1500));

    EXPECT_TRUE(balances->findBalanceDrift().empty());
}

TEST_F(ClosingServiceTest, ClosingEntriesAreMarkedAndDatedOnLastDay) {
    postTypicalYear();
    closeAllPeriods(year);

    auto result = closing->closeFiscalYear(year.id, std::nullopt);

    // Порядок по коду счёта: 601, 626, 701
    auto first = journal->getEntry(result.closingEntryIds.front());
    EXPECT_TRUE(first.closing);
    EXPECT_EQ(first.date, Date(2026, 12, 31));
    EXPECT_EQ(first.reference, "CLOSING-FY20260101");
    EXPECT_EQ(first.createdBy, "system");
    EXPECT_EQ(first.postedBy, std::optional<std::string>("system"));
    EXPECT_EQ(first.journalCode, "OD");
    EXPECT_EQ(first.lines[0].accountCode, "601");
    EXPECT_EQ(first.lines[0].credit, Money(1200));
    EXPECT_EQ(first.lines[1].accountCode, "121");
    EXPECT_EQ(first.lines[1].debit, Money(1200));

    auto last = journal->getEntry(result.closingEntryIds.back());
    EXPECT_EQ(last.lines[0].accountCode, "701");
    EXPECT_EQ(last.lines[0].debit, Money(5000));
}

TEST_F(ClosingServiceTest, EntriesArchivedAndYearClosed) {
    postTypicalYear();
    closeAllPeriods(year);

    auto result = closing->closeFiscalYear(year.id, std::nullopt);
    EXPECT_EQ(result.archivedEntries, 6);

    EntryFilter posted;
    posted.statuses = {EntryStatus::POSTED};
    EXPECT_TRUE(journal->listEntries(posted).empty());

    EXPECT_TRUE(periods->getFiscalYear(year.id).isClosed);
    EXPECT_FALSE(periods->isOpenForPosting(Date(2026, 6, 1)));

    // Архивные проводки по-прежнему входят в сальдо на дату
    EXPECT_EQ(balances->balanceAsOf("701", Date(2026, 12, 30)).balance, Money(5000));
    EXPECT_TRUE(balances->balanceAsOf("701", Date(2026, 12, 31)).balance.isZero());
}

TEST_F(ClosingServiceTest, NetLoss) {
    post("2026-03-01", {debit("641", 800), credit("521", 800)});
    closeAllPeriods(year);

    auto result = closing->closeFiscalYear(year.id, std::nullopt);
    EXPECT_EQ(result.netIncome, Money(-800));
    EXPECT_EQ(balances->currentBalance("121").balance, Money(-800));
}

TEST_F(ClosingServiceTest, ZeroBalancesGetNoClosingEntry) {
    auto sale = post("2026-03-01", {debit("411", 700), credit("701", 700)});
    journal->reverse(sale.entryId, std::nullopt, "");
    closeAllPeriods(year);

    auto result = closing->closeFiscalYear(year.id, std::nullopt);
    EXPECT_TRUE(result.closingEntryIds.empty());
    EXPECT_TRUE(result.netIncome.isZero());
    EXPECT_EQ(result.archivedEntries, 2);
}

TEST_F(ClosingServiceTest, InactiveAccountWithBalanceIsStillClosed) {
    post("2026-03-01", {debit("626", 300), credit("521", 300)});
    chart->deactivate("626");
    closeAllPeriods(year);

    auto result = closing->closeFiscalYear(year.id, std::nullopt);
    EXPECT_EQ(result.closingEntryIds.size(), 1u);
    EXPECT_TRUE(balances->currentBalance("626").balance.isZero());
}

TEST_F(ClosingServiceTest, CustomRetainedEarningsAccount) {
    addAccount("131", AccountType::EQUITY);
    postTypicalYear();
    closeAllPeriods(year);

    auto result = closing->closeFiscalYear(year.id, std::string("131"));
    EXPECT_EQ(result.retainedEarningsAccount, "131");
    EXPECT_EQ(balances->currentBalance("131").balance, Money(3500));
    EXPECT_TRUE(balances->currentBalance("121").balance.isZero());
}

TEST_F(ClosingServiceTest, NextYearStartsFromCarriedBalances) {
    postTypicalYear();
    closeAllPeriods(year);
    closing->closeFiscalYear(year.id, std::nullopt);

    auto next = openYear(2027);
    post("2027-01-05", {debit("521", 100), credit("701", 100)});

    EXPECT_EQ(balances->balanceAsOf("121", Date(2027, 1, 31)).balance, Money(3500));
    EXPECT_EQ(balances->balanceAsOf("701", Date(2027, 1, 31)).balance, Money(100));
    EXPECT_FALSE(periods->getFiscalYear(next.id).isClosed);
}

// ================================================================
// REJECTIONS
// ================================================================

TEST_F(ClosingServiceTest, OpenPeriods_Rejected) {
    postTypicalYear();
    periods->closePeriod(year.periods[0].id);

    expectLedgerError(LedgerErrorCode::OPEN_PERIODS, [&] {
        closing->closeFiscalYear(year.id, std::nullopt);
    });
    EXPECT_EQ(balances->currentBalance("701").balance, Money(5000));
}

TEST_F(ClosingServiceTest, LaterYearWaitsForEarlierYear) {
    post("2026-06-01", {debit("411", 1000), credit("701", 1000)});
    auto next = openYear(2027);
    post("2027-06-01", {debit("411", 500), credit("701", 500)});
    closeAllPeriods(year);
    closeAllPeriods(next);

    expectLedgerError(LedgerErrorCode::OUT_OF_ORDER, [&] {
        closing->closeFiscalYear(next.id, std::nullopt);
    });
    EXPECT_FALSE(periods->getFiscalYear(next.id).isClosed);
    EXPECT_EQ(balances->currentBalance("701").balance, Money(1500));

    auto first = closing->closeFiscalYear(year.id, std::nullopt);
    auto second = closing->closeFiscalYear(next.id, std::nullopt);

    EXPECT_EQ(first.netIncome, Money(1000));
    EXPECT_EQ(second.netIncome, Money(500));
    EXPECT_EQ(balances->currentBalance("121").balance, Money(1500));
    EXPECT_TRUE(balances->currentBalance("701").balance.isZero());
    EXPECT_TRUE(balances->findBalanceDrift().empty());
}

TEST_F(ClosingServiceTest, AlreadyClosed_Rejected) {
    postTypicalYear();
    closeAllPeriods(year);
    closing->closeFiscalYear(year.id, std::nullopt);

    expectLedgerError(LedgerErrorCode::INVALID_STATE, [&] {
        closing->closeFiscalYear(year.id, std::nullopt);
    });
}

TEST_F(ClosingServiceTest, UnknownYear_NotFound) {
    expectLedgerError(LedgerErrorCode::NOT_FOUND, [&] {
        closing->closeFiscalYear("FY19990101", std::nullopt);
    });
}

TEST_F(ClosingServiceTest, RetainedEarningsMustBeActiveEquity) {
    postTypicalYear();
    closeAllPeriods(year);

    expectLedgerError(LedgerErrorCode::INVALID_ARGUMENT, [&] {
        closing->closeFiscalYear(year.id, std::string("701"));
    });
    expectLedgerError(LedgerErrorCode::INVALID_ARGUMENT, [&] {
        closing->closeFiscalYear(year.id, std::string("999"));
    });

    chart->deactivate("121");
    expectLedgerError(LedgerErrorCode::INVALID_ARGUMENT, [&] {
        closing->closeFiscalYear(year.id, std::nullopt);
    });

    EXPECT_FALSE(periods->getFiscalYear(year.id).isClosed);
}
