#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "adapters/primary/BalanceHandler.hpp"
#include "HttpTestDoubles.hpp"
#include "../mocks/MockLedgerServices.hpp"

using namespace ledger;
using namespace ledger::adapters::primary;
using namespace ledger::tests;
using ::testing::_;
using ::testing::Return;
using ::testing::Throw;
using ::testing::NiceMock;

class BalanceHandlerTest : public ::testing::Test {
protected:
    void SetUp() override {
        balances_ = std::make_shared<MockBalanceService>();
        metrics_ = std::make_shared<NiceMock<MockMetricsService>>();
        handler_ = std::make_unique<BalanceHandler>(balances_, metrics_);
    }

    TestResponse send(const std::string& method, const std::string& path) {
        TestRequest req(method, path);
        TestResponse res;
        handler_->handle(req, res);
        return res;
    }

    static domain::AccountBalance balanceOf(const std::string& code, int64_t amount, const std::string& asOf) {
        domain::AccountBalance balance;
        balance.accountCode = code;
        balance.asOf = asOf;
        balance.balance = domain::Money(amount);
        balance.ownBalance = domain::Money(amount);
        return balance;
    }

    std::shared_ptr<MockBalanceService> balances_;
    std::shared_ptr<NiceMock<MockMetricsService>> metrics_;
    std::unique_ptr<BalanceHandler> handler_;
};

TEST_F(BalanceHandlerTest, CurrentBalance) {
    EXPECT_CALL(*balances_, currentBalance("501")).WillOnce(Return(balanceOf("501", 1000, "current")));
    EXPECT_CALL(*balances_, balanceAsOf(_, _)).Times(0);

    auto res = send("GET", "/api/v1/balances/501");
    EXPECT_EQ(res.getStatus(), 200);
    EXPECT_EQ(res.json()["balance"], 1000);
    EXPECT_EQ(res.json()["as_of"], "current");
}

TEST_F(BalanceHandlerTest, BalanceAsOfDate) {
    EXPECT_CALL(*balances_, balanceAsOf("501", domain::Date(2026, 3, 31)))
        .WillOnce(Return(balanceOf("501", 350, "2026-03-31")));

    auto res = send("GET", "/api/v1/balances/501?as_of=2026-03-31");
    EXPECT_EQ(res.getStatus(), 200);
    EXPECT_EQ(res.json()["balance"], 350);
}

TEST_F(BalanceHandlerTest, BadDate_Returns400) {
    EXPECT_CALL(*balances_, balanceAsOf(_, _)).Times(0);
    EXPECT_EQ(send("GET", "/api/v1/balances/501?as_of=yesterday").getStatus(), 400);
}

TEST_F(BalanceHandlerTest, TrialBalance) {
    domain::TrialBalance report;
    report.periodId = "FY20260101-P01";
    domain::TrialBalanceRow row;
    row.accountCode = "411";
    row.accountName = "Clients";
    row.periodDebit = domain::Money(1000);
    row.debit = domain::Money(1000);
    report.rows.push_back(row);
    report.totalDebit = domain::Money(1000);
    report.totalCredit = domain::Money(1000);
    report.totalPeriodDebit = domain::Money(1000);
    report.totalPeriodCredit = domain::Money(1000);

    EXPECT_CALL(*balances_, trialBalance("FY20260101-P01")).WillOnce(Return(report));

    auto res = send("GET", "/api/v1/trial-balance?period_id=FY20260101-P01");
    EXPECT_EQ(res.getStatus(), 200);
    auto json = res.json();
    EXPECT_EQ(json["is_balanced"], true);
    EXPECT_EQ(json["rows"][0]["account_code"], "411");
    EXPECT_EQ(json["rows"][0]["account_type"], "ASSET");
}

TEST_F(BalanceHandlerTest, TrialBalanceWithoutPeriod_Returns400) {
    EXPECT_CALL(*balances_, trialBalance(_)).Times(0);
    EXPECT_EQ(send("GET", "/api/v1/trial-balance").getStatus(), 400);
}

TEST_F(BalanceHandlerTest, TrialBalanceUnknownPeriod_Returns404) {
    EXPECT_CALL(*balances_, trialBalance("nope"))
        .WillOnce(Throw(domain::LedgerException(domain::LedgerErrorCode::NOT_FOUND, "Period not found: nope")));
    EXPECT_EQ(send("GET", "/api/v1/trial-balance?period_id=nope").getStatus(), 404);
}

TEST_F(BalanceHandlerTest, InconsistentLedger_Returns500AndCounts) {
    EXPECT_CALL(*balances_, trialBalance("FY20260101-P01"))
        .WillOnce(Throw(domain::LedgerException(domain::LedgerErrorCode::LEDGER_INCONSISTENT, "off by 250")));
    EXPECT_CALL(*metrics_, increment("ledger_errors_total",
                                     std::map<std::string, std::string>{{"code", "LEDGER_INCONSISTENT"}}));

    auto res = send("GET", "/api/v1/trial-balance?period_id=FY20260101-P01");
    EXPECT_EQ(res.getStatus(), 500);
    EXPECT_EQ(res.json()["code"], "LEDGER_INCONSISTENT");
}

TEST_F(BalanceHandlerTest, DriftReport) {
    EXPECT_CALL(*balances_, findBalanceDrift())
        .WillOnce(Return(std::vector<domain::BalanceDrift>{{"411", domain::Money(999), domain::Money(1000)}}));

    auto json = send("GET", "/api/v1/balance-drift").json();
    EXPECT_EQ(json["consistent"], false);
    ASSERT_EQ(json["accounts"].size(), 1u);
    EXPECT_EQ(json["accounts"][0]["stored"], 999);
    EXPECT_EQ(json["accounts"][0]["replayed"], 1000);
}

TEST_F(BalanceHandlerTest, OnlyGetAllowed) {
    EXPECT_EQ(send("POST", "/api/v1/balances/501").getStatus(), 405);
}
