#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "adapters/primary/FiscalYearHandler.hpp"
#include "HttpTestDoubles.hpp"
#include "../mocks/MockLedgerServices.hpp"

using namespace ledger;
using namespace ledger::adapters::primary;
using namespace ledger::tests;
using ::testing::_;
using ::testing::Return;
using ::testing::Throw;
using ::testing::NiceMock;
using ::testing::SaveArg;
using ::testing::DoAll;

class FiscalYearHandlerTest : public ::testing::Test {
protected:
    void SetUp() override {
        periods_ = std::make_shared<MockPeriodService>();
        closing_ = std::make_shared<MockClosingService>();
        metrics_ = std::make_shared<NiceMock<MockMetricsService>>();
        handler_ = std::make_unique<FiscalYearHandler>(periods_, closing_, metrics_);
    }

    TestResponse send(const std::string& method, const std::string& path, const std::string& body = "") {
        TestRequest req(method, path, body);
        TestResponse res;
        handler_->handle(req, res);
        return res;
    }

    static domain::FiscalYear year2026() {
        domain::FiscalYear year;
        year.id = "FY20260101";
        year.name = year.id;
        year.startDate = domain::Date(2026, 1, 1);
        year.endDate = domain::Date(2027, 1, 1);
        domain::AccountingPeriod q1;
        q1.id = "FY20260101-P01";
        q1.fiscalYearId = year.id;
        q1.periodNumber = 1;
        q1.startDate = year.startDate;
        q1.endDate = year.endDate;
        year.periods.push_back(q1);
        return year;
    }

    std::shared_ptr<MockPeriodService> periods_;
    std::shared_ptr<MockClosingService> closing_;
    std::shared_ptr<NiceMock<MockMetricsService>> metrics_;
    std::unique_ptr<FiscalYearHandler> handler_;
};

TEST_F(FiscalYearHandlerTest, CreateWithExplicitPeriods) {
    ports::input::CreateFiscalYearRequest captured;
    EXPECT_CALL(*periods_, createFiscalYear(_)).WillOnce(DoAll(SaveArg<0>(&captured), Return(year2026())));

    auto res = send("POST", "/api/v1/fiscal-years", R"({
        "start_date": "2026-01-01",
        "end_date": "2027-01-01",
        "periods": [
            {"start_date": "2026-01-01", "end_date": "2026-07-01"},
            {"start_date": "2026-07-01", "end_date": "2027-01-01"}
        ]
    })");

    EXPECT_EQ(res.getStatus(), 201);
    EXPECT_EQ(res.json()["fiscal_year_id"], "FY20260101");
    EXPECT_EQ(res.json()["periods"][0]["period_id"], "FY20260101-P01");
    ASSERT_EQ(captured.periods.size(), 2u);
    EXPECT_EQ(captured.periods[1].start, domain::Date(2026, 7, 1));
}

TEST_F(FiscalYearHandlerTest, PartitionError_Returns400) {
    EXPECT_CALL(*periods_, createFiscalYear(_))
        .WillOnce(Throw(domain::LedgerException(domain::LedgerErrorCode::PARTITION_ERROR, "gap")));

    auto res = send("POST", "/api/v1/fiscal-years", R"({"start_date": "2026-01-01", "end_date": "2027-01-01"})");
    EXPECT_EQ(res.getStatus(), 400);
    EXPECT_EQ(res.json()["code"], "PARTITION_ERROR");
}

TEST_F(FiscalYearHandlerTest, ListAndGet) {
    EXPECT_CALL(*periods_, listFiscalYears()).WillOnce(Return(std::vector<domain::FiscalYear>{year2026()}));
    EXPECT_CALL(*periods_, getFiscalYear("FY20260101")).WillOnce(Return(year2026()));

    EXPECT_EQ(send("GET", "/api/v1/fiscal-years").json().size(), 1u);

    auto res = send("GET", "/api/v1/fiscal-years/FY20260101");
    EXPECT_EQ(res.getStatus(), 200);
    EXPECT_EQ(res.json()["is_closed"], false);
}

TEST_F(FiscalYearHandlerTest, ClosePeriod_CountsMetric) {
    auto closed = year2026().periods[0];
    closed.isClosed = true;

    EXPECT_CALL(*periods_, closePeriod("FY20260101-P01")).WillOnce(Return(closed));
    EXPECT_CALL(*metrics_, increment("ledger_periods_closed_total", _));

    auto res = send("POST", "/api/v1/periods/close", R"({"period_id": "FY20260101-P01"})");
    EXPECT_EQ(res.getStatus(), 200);
    EXPECT_EQ(res.json()["is_closed"], true);
}

TEST_F(FiscalYearHandlerTest, ClosePeriodOutOfOrder_Returns409) {
    EXPECT_CALL(*periods_, closePeriod("FY20260101-P02"))
        .WillOnce(Throw(domain::LedgerException(domain::LedgerErrorCode::OUT_OF_ORDER, "P01 still open")));
    EXPECT_CALL(*metrics_, increment("ledger_periods_closed_total", _)).Times(0);

    auto res = send("POST", "/api/v1/periods/close", R"({"period_id": "FY20260101-P02"})");
    EXPECT_EQ(res.getStatus(), 409);
    EXPECT_EQ(res.json()["code"], "OUT_OF_ORDER");
}

TEST_F(FiscalYearHandlerTest, LockAndUnlock) {
    auto locked = year2026().periods[0];
    locked.isLocked = true;
    EXPECT_CALL(*periods_, lockPeriod("FY20260101-P01")).WillOnce(Return(locked));
    EXPECT_CALL(*periods_, unlockPeriod("FY20260101-P01")).WillOnce(Return(year2026().periods[0]));

    EXPECT_EQ(send("POST", "/api/v1/periods/lock", R"({"period_id": "FY20260101-P01"})").json()["is_locked"], true);
    EXPECT_EQ(send("POST", "/api/v1/periods/unlock", R"({"period_id": "FY20260101-P01"})").json()["is_locked"], false);
}

TEST_F(FiscalYearHandlerTest, CloseYear) {
    ports::input::ClosingResult result;
    result.fiscalYearId = "FY20260101";
    result.retainedEarningsAccount = "131";
    result.closingEntryIds = {"JE-000010", "JE-000011"};
    result.netIncome = domain::Money(3500);
    result.archivedEntries = 12;

    EXPECT_CALL(*closing_, closeFiscalYear("FY20260101", std::optional<std::string>("131")))
        .WillOnce(Return(result));
    EXPECT_CALL(*metrics_, increment("ledger_fiscal_years_closed_total", _));

    auto res = send("POST", "/api/v1/fiscal-years/close",
                    R"({"fiscal_year_id": "FY20260101", "retained_earnings_account": "131"})");

    EXPECT_EQ(res.getStatus(), 200);
    auto json = res.json();
    EXPECT_EQ(json["net_income"], 3500);
    EXPECT_EQ(json["closing_entry_ids"].size(), 2u);
    EXPECT_EQ(json["archived_entries"], 12);
}

TEST_F(FiscalYearHandlerTest, CloseYearWithOpenPeriods_Returns409) {
    EXPECT_CALL(*closing_, closeFiscalYear("FY20260101", std::optional<std::string>()))
        .WillOnce(Throw(domain::LedgerException(domain::LedgerErrorCode::OPEN_PERIODS, "open")));

    auto res = send("POST", "/api/v1/fiscal-years/close", R"({"fiscal_year_id": "FY20260101"})");
    EXPECT_EQ(res.getStatus(), 409);
    EXPECT_EQ(res.json()["code"], "OPEN_PERIODS");
}

TEST_F(FiscalYearHandlerTest, UnknownRoutes) {
    EXPECT_EQ(send("POST", "/api/v1/periods/reopen", R"({"period_id": "x"})").getStatus(), 404);
    EXPECT_EQ(send("DELETE", "/api/v1/fiscal-years/FY20260101").getStatus(), 405);
}
