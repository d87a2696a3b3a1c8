#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "adapters/primary/JournalHandler.hpp"
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

class JournalHandlerTest : public ::testing::Test {
protected:
    void SetUp() override {
        journals_ = std::make_shared<MockJournalRegistryService>();
        metrics_ = std::make_shared<NiceMock<MockMetricsService>>();
        handler_ = std::make_unique<JournalHandler>(journals_, metrics_);
    }

    TestResponse send(const std::string& method, const std::string& path, const std::string& body = "") {
        TestRequest req(method, path, body);
        TestResponse res;
        handler_->handle(req, res);
        return res;
    }

    static domain::Journal journal(const std::string& code, domain::JournalType type) {
        return domain::Journal(code, "Journal " + code, type);
    }

    std::shared_ptr<MockJournalRegistryService> journals_;
    std::shared_ptr<NiceMock<MockMetricsService>> metrics_;
    std::unique_ptr<JournalHandler> handler_;
};

// ============================================================================
// POST /api/v1/journals
// ============================================================================

TEST_F(JournalHandlerTest, Create_Returns201) {
    ports::input::CreateJournalRequest captured;
    auto created = journal("VT2", domain::JournalType::SALES);
    created.defaultDebitAccount = "411";

    EXPECT_CALL(*journals_, createJournal(_)).WillOnce(DoAll(SaveArg<0>(&captured), Return(created)));

    auto res = send("POST", "/api/v1/journals", R"({
        "code": "VT2",
        "name": "Ventes export",
        "type": "vente",
        "default_debit_account": "411"
    })");

    EXPECT_EQ(res.getStatus(), 201);
    EXPECT_EQ(res.json()["code"], "VT2");
    EXPECT_EQ(res.json()["type"], "SALES");
    EXPECT_EQ(res.json()["default_debit_account"], "411");
    EXPECT_TRUE(res.json()["default_credit_account"].is_null());

    EXPECT_EQ(captured.type, domain::JournalType::SALES);
    EXPECT_FALSE(captured.isDefault);
    EXPECT_EQ(captured.defaultDebitAccount, std::optional<std::string>("411"));
    EXPECT_FALSE(captured.defaultCreditAccount.has_value());
}

TEST_F(JournalHandlerTest, CreateDuplicate_Returns400) {
    EXPECT_CALL(*journals_, createJournal(_))
        .WillOnce(Throw(domain::LedgerException(domain::LedgerErrorCode::DUPLICATE_CODE, "exists")));
    EXPECT_CALL(*metrics_, increment("ledger_errors_total",
                                     std::map<std::string, std::string>{{"code", "DUPLICATE_CODE"}}));

    auto res = send("POST", "/api/v1/journals", R"({"code": "VT", "name": "Ventes"})");
    EXPECT_EQ(res.getStatus(), 400);
    EXPECT_EQ(res.json()["code"], "DUPLICATE_CODE");
}

TEST_F(JournalHandlerTest, CreateWithUnknownType_Returns400) {
    EXPECT_CALL(*journals_, createJournal(_)).Times(0);
    EXPECT_EQ(send("POST", "/api/v1/journals", R"({"code": "X", "name": "X", "type": "lottery"})").getStatus(), 400);
}

// ============================================================================
// GET
// ============================================================================

TEST_F(JournalHandlerTest, ListPassesFilters) {
    ports::input::JournalFilter captured;
    EXPECT_CALL(*journals_, listJournals(_))
        .WillOnce(DoAll(SaveArg<0>(&captured),
                        Return(std::vector<domain::Journal>{journal("BQ", domain::JournalType::TREASURY)})));

    auto res = send("GET", "/api/v1/journals?type=tresorerie&active=true");

    EXPECT_EQ(res.getStatus(), 200);
    ASSERT_EQ(res.json().size(), 1u);
    EXPECT_EQ(res.json()[0]["type"], "TREASURY");
    EXPECT_EQ(captured.type, std::optional<domain::JournalType>(domain::JournalType::TREASURY));
    EXPECT_EQ(captured.active, std::optional<bool>(true));
}

TEST_F(JournalHandlerTest, GetUnknown_Returns404) {
    EXPECT_CALL(*journals_, getJournal("ZZ"))
        .WillOnce(Throw(domain::LedgerException(domain::LedgerErrorCode::NOT_FOUND, "not found")));

    EXPECT_EQ(send("GET", "/api/v1/journals/ZZ").getStatus(), 404);
}

// ============================================================================
// PATCH
// ============================================================================

TEST_F(JournalHandlerTest, PatchMakesDefault) {
    auto current = journal("VT", domain::JournalType::SALES);
    auto promoted = current;
    promoted.isDefault = true;

    ports::input::UpdateJournalRequest captured;
    EXPECT_CALL(*journals_, getJournal("VT")).WillOnce(Return(current));
    EXPECT_CALL(*journals_, updateJournal("VT", _)).WillOnce(DoAll(SaveArg<1>(&captured), Return(promoted)));
    EXPECT_CALL(*journals_, deactivate(_)).Times(0);

    auto res = send("PATCH", "/api/v1/journals/VT", R"({"is_default": true, "default_credit_account": ""})");
    EXPECT_EQ(res.getStatus(), 200);
    EXPECT_EQ(res.json()["is_default"], true);
    EXPECT_EQ(captured.isDefault, std::optional<bool>(true));
    EXPECT_EQ(captured.defaultCreditAccount, std::optional<std::string>(""));
    EXPECT_FALSE(captured.defaultDebitAccount.has_value());
}

TEST_F(JournalHandlerTest, PatchDeactivatingDefault_Returns409) {
    auto od = journal("OD", domain::JournalType::MISCELLANEOUS);
    od.isDefault = true;

    EXPECT_CALL(*journals_, getJournal("OD")).WillOnce(Return(od));
    EXPECT_CALL(*journals_, deactivate("OD"))
        .WillOnce(Throw(domain::LedgerException(domain::LedgerErrorCode::INVALID_STATE, "default journal")));

    auto res = send("PATCH", "/api/v1/journals/OD", R"({"is_active": false})");
    EXPECT_EQ(res.getStatus(), 409);
    EXPECT_EQ(res.json()["code"], "INVALID_STATE");
}

TEST_F(JournalHandlerTest, PatchReactivatesBeforeUpdate) {
    auto inactive = journal("AC", domain::JournalType::PURCHASE);
    inactive.isActive = false;
    auto active = journal("AC", domain::JournalType::PURCHASE);

    ::testing::InSequence sequence;
    EXPECT_CALL(*journals_, getJournal("AC")).WillOnce(Return(inactive));
    EXPECT_CALL(*journals_, reactivate("AC")).WillOnce(Return(active));
    EXPECT_CALL(*journals_, updateJournal("AC", _)).WillOnce(Return(active));

    auto res = send("PATCH", "/api/v1/journals/AC", R"({"is_active": true, "is_default": true})");
    EXPECT_EQ(res.getStatus(), 200);
}

TEST_F(JournalHandlerTest, UnsupportedMethod_Returns405) {
    EXPECT_EQ(send("DELETE", "/api/v1/journals/VT").getStatus(), 405);
    EXPECT_EQ(send("PUT", "/api/v1/journals").getStatus(), 405);
}
