#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "adapters/primary/AccountHandler.hpp"
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

class AccountHandlerTest : public ::testing::Test {
protected:
    void SetUp() override {
        chart_ = std::make_shared<MockChartOfAccountsService>();
        metrics_ = std::make_shared<NiceMock<MockMetricsService>>();
        handler_ = std::make_unique<AccountHandler>(chart_, metrics_);
    }

    TestResponse send(const std::string& method, const std::string& path, const std::string& body = "") {
        TestRequest req(method, path, body);
        TestResponse res;
        handler_->handle(req, res);
        return res;
    }

    static domain::Account account(const std::string& code, domain::AccountType type,
                                   std::optional<std::string> parent = std::nullopt) {
        return domain::Account(code, "Account " + code, type, std::move(parent));
    }

    std::shared_ptr<MockChartOfAccountsService> chart_;
    std::shared_ptr<NiceMock<MockMetricsService>> metrics_;
    std::unique_ptr<AccountHandler> handler_;
};

// ============================================================================
// POST /api/v1/accounts
// ============================================================================

TEST_F(AccountHandlerTest, Create_Returns201) {
    ports::input::CreateAccountRequest captured;
    EXPECT_CALL(*chart_, createAccount(_))
        .WillOnce(DoAll(SaveArg<0>(&captured), Return(account("5211", domain::AccountType::ASSET, "521"))));

    auto res = send("POST", "/api/v1/accounts", R"({
        "code": "5211",
        "name": "Banque BOA",
        "type": "actif",
        "parent_code": "521",
        "allow_negative": false,
        "opening_balance": 15000
    })");

    EXPECT_EQ(res.getStatus(), 201);
    auto json = res.json();
    EXPECT_EQ(json["code"], "5211");
    EXPECT_EQ(json["normal_side"], "DEBIT");
    EXPECT_EQ(json["parent_code"], "521");

    EXPECT_EQ(captured.type, domain::AccountType::ASSET);
    EXPECT_EQ(captured.parentCode, std::optional<std::string>("521"));
    EXPECT_FALSE(captured.allowNegative);
    EXPECT_EQ(captured.openingBalance, domain::Money(15000));
}

TEST_F(AccountHandlerTest, CreateUnknownType_Returns400) {
    EXPECT_CALL(*chart_, createAccount(_)).Times(0);
    auto res = send("POST", "/api/v1/accounts", R"({"code": "9", "name": "X", "type": "MYSTERY"})");
    EXPECT_EQ(res.getStatus(), 400);
}

TEST_F(AccountHandlerTest, Duplicate_Returns400WithCode) {
    EXPECT_CALL(*chart_, createAccount(_))
        .WillOnce(Throw(domain::LedgerException(domain::LedgerErrorCode::DUPLICATE_CODE, "exists")));

    auto res = send("POST", "/api/v1/accounts", R"({"code": "411", "name": "Clients", "type": "ASSET"})");
    EXPECT_EQ(res.getStatus(), 400);
    EXPECT_EQ(res.json()["code"], "DUPLICATE_CODE");
}

// ============================================================================
// GET
// ============================================================================

TEST_F(AccountHandlerTest, ListWithFilters) {
    ports::input::AccountFilter captured;
    EXPECT_CALL(*chart_, listAccounts(_))
        .WillOnce(DoAll(SaveArg<0>(&captured), Return(std::vector<domain::Account>{
            account("601", domain::AccountType::EXPENSE),
            account("626", domain::AccountType::EXPENSE)
        })));

    auto res = send("GET", "/api/v1/accounts?type=EXPENSE&active=true");

    EXPECT_EQ(res.getStatus(), 200);
    EXPECT_EQ(res.json().size(), 2u);
    EXPECT_EQ(captured.type, std::optional<domain::AccountType>(domain::AccountType::EXPENSE));
    EXPECT_EQ(captured.active, std::optional<bool>(true));
    EXPECT_FALSE(captured.parentCode.has_value());
}

TEST_F(AccountHandlerTest, GetWithTree) {
    EXPECT_CALL(*chart_, getAccount("5211")).WillOnce(Return(account("5211", domain::AccountType::ASSET, "521")));
    EXPECT_CALL(*chart_, ancestorsOf("5211"))
        .WillOnce(Return(std::vector<domain::Account>{account("521", domain::AccountType::ASSET)}));
    EXPECT_CALL(*chart_, listChildren("5211"))
        .WillOnce(Return(std::vector<domain::Account>{account("52111", domain::AccountType::ASSET, "5211")}));

    auto res = send("GET", "/api/v1/accounts/5211");

    EXPECT_EQ(res.getStatus(), 200);
    auto json = res.json();
    EXPECT_EQ(json["ancestors"], nlohmann::json::array({"521"}));
    EXPECT_EQ(json["children"], nlohmann::json::array({"52111"}));
}

TEST_F(AccountHandlerTest, GetUnknown_Returns404) {
    EXPECT_CALL(*chart_, getAccount("000"))
        .WillOnce(Throw(domain::LedgerException(domain::LedgerErrorCode::NOT_FOUND, "Account not found: 000")));

    auto res = send("GET", "/api/v1/accounts/000");
    EXPECT_EQ(res.getStatus(), 404);
    EXPECT_EQ(res.json()["code"], "NOT_FOUND");
}

// ============================================================================
// PATCH
// ============================================================================

TEST_F(AccountHandlerTest, PatchRenames) {
    auto renamed = account("411", domain::AccountType::ASSET);
    renamed.name = "Clients ordinaires";

    EXPECT_CALL(*chart_, getAccount("411")).WillOnce(Return(account("411", domain::AccountType::ASSET)));
    EXPECT_CALL(*chart_, updateAccount("411", _)).WillOnce(Return(renamed));
    EXPECT_CALL(*chart_, deactivate(_)).Times(0);

    auto res = send("PATCH", "/api/v1/accounts/411", R"({"name": "Clients ordinaires"})");
    EXPECT_EQ(res.getStatus(), 200);
    EXPECT_EQ(res.json()["name"], "Clients ordinaires");
}

TEST_F(AccountHandlerTest, PatchDeactivates) {
    auto inactive = account("681", domain::AccountType::EXPENSE);
    inactive.isActive = false;

    EXPECT_CALL(*chart_, getAccount("681")).WillOnce(Return(account("681", domain::AccountType::EXPENSE)));
    EXPECT_CALL(*chart_, updateAccount(_, _)).Times(0);
    EXPECT_CALL(*chart_, deactivate("681")).WillOnce(Return(inactive));

    auto res = send("PATCH", "/api/v1/accounts/681", R"({"is_active": false})");
    EXPECT_EQ(res.getStatus(), 200);
    EXPECT_EQ(res.json()["is_active"], false);
}

TEST_F(AccountHandlerTest, PatchWithActiveChildren_Returns409) {
    EXPECT_CALL(*chart_, getAccount("521")).WillOnce(Return(account("521", domain::AccountType::ASSET)));
    EXPECT_CALL(*chart_, deactivate("521"))
        .WillOnce(Throw(domain::LedgerException(domain::LedgerErrorCode::HAS_ACTIVE_CHILDREN, "has children")));

    auto res = send("PATCH", "/api/v1/accounts/521", R"({"is_active": false})");
    EXPECT_EQ(res.getStatus(), 409);
    EXPECT_EQ(res.json()["code"], "HAS_ACTIVE_CHILDREN");
}

TEST_F(AccountHandlerTest, UnsupportedMethod_Returns405) {
    EXPECT_EQ(send("DELETE", "/api/v1/accounts/411").getStatus(), 405);
    EXPECT_EQ(send("PATCH", "/api/v1/accounts").getStatus(), 405);
}
