#pragma once

#include "adapters/primary/JsonHandler.hpp"
#include "ports/input/IChartOfAccountsService.hpp"
#include <memory>
#include <string>

namespace ledger::adapters::primary {

/**
 * @brief HTTP Handler для плана счетов
 *
 * Endpoints:
 * - POST  /api/v1/accounts
 * - GET   /api/v1/accounts?type=&parent=&active=
 * - GET   /api/v1/accounts/{code}  (с предками и детьми)
 * - PATCH /api/v1/accounts/{code}  (name, description, allow_negative, is_active)
 */
class AccountHandler final : public JsonHandler {
public:
    AccountHandler(std::shared_ptr<ports::input::IChartOfAccountsService> chartService,
                   std::shared_ptr<ports::input::IMetricsService> metrics)
        : JsonHandler("AccountHandler", std::move(metrics))
        , chartService_(std::move(chartService))
    {}

protected:
    void route(IRequest& req, IResponse& res) override {
        const std::string method = req.getMethod();
        const std::string path = mapper::pathOf(req.getPath());

        if (path == COLLECTION) {
            if (method == "POST") {
                handleCreate(req, res);
            } else if (method == "GET") {
                handleList(req, res);
            } else {
                methodNotAllowed(res);
            }
            return;
        }

        auto code = tailAfter(path, std::string(COLLECTION) + "/");
        if (code.empty()) {
            notFound(res);
            return;
        }

        if (method == "GET") {
            handleGet(code, res);
        } else if (method == "PATCH") {
            handleUpdate(code, req, res);
        } else {
            methodNotAllowed(res);
        }
    }

private:
    static constexpr const char* COLLECTION = "/api/v1/accounts";

    std::shared_ptr<ports::input::IChartOfAccountsService> chartService_;

    void handleCreate(IRequest& req, IResponse& res) {
        auto body = mapper::parseBody(req.getBody());
        auto account = chartService_->createAccount(mapper::parseCreateAccount(body));
        mapper::sendJson(res, 201, mapper::toJson(account));
    }

    void handleList(IRequest& req, IResponse& res) {
        auto params = req.getParams();

        ports::input::AccountFilter filter;
        if (auto type = mapper::param(params, "type")) {
            filter.type = domain::parseAccountType(*type);
        }
        filter.parentCode = mapper::param(params, "parent");
        if (auto active = mapper::param(params, "active")) {
            filter.active = (*active == "true" || *active == "1");
        }

        nlohmann::json response = nlohmann::json::array();
        for (const auto& account : chartService_->listAccounts(filter)) {
            response.push_back(mapper::toJson(account));
        }
        mapper::sendJson(res, 200, response);
    }

    void handleGet(const std::string& code, IResponse& res) {
        auto response = mapper::toJson(chartService_->getAccount(code));

        response["ancestors"] = nlohmann::json::array();
        for (const auto& ancestor : chartService_->ancestorsOf(code)) {
            response["ancestors"].push_back(ancestor.code);
        }
        response["children"] = nlohmann::json::array();
        for (const auto& child : chartService_->listChildren(code)) {
            response["children"].push_back(child.code);
        }
        mapper::sendJson(res, 200, response);
    }

    void handleUpdate(const std::string& code, IRequest& req, IResponse& res) {
        auto body = mapper::parseBody(req.getBody());

        ports::input::UpdateAccountRequest update;
        update.name = mapper::optionalString(body, "name");
        update.description = mapper::optionalString(body, "description");
        update.allowNegative = mapper::optionalBool(body, "allow_negative");
        auto active = mapper::optionalBool(body, "is_active");

        auto account = chartService_->getAccount(code);
        if (update.name || update.description || update.allowNegative) {
            account = chartService_->updateAccount(code, update);
        }
        if (active && *active != account.isActive) {
            account = *active ? chartService_->reactivate(code) : chartService_->deactivate(code);
        }
        mapper::sendJson(res, 200, mapper::toJson(account));
    }
};

} // namespace ledger::adapters::primary
