#pragma once

#include "adapters/primary/JsonHandler.hpp"
#include "ports/input/IBalanceService.hpp"
#include <memory>
#include <string>

namespace ledger::adapters::primary {

/**
 * @brief HTTP Handler для сальдо и отчётов
 *
 * Endpoints:
 * - GET /api/v1/balances/{code}?as_of=YYYY-MM-DD  (без as_of: текущее сальдо)
 * - GET /api/v1/trial-balance?period_id=
 * - GET /api/v1/balance-drift
 */
class BalanceHandler final : public JsonHandler {
public:
    BalanceHandler(std::shared_ptr<ports::input::IBalanceService> balanceService,
                   std::shared_ptr<ports::input::IMetricsService> metrics)
        : JsonHandler("BalanceHandler", std::move(metrics))
        , balanceService_(std::move(balanceService))
    {}

protected:
    void route(IRequest& req, IResponse& res) override {
        if (req.getMethod() != "GET") {
            methodNotAllowed(res);
            return;
        }

        const std::string path = mapper::pathOf(req.getPath());
        auto params = req.getParams();

        if (path == "/api/v1/trial-balance") {
            auto periodId = mapper::param(params, "period_id");
            if (!periodId) {
                mapper::sendError(res, 400, "Query parameter 'period_id' is required");
                return;
            }
            mapper::sendJson(res, 200, mapper::toJson(balanceService_->trialBalance(*periodId)));
            return;
        }

        if (path == "/api/v1/balance-drift") {
            handleDrift(res);
            return;
        }

        auto code = tailAfter(path, "/api/v1/balances/");
        if (code.empty()) {
            notFound(res);
            return;
        }

        auto asOf = mapper::param(params, "as_of");
        auto balance = asOf ? balanceService_->balanceAsOf(code, domain::Date::parse(*asOf))
                            : balanceService_->currentBalance(code);
        mapper::sendJson(res, 200, mapper::toJson(balance));
    }

private:
    std::shared_ptr<ports::input::IBalanceService> balanceService_;

    void handleDrift(IResponse& res) {
        auto drift = balanceService_->findBalanceDrift();
        if (!drift.empty()) {
            std::cerr << "[BalanceHandler] Balance drift detected on "
                      << drift.size() << " accounts" << std::endl;
        }

        nlohmann::json response;
        response["consistent"] = drift.empty();
        response["accounts"] = nlohmann::json::array();
        for (const auto& item : drift) {
            response["accounts"].push_back({
                {"account_code", item.accountCode},
                {"stored", item.stored.minor},
                {"replayed", item.replayed.minor}
            });
        }
        mapper::sendJson(res, 200, response);
    }
};

} // namespace ledger::adapters::primary
