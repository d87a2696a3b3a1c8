#pragma once

#include "adapters/primary/JsonHandler.hpp"
#include "ports/input/IPeriodService.hpp"
#include "ports/input/IClosingService.hpp"
#include <memory>
#include <string>

namespace ledger::adapters::primary {

/**
 * @brief HTTP Handler для финансовых годов и периодов
 *
 * Endpoints:
 * - POST /api/v1/fiscal-years
 * - GET  /api/v1/fiscal-years
 * - GET  /api/v1/fiscal-years/{id}
 * - POST /api/v1/fiscal-years/close   {"fiscal_year_id", "retained_earnings_account"?}
 * - POST /api/v1/periods/close        {"period_id"}
 * - POST /api/v1/periods/lock         {"period_id"}
 * - POST /api/v1/periods/unlock       {"period_id"}
 */
class FiscalYearHandler final : public JsonHandler {
public:
    FiscalYearHandler(std::shared_ptr<ports::input::IPeriodService> periodService,
                      std::shared_ptr<ports::input::IClosingService> closingService,
                      std::shared_ptr<ports::input::IMetricsService> metrics)
        : JsonHandler("FiscalYearHandler", std::move(metrics))
        , periodService_(std::move(periodService))
        , closingService_(std::move(closingService))
    {}

protected:
    void route(IRequest& req, IResponse& res) override {
        const std::string method = req.getMethod();
        const std::string path = mapper::pathOf(req.getPath());

        if (path == "/api/v1/fiscal-years") {
            if (method == "POST") {
                auto body = mapper::parseBody(req.getBody());
                auto year = periodService_->createFiscalYear(mapper::parseCreateFiscalYear(body));
                mapper::sendJson(res, 201, mapper::toJson(year));
            } else if (method == "GET") {
                handleList(res);
            } else {
                methodNotAllowed(res);
            }
            return;
        }

        if (method != "POST" && method != "GET") {
            methodNotAllowed(res);
            return;
        }

        if (method == "POST") {
            if (path == "/api/v1/fiscal-years/close") {
                handleCloseYear(req, res);
            } else if (path == "/api/v1/periods/close") {
                auto period = periodService_->closePeriod(periodIdFrom(req));
                metrics_->increment("ledger_periods_closed_total");
                mapper::sendJson(res, 200, mapper::toJson(period));
            } else if (path == "/api/v1/periods/lock") {
                mapper::sendJson(res, 200, mapper::toJson(periodService_->lockPeriod(periodIdFrom(req))));
            } else if (path == "/api/v1/periods/unlock") {
                mapper::sendJson(res, 200, mapper::toJson(periodService_->unlockPeriod(periodIdFrom(req))));
            } else {
                notFound(res);
            }
            return;
        }

        auto yearId = tailAfter(path, "/api/v1/fiscal-years/");
        if (yearId.empty()) {
            notFound(res);
            return;
        }
        mapper::sendJson(res, 200, mapper::toJson(periodService_->getFiscalYear(yearId)));
    }

private:
    std::shared_ptr<ports::input::IPeriodService> periodService_;
    std::shared_ptr<ports::input::IClosingService> closingService_;

    void handleList(IResponse& res) {
        nlohmann::json response = nlohmann::json::array();
        for (const auto& year : periodService_->listFiscalYears()) {
            response.push_back(mapper::toJson(year));
        }
        mapper::sendJson(res, 200, response);
    }

    void handleCloseYear(IRequest& req, IResponse& res) {
        auto body = mapper::parseBody(req.getBody());
        auto result = closingService_->closeFiscalYear(
            mapper::requireString(body, "fiscal_year_id"),
            mapper::optionalString(body, "retained_earnings_account"));

        metrics_->increment("ledger_fiscal_years_closed_total");
        mapper::sendJson(res, 200, mapper::toJson(result));
    }

    static std::string periodIdFrom(IRequest& req) {
        return mapper::requireString(mapper::parseBody(req.getBody()), "period_id");
    }
};

} // namespace ledger::adapters::primary
