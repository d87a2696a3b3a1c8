#pragma once

#include <IHttpHandler.hpp>
#include <IRequest.hpp>
#include <IResponse.hpp>
#include "adapters/primary/JsonMapper.hpp"
#include "ports/input/IMetricsService.hpp"
#include "domain/LedgerException.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <string>
#include <iostream>

namespace ledger::adapters::primary {

/**
 * @brief Базовый JSON handler: маршрутизация + единая обработка ошибок
 *
 * Наследник реализует route(). Отказы ядра отображаются в HTTP так:
 * - VALIDATION → 400 (UNBALANCED, NEGATIVE_BALANCE → 422)
 * - NOT_FOUND → 404
 * - STATE → 409
 * - CONCURRENCY → 503
 * - INTEGRITY → 500
 * Битый JSON и неверные даты/enum-ы → 400, прочее → 500.
 * Каждый отказ ядра считается в ledger_errors_total{code}.
 */
class JsonHandler : public IHttpHandler {
public:
    void handle(IRequest& req, IResponse& res) override {
        try {
            route(req, res);
        } catch (const domain::LedgerException& e) {
            const auto code = domain::toString(e.code());
            metrics_->increment("ledger_errors_total", {{"code", code}});
            mapper::sendError(res, mapper::httpStatusOf(e), e.what(), code);
        } catch (const nlohmann::json::exception& e) {
            mapper::sendError(res, 400, "Invalid JSON");
        } catch (const std::invalid_argument& e) {
            mapper::sendError(res, 400, e.what());
        } catch (const std::out_of_range& e) {
            mapper::sendError(res, 400, e.what());
        } catch (const std::exception& e) {
            std::cerr << "[" << component_ << "] " << req.getMethod() << " " << req.getPath()
                      << " failed: " << e.what() << std::endl;
            mapper::sendError(res, 500, "Internal server error");
        }
    }

protected:
    JsonHandler(std::string component, std::shared_ptr<ports::input::IMetricsService> metrics)
        : component_(std::move(component))
        , metrics_(std::move(metrics))
    {}

    virtual void route(IRequest& req, IResponse& res) = 0;

    std::string component_;
    std::shared_ptr<ports::input::IMetricsService> metrics_;

    static void notFound(IResponse& res) {
        mapper::sendError(res, 404, "Not found");
    }

    static void methodNotAllowed(IResponse& res) {
        mapper::sendError(res, 405, "Method not allowed");
    }

    /// "/api/v1/accounts/411" при prefix "/api/v1/accounts/" → "411"
    static std::string tailAfter(const std::string& path, const std::string& prefix) {
        if (path.size() <= prefix.size() || path.compare(0, prefix.size(), prefix) != 0) {
            return "";
        }
        auto tail = path.substr(prefix.size());
        return tail.find('/') == std::string::npos ? tail : "";
    }
};

} // namespace ledger::adapters::primary
