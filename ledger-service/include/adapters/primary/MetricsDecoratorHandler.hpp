#pragma once

#include <IHttpHandler.hpp>
#include <IRequest.hpp>
#include <IResponse.hpp>
#include "ports/input/IMetricsService.hpp"

#include <memory>
#include <string>
#include <set>
#include <optional>

namespace ledger::adapters::primary {

/**
 * @brief Декоратор для подсчёта HTTP метрик
 *
 * Оборачивает любой IHttpHandler и инкрементирует
 * http_requests_total{method="...",path="..."} перед делегированием.
 *
 * Path нормализуется, чтобы коды счетов и id не плодили ключи:
 * - /api/v1/accounts/411 -> /api/v1/accounts/{code}
 * - /api/v1/journal-entries/JE-000001 -> /api/v1/journal-entries/{id}
 * - /api/v1/journal-entries/post -> без изменений (команда)
 */
class MetricsDecoratorHandler : public IHttpHandler {
public:
    MetricsDecoratorHandler(
        std::shared_ptr<IHttpHandler> inner,
        std::shared_ptr<ports::input::IMetricsService> metrics)
        : inner_(std::move(inner))
        , metrics_(std::move(metrics))
    {}

    void handle(IRequest& req, IResponse& res) override {
        metrics_->increment("http_requests_total", {{"method", req.getMethod()},
                                                    {"path", normalizePath(req.getPath())}});
        inner_->handle(req, res);
    }

    static std::string normalizePath(const std::string& path) {
        std::string cleanPath = path;
        size_t queryPos = cleanPath.find('?');
        if (queryPos != std::string::npos) {
            cleanPath = cleanPath.substr(0, queryPos);
        }

        static const std::set<std::string> entryCommands = {"lines", "validate", "post", "reverse", "archive"};
        static const std::set<std::string> yearCommands = {"close"};

        if (auto tail = tailOf(cleanPath, "/api/v1/journal-entries/")) {
            return entryCommands.count(*tail) ? cleanPath : "/api/v1/journal-entries/{id}";
        }
        if (auto tail = tailOf(cleanPath, "/api/v1/fiscal-years/")) {
            return yearCommands.count(*tail) ? cleanPath : "/api/v1/fiscal-years/{id}";
        }
        if (tailOf(cleanPath, "/api/v1/accounts/")) {
            return "/api/v1/accounts/{code}";
        }
        if (tailOf(cleanPath, "/api/v1/journals/")) {
            return "/api/v1/journals/{code}";
        }
        if (tailOf(cleanPath, "/api/v1/balances/")) {
            return "/api/v1/balances/{code}";
        }
        return cleanPath;
    }

private:
    std::shared_ptr<IHttpHandler> inner_;
    std::shared_ptr<ports::input::IMetricsService> metrics_;

    static std::optional<std::string> tailOf(const std::string& path, const std::string& prefix) {
        if (path.size() <= prefix.size() || path.compare(0, prefix.size(), prefix) != 0) {
            return std::nullopt;
        }
        return path.substr(prefix.size());
    }
};

} // namespace ledger::adapters::primary
