#pragma once

#include "adapters/primary/JsonHandler.hpp"
#include "ports/input/IJournalRegistryService.hpp"
#include <memory>
#include <string>

namespace ledger::adapters::primary {

/**
 * @brief HTTP Handler для справочника журналов
 *
 * Endpoints:
 * - POST  /api/v1/journals
 * - GET   /api/v1/journals?type=&active=
 * - GET   /api/v1/journals/{code}
 * - PATCH /api/v1/journals/{code}  (name, description, is_default,
 *         default_debit_account, default_credit_account, is_active)
 */
class JournalHandler final : public JsonHandler {
public:
    JournalHandler(std::shared_ptr<ports::input::IJournalRegistryService> journals,
                   std::shared_ptr<ports::input::IMetricsService> metrics)
        : JsonHandler("JournalHandler", std::move(metrics))
        , journals_(std::move(journals))
    {}

protected:
    void route(IRequest& req, IResponse& res) override {
        const std::string method = req.getMethod();
        const std::string path = mapper::pathOf(req.getPath());

        if (path == COLLECTION) {
            if (method == "POST") {
                auto body = mapper::parseBody(req.getBody());
                mapper::sendJson(res, 201, mapper::toJson(journals_->createJournal(mapper::parseCreateJournal(body))));
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
            mapper::sendJson(res, 200, mapper::toJson(journals_->getJournal(code)));
        } else if (method == "PATCH") {
            handleUpdate(code, req, res);
        } else {
            methodNotAllowed(res);
        }
    }

private:
    static constexpr const char* COLLECTION = "/api/v1/journals";

    std::shared_ptr<ports::input::IJournalRegistryService> journals_;

    void handleList(IRequest& req, IResponse& res) {
        auto params = req.getParams();

        ports::input::JournalFilter filter;
        if (auto type = mapper::param(params, "type")) {
            filter.type = domain::parseJournalType(*type);
        }
        if (auto active = mapper::param(params, "active")) {
            filter.active = (*active == "true" || *active == "1");
        }

        nlohmann::json response = nlohmann::json::array();
        for (const auto& journal : journals_->listJournals(filter)) {
            response.push_back(mapper::toJson(journal));
        }
        mapper::sendJson(res, 200, response);
    }

    void handleUpdate(const std::string& code, IRequest& req, IResponse& res) {
        auto body = mapper::parseBody(req.getBody());

        ports::input::UpdateJournalRequest update;
        update.name = mapper::optionalString(body, "name");
        update.description = mapper::optionalString(body, "description");
        update.isDefault = mapper::optionalBool(body, "is_default");
        update.defaultDebitAccount = mapper::optionalString(body, "default_debit_account");
        update.defaultCreditAccount = mapper::optionalString(body, "default_credit_account");
        auto active = mapper::optionalBool(body, "is_active");

        auto journal = journals_->getJournal(code);
        // Сначала реактивация: неактивный журнал нельзя сделать журналом по умолчанию
        if (active && *active && !journal.isActive) {
            journal = journals_->reactivate(code);
        }
        if (update.name || update.description || update.isDefault ||
            update.defaultDebitAccount || update.defaultCreditAccount) {
            journal = journals_->updateJournal(code, update);
        }
        if (active && !*active && journal.isActive) {
            journal = journals_->deactivate(code);
        }
        mapper::sendJson(res, 200, mapper::toJson(journal));
    }
};

} // namespace ledger::adapters::primary
