#pragma once

#include "adapters/primary/JsonHandler.hpp"
#include "ports/input/IJournalService.hpp"
#include <memory>
#include <string>

namespace ledger::adapters::primary {

/**
 * @brief HTTP Handler для проводок
 *
 * Endpoints:
 * - POST   /api/v1/journal-entries            (по умолчанию сразу проводит; "post": false: черновик)
 * - GET    /api/v1/journal-entries?status=&from=&to=&account=&reversal_of=&journal=
 * - GET    /api/v1/journal-entries/{id}
 * - POST   /api/v1/journal-entries/lines      {"entry_id", строка}
 * - DELETE /api/v1/journal-entries/lines?entry_id=&line=
 * - POST   /api/v1/journal-entries/validate   {"entry_id", "validated_by"?}
 * - POST   /api/v1/journal-entries/post       {"entry_id", "posted_by"?}
 * - POST   /api/v1/journal-entries/reverse    {"entry_id", "date"?, "created_by"?}
 * - POST   /api/v1/journal-entries/archive    {"entry_id"}
 */
class JournalEntryHandler final : public JsonHandler {
public:
    JournalEntryHandler(std::shared_ptr<ports::input::IJournalService> journalService,
                        std::shared_ptr<ports::input::IMetricsService> metrics)
        : JsonHandler("JournalEntryHandler", std::move(metrics))
        , journalService_(std::move(journalService))
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

        auto action = tailAfter(path, std::string(COLLECTION) + "/");
        if (action.empty()) {
            notFound(res);
            return;
        }

        if (method == "POST") {
            handleCommand(action, req, res);
        } else if (method == "DELETE" && action == "lines") {
            handleRemoveLine(req, res);
        } else if (method == "GET") {
            mapper::sendJson(res, 200, mapper::toJson(journalService_->getEntry(action)));
        } else {
            methodNotAllowed(res);
        }
    }

private:
    static constexpr const char* COLLECTION = "/api/v1/journal-entries";

    std::shared_ptr<ports::input::IJournalService> journalService_;

    void handleCreate(IRequest& req, IResponse& res) {
        auto body = mapper::parseBody(req.getBody());
        auto request = mapper::parseNewEntry(body);

        if (!mapper::optionalBool(body, "post").value_or(true)) {
            mapper::sendJson(res, 201, mapper::toJson(journalService_->createDraft(request)));
            return;
        }

        auto entry = journalService_->createAndPost(request);
        metrics_->increment("ledger_entries_posted_total");
        mapper::sendJson(res, 201, mapper::toJson(entry));
    }

    void handleList(IRequest& req, IResponse& res) {
        auto params = req.getParams();

        domain::EntryFilter filter;
        if (auto status = mapper::param(params, "status")) {
            filter.statuses.push_back(domain::parseEntryStatus(*status));
        }
        if (auto from = mapper::param(params, "from")) {
            filter.dateFrom = domain::Date::parse(*from);
        }
        if (auto to = mapper::param(params, "to")) {
            filter.dateTo = domain::Date::parse(*to);
        }
        filter.accountCode = mapper::param(params, "account");
        filter.reversalOf = mapper::param(params, "reversal_of");
        filter.journalCode = mapper::param(params, "journal");

        nlohmann::json response = nlohmann::json::array();
        for (const auto& entry : journalService_->listEntries(filter)) {
            response.push_back(mapper::toJson(entry));
        }
        mapper::sendJson(res, 200, response);
    }

    void handleCommand(const std::string& action, IRequest& req, IResponse& res) {
        auto body = mapper::parseBody(req.getBody());
        auto entryId = mapper::requireString(body, "entry_id");

        if (action == "lines") {
            auto entry = journalService_->addLine(entryId, mapper::parseLine(body));
            mapper::sendJson(res, 201, mapper::toJson(entry));
        } else if (action == "validate") {
            auto entry = journalService_->validateBalance(
                entryId, mapper::optionalString(body, "validated_by").value_or(""));
            mapper::sendJson(res, 200, mapper::toJson(entry));
        } else if (action == "post") {
            auto entry = journalService_->post(entryId, mapper::optionalString(body, "posted_by").value_or(""));
            metrics_->increment("ledger_entries_posted_total");
            mapper::sendJson(res, 200, mapper::toJson(entry));
        } else if (action == "reverse") {
            std::optional<domain::Date> date;
            if (auto raw = mapper::optionalString(body, "date")) {
                date = domain::Date::parse(*raw);
            }
            auto reversal = journalService_->reverse(
                entryId, date, mapper::optionalString(body, "created_by").value_or(""));
            metrics_->increment("ledger_entries_reversed_total");
            mapper::sendJson(res, 201, mapper::toJson(reversal));
        } else if (action == "archive") {
            mapper::sendJson(res, 200, mapper::toJson(journalService_->archive(entryId)));
        } else {
            notFound(res);
        }
    }

    void handleRemoveLine(IRequest& req, IResponse& res) {
        auto params = req.getParams();
        auto entryId = mapper::param(params, "entry_id");
        auto line = mapper::param(params, "line");
        if (!entryId || !line) {
            mapper::sendError(res, 400, "Query parameters 'entry_id' and 'line' are required");
            return;
        }
        auto entry = journalService_->removeLine(*entryId, std::stoi(*line));
        mapper::sendJson(res, 200, mapper::toJson(entry));
    }
};

} // namespace ledger::adapters::primary
