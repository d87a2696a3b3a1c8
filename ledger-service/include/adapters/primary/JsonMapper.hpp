#pragma once

#include <IResponse.hpp>
#include "domain/Account.hpp"
#include "domain/FiscalYear.hpp"
#include "domain/JournalEntry.hpp"
#include "domain/Journal.hpp"
#include "domain/Balance.hpp"
#include "domain/LedgerException.hpp"
#include "ports/input/IJournalService.hpp"
#include "ports/input/IPeriodService.hpp"
#include "ports/input/IChartOfAccountsService.hpp"
#include "ports/input/IJournalRegistryService.hpp"
#include "ports/input/IClosingService.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <map>
#include <optional>
#include <stdexcept>

namespace ledger::adapters::primary {

/**
 * @brief Преобразования domain <-> JSON для HTTP слоя
 *
 * Суммы передаются целыми минорными единицами, даты строками "YYYY-MM-DD".
 * Ошибки формата бросают std::invalid_argument (→ 400).
 */
namespace mapper {

using nlohmann::json;

inline json toJson(const domain::Account& account) {
    json j;
    j["code"] = account.code;
    j["name"] = account.name;
    j["description"] = account.description;
    j["type"] = domain::toString(account.type);
    j["normal_side"] = domain::toString(account.normalSide());
    j["parent_code"] = account.parentCode ? json(*account.parentCode) : json(nullptr);
    j["is_active"] = account.isActive;
    j["allow_negative"] = account.allowNegative;
    j["allow_posting"] = account.allowPosting;
    j["is_analytic"] = account.isAnalytic;
    j["opening_balance"] = account.openingBalance.minor;
    j["created_at"] = account.createdAt.toString();
    j["updated_at"] = account.updatedAt.toString();
    return j;
}

inline json toJson(const domain::Journal& journal) {
    json j;
    j["code"] = journal.code;
    j["name"] = journal.name;
    j["type"] = domain::toString(journal.type);
    j["description"] = journal.description;
    j["is_default"] = journal.isDefault;
    j["is_active"] = journal.isActive;
    j["default_debit_account"] = journal.defaultDebitAccount ? json(*journal.defaultDebitAccount) : json(nullptr);
    j["default_credit_account"] = journal.defaultCreditAccount ? json(*journal.defaultCreditAccount) : json(nullptr);
    j["created_at"] = journal.createdAt.toString();
    j["updated_at"] = journal.updatedAt.toString();
    return j;
}

inline json toJson(const domain::AccountingPeriod& period) {
    json j;
    j["period_id"] = period.id;
    j["fiscal_year_id"] = period.fiscalYearId;
    j["period_number"] = period.periodNumber;
    j["start_date"] = period.startDate.toString();
    j["end_date"] = period.endDate.toString();
    j["is_closed"] = period.isClosed;
    j["is_locked"] = period.isLocked;
    return j;
}

inline json toJson(const domain::FiscalYear& year) {
    json j;
    j["fiscal_year_id"] = year.id;
    j["name"] = year.name;
    j["start_date"] = year.startDate.toString();
    j["end_date"] = year.endDate.toString();
    j["is_closed"] = year.isClosed;
    j["closed_at"] = year.closedAt ? json(year.closedAt->toString()) : json(nullptr);
    j["periods"] = json::array();
    for (const auto& period : year.periods) {
        j["periods"].push_back(toJson(period));
    }
    return j;
}

inline json toJson(const domain::JournalEntryLine& line) {
    json j;
    j["line_number"] = line.lineNumber;
    j["account_code"] = line.accountCode;
    j["analytic_account"] = line.analyticAccount ? json(*line.analyticAccount) : json(nullptr);
    j["debit"] = line.debit.minor;
    j["credit"] = line.credit.minor;
    j["description"] = line.description;
    return j;
}

inline json toJson(const domain::JournalEntry& entry) {
    json j;
    j["entry_id"] = entry.entryId;
    j["journal_code"] = entry.journalCode;
    j["date"] = entry.date.toString();
    j["reference"] = entry.reference;
    j["description"] = entry.description;
    j["status"] = domain::toString(entry.status);
    j["total_debit"] = entry.totalDebit.minor;
    j["total_credit"] = entry.totalCredit.minor;
    j["created_by"] = entry.createdBy;
    j["created_at"] = entry.createdAt.toString();
    j["validated_by"] = entry.validatedBy ? json(*entry.validatedBy) : json(nullptr);
    j["validated_at"] = entry.validatedAt ? json(entry.validatedAt->toString()) : json(nullptr);
    j["posted_by"] = entry.postedBy ? json(*entry.postedBy) : json(nullptr);
    j["posted_at"] = entry.postedAt ? json(entry.postedAt->toString()) : json(nullptr);
    j["reversal_of"] = entry.reversalOf ? json(*entry.reversalOf) : json(nullptr);
    j["closing"] = entry.closing;
    j["lines"] = json::array();
    for (const auto& line : entry.lines) {
        j["lines"].push_back(toJson(line));
    }
    return j;
}

inline json toJson(const domain::AccountBalance& balance) {
    json j;
    j["account_code"] = balance.accountCode;
    j["as_of"] = balance.asOf;
    j["balance"] = balance.balance.minor;
    j["own_balance"] = balance.ownBalance.minor;
    j["normal_side"] = domain::toString(balance.normalSide);
    return j;
}

inline json toJson(const domain::TrialBalance& report) {
    json j;
    j["period_id"] = report.periodId;
    j["rows"] = json::array();
    for (const auto& row : report.rows) {
        json r;
        r["account_code"] = row.accountCode;
        r["account_name"] = row.accountName;
        r["account_type"] = domain::toString(row.accountType);
        r["period_debit"] = row.periodDebit.minor;
        r["period_credit"] = row.periodCredit.minor;
        r["debit"] = row.debit.minor;
        r["credit"] = row.credit.minor;
        j["rows"].push_back(r);
    }
    j["total_debit"] = report.totalDebit.minor;
    j["total_credit"] = report.totalCredit.minor;
    j["total_period_debit"] = report.totalPeriodDebit.minor;
    j["total_period_credit"] = report.totalPeriodCredit.minor;
    j["is_balanced"] = report.isBalanced();
    return j;
}

inline json toJson(const ports::input::ClosingResult& result) {
    json j;
    j["fiscal_year_id"] = result.fiscalYearId;
    j["retained_earnings_account"] = result.retainedEarningsAccount;
    j["closing_entry_ids"] = result.closingEntryIds;
    j["net_income"] = result.netIncome.minor;
    j["archived_entries"] = result.archivedEntries;
    return j;
}

// ============================================
// Разбор входящих полей
// ============================================

inline std::string requireString(const json& body, const char* field) {
    if (!body.contains(field) || !body[field].is_string() || body[field].get<std::string>().empty()) {
        throw std::invalid_argument(std::string("Field '") + field + "' is required");
    }
    return body[field].get<std::string>();
}

inline std::optional<std::string> optionalString(const json& body, const char* field) {
    if (!body.contains(field) || body[field].is_null()) return std::nullopt;
    if (!body[field].is_string()) {
        throw std::invalid_argument(std::string("Field '") + field + "' must be a string");
    }
    return body[field].get<std::string>();
}

/// Целое число минорных единиц; дробные суммы отклоняются
inline domain::Money amountField(const json& body, const char* field) {
    if (!body.contains(field) || body[field].is_null()) return domain::Money();
    if (!body[field].is_number_integer()) {
        throw std::invalid_argument(std::string("Field '") + field + "' must be an integer amount in minor units");
    }
    return domain::Money(body[field].get<int64_t>());
}

inline std::optional<bool> optionalBool(const json& body, const char* field) {
    if (!body.contains(field) || body[field].is_null()) return std::nullopt;
    if (!body[field].is_boolean()) {
        throw std::invalid_argument(std::string("Field '") + field + "' must be a boolean");
    }
    return body[field].get<bool>();
}

inline json parseBody(const std::string& raw) {
    auto body = json::parse(raw);
    if (!body.is_object()) {
        throw std::invalid_argument("Request body must be a JSON object");
    }
    return body;
}

/// Без account_code строка получит счёт журнала по умолчанию
inline ports::input::LineRequest parseLine(const json& body) {
    ports::input::LineRequest line;
    line.accountCode = optionalString(body, "account_code").value_or("");
    line.debit = amountField(body, "debit");
    line.credit = amountField(body, "credit");
    line.analyticAccount = optionalString(body, "analytic_account");
    line.description = optionalString(body, "description").value_or("");
    return line;
}

inline ports::input::NewEntryRequest parseNewEntry(const json& body) {
    ports::input::NewEntryRequest request;
    request.journalCode = optionalString(body, "journal_code");
    request.date = domain::Date::parse(requireString(body, "date"));
    request.reference = optionalString(body, "reference").value_or("");
    request.description = optionalString(body, "description").value_or("");
    request.createdBy = optionalString(body, "created_by").value_or("");
    if (body.contains("lines")) {
        if (!body["lines"].is_array()) {
            throw std::invalid_argument("Field 'lines' must be an array");
        }
        for (const auto& line : body["lines"]) {
            request.lines.push_back(parseLine(line));
        }
    }
    return request;
}

inline ports::input::CreateAccountRequest parseCreateAccount(const json& body) {
    ports::input::CreateAccountRequest request;
    request.code = requireString(body, "code");
    request.name = requireString(body, "name");
    request.type = domain::parseAccountType(requireString(body, "type"));
    request.parentCode = optionalString(body, "parent_code");
    request.description = optionalString(body, "description").value_or("");
    request.allowNegative = optionalBool(body, "allow_negative").value_or(true);
    request.allowPosting = optionalBool(body, "allow_posting").value_or(true);
    request.isAnalytic = optionalBool(body, "is_analytic").value_or(false);
    request.openingBalance = amountField(body, "opening_balance");
    return request;
}

inline ports::input::CreateJournalRequest parseCreateJournal(const json& body) {
    ports::input::CreateJournalRequest request;
    request.code = requireString(body, "code");
    request.name = requireString(body, "name");
    request.type = domain::parseJournalType(optionalString(body, "type").value_or("general"));
    request.description = optionalString(body, "description").value_or("");
    request.isDefault = optionalBool(body, "is_default").value_or(false);
    request.defaultDebitAccount = optionalString(body, "default_debit_account");
    request.defaultCreditAccount = optionalString(body, "default_credit_account");
    return request;
}

inline ports::input::CreateFiscalYearRequest parseCreateFiscalYear(const json& body) {
    ports::input::CreateFiscalYearRequest request;
    request.name = optionalString(body, "name").value_or("");
    request.startDate = domain::Date::parse(requireString(body, "start_date"));
    request.endDate = domain::Date::parse(requireString(body, "end_date"));
    if (body.contains("periods")) {
        if (!body["periods"].is_array()) {
            throw std::invalid_argument("Field 'periods' must be an array");
        }
        for (const auto& period : body["periods"]) {
            request.periods.push_back({
                domain::Date::parse(requireString(period, "start_date")),
                domain::Date::parse(requireString(period, "end_date"))
            });
        }
    }
    return request;
}

// ============================================
// HTTP ответы
// ============================================

inline int httpStatusOf(const domain::LedgerException& e) {
    switch (e.category()) {
        case domain::ErrorCategory::NOT_FOUND:   return 404;
        case domain::ErrorCategory::STATE:       return 409;
        case domain::ErrorCategory::CONCURRENCY: return 503;
        case domain::ErrorCategory::INTEGRITY:   return 500;
        case domain::ErrorCategory::VALIDATION:
        default:
            return (e.code() == domain::LedgerErrorCode::UNBALANCED ||
                    e.code() == domain::LedgerErrorCode::NEGATIVE_BALANCE) ? 422 : 400;
    }
}

inline void sendJson(IResponse& res, int status, const json& body) {
    res.setStatus(status);
    res.setHeader("Content-Type", "application/json");
    res.setBody(body.dump());
}

inline void sendError(IResponse& res, int status, const std::string& message,
                      const std::string& code = "") {
    json body;
    body["error"] = message;
    if (!code.empty()) {
        body["code"] = code;
    }
    sendJson(res, status, body);
}

/// Путь без query string
inline std::string pathOf(const std::string& fullPath) {
    auto pos = fullPath.find('?');
    return pos == std::string::npos ? fullPath : fullPath.substr(0, pos);
}

inline std::optional<std::string> param(const std::map<std::string, std::string>& params, const char* name) {
    auto it = params.find(name);
    if (it == params.end() || it->second.empty()) return std::nullopt;
    return it->second;
}

} // namespace mapper

} // namespace ledger::adapters::primary
