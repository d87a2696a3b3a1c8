#pragma once

#include <ThreadSafeMap.hpp>
#include <shared_mutex>
#include <mutex>
#include <string>
#include <vector>
#include <algorithm>
#include <memory>

namespace ledger::application {

/**
 * @brief Блокировки периодов: проведение против закрытия
 *
 * Для каждого периода свой shared_mutex:
 * - post держит его разделяемо на время проверки открытости и коммита
 * - closePeriod / lockPeriod / closeFiscalYear берут его эксклюзивно,
 *   поэтому дожидаются уже идущих проведений, а новые ждут закрытия
 *   и после него получают PERIOD_CLOSED.
 *
 * Блокировки внутрипроцессные: один экземпляр сервиса на базу.
 */
class PeriodGate {
public:
    using SharedAccess = std::shared_lock<std::shared_mutex>;
    using ExclusiveAccess = std::unique_lock<std::shared_mutex>;

    SharedAccess shared(const std::string& periodId) {
        return SharedAccess(*locks_.findOrCreate(periodId));
    }

    ExclusiveAccess exclusive(const std::string& periodId) {
        return ExclusiveAccess(*locks_.findOrCreate(periodId));
    }

    /**
     * @brief Эксклюзивно захватить несколько периодов
     *
     * Захват в порядке id, чтобы два закрытия не взаимоблокировались.
     */
    std::vector<ExclusiveAccess> exclusiveAll(std::vector<std::string> periodIds) {
        std::sort(periodIds.begin(), periodIds.end());
        periodIds.erase(std::unique(periodIds.begin(), periodIds.end()), periodIds.end());

        std::vector<ExclusiveAccess> held;
        held.reserve(periodIds.size());
        for (const auto& id : periodIds) {
            held.push_back(exclusive(id));
        }
        return held;
    }

private:
    ThreadSafeMap<std::string, std::shared_mutex> locks_;
};

} // namespace ledger::application
